#include <quillc/config/Config.hpp>

#include <quillc/config/TomlLite.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <filesystem>
#include <stdexcept>
#include <unordered_set>

namespace quillc::config {

namespace {

std::string getenv_string(const char* key) {
    if (key == nullptr) return {};
    const char* p = std::getenv(key);
    if (p == nullptr) return {};
    return std::string(p);
}

std::filesystem::path home_dir() {
    std::string home = getenv_string("HOME");
#if defined(_WIN32)
    if (home.empty()) {
        home = getenv_string("USERPROFILE");
    }
#endif
    return home.empty() ? std::filesystem::current_path() : std::filesystem::path(home);
}

std::filesystem::path compute_global_config_path() {
    const std::string xdg = getenv_string("XDG_CONFIG_HOME");
    if (!xdg.empty()) {
        return std::filesystem::path(xdg) / "quill" / "config.toml";
    }

#if defined(__APPLE__)
    return home_dir() / "Library" / "Application Support" / "quill" / "config.toml";
#else
    return home_dir() / ".config" / "quill" / "config.toml";
#endif
}

const std::unordered_set<std::string>& known_keys_() {
    static const std::unordered_set<std::string> k{
        "diag.lang",
        "diag.context",

        "source.newline",

        "jit.optimize",

        "compile.emit",

        "warn.dead_emit",

        "llvm.target_triple",
        "llvm.cpu",
        "llvm.opt_level",
    };
    return k;
}

template <typename T>
const T* as_ptr(const Value* v) {
    if (v == nullptr) return nullptr;
    return std::get_if<T>(v);
}

void merge_into(FlatMap& base, const FlatMap& override_map) {
    for (const auto& [k, v] : override_map) {
        base[k] = v;
    }
}

void filter_unknown_keys(FlatMap& values, std::vector<std::string>& warnings, std::string_view source_name) {
    std::vector<std::string> to_erase{};
    for (const auto& [k, _] : values) {
        if (!is_known_key(k)) {
            warnings.push_back(std::string(source_name) + ": unknown key '" + k + "' ignored");
            to_erase.push_back(k);
        }
    }
    for (const auto& k : to_erase) {
        values.erase(k);
    }
}

void apply_env_string(std::string& dst, const char* key) {
    const auto v = getenv_string(key);
    if (!v.empty()) dst = v;
}

void apply_env_int(int64_t& dst, const char* key, std::vector<std::string>* warnings) {
    const auto v = getenv_string(key);
    if (v.empty()) return;
    try {
        dst = std::stoll(v);
    } catch (const std::exception&) {
        if (warnings != nullptr) warnings->push_back(std::string(key) + " is not an integer, ignored");
    }
}

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

/// 허용되지 않는 값이면 경고하고 fallback을 쓴다.
std::string normalize_choice(std::string value,
                             std::initializer_list<std::string_view> allowed,
                             std::string_view fallback,
                             std::string_view key,
                             std::vector<std::string>* warnings) {
    value = lower(std::move(value));
    for (auto a : allowed) {
        if (value == a) return value;
    }
    if (warnings != nullptr) {
        warnings->push_back("config key '" + std::string(key) + "' has unsupported value '" + value +
                            "', using '" + std::string(fallback) + "'");
    }
    return std::string(fallback);
}

} // namespace

bool is_known_key(std::string_view key) {
    return known_keys_().contains(std::string(key));
}

std::optional<std::filesystem::path> find_project_root(std::filesystem::path start) {
    std::error_code ec{};
    if (start.empty()) start = std::filesystem::current_path(ec);
    if (ec) return std::nullopt;

    if (!std::filesystem::exists(start, ec)) return std::nullopt;
    if (!std::filesystem::is_directory(start, ec)) {
        start = start.parent_path();
    }

    for (std::filesystem::path cur = start; !cur.empty(); cur = cur.parent_path()) {
        if (std::filesystem::is_directory(cur / ".quill", ec) ||
            std::filesystem::exists(cur / ".git", ec)) {
            return cur;
        }
        const auto parent = cur.parent_path();
        if (parent == cur) break;
    }
    return std::nullopt;
}

Paths resolve_paths(const std::optional<std::filesystem::path>& anchor) {
    std::filesystem::path start{};
    if (anchor.has_value()) {
        start = *anchor;
    } else {
        std::error_code ec{};
        start = std::filesystem::current_path(ec);
        if (ec) start = ".";
    }

    Paths out{};
    out.global_config = compute_global_config_path();
    out.project_root = find_project_root(start);
    if (out.project_root.has_value()) {
        out.project_config = *out.project_root / ".quill" / "config.toml";
    }
    return out;
}

LoadedConfig load(const std::optional<std::filesystem::path>& anchor,
                  const std::optional<std::filesystem::path>& explicit_config) {
    LoadedConfig out{};
    out.paths = resolve_paths(anchor);
    if (explicit_config.has_value()) {
        out.paths.project_config = *explicit_config;
        std::error_code ec{};
        if (!std::filesystem::exists(*explicit_config, ec)) {
            out.warnings.push_back("config file not found: " + explicit_config->string());
        }
    }

    {
        std::string err{};
        if (!toml_lite::parse_file(out.paths.global_config, out.global_values, out.warnings, err)) {
            out.warnings.push_back("failed to load global config: " + err);
        }
    }
    filter_unknown_keys(out.global_values, out.warnings, out.paths.global_config.string());
    if (!out.paths.project_config.empty()) {
        std::string err{};
        if (!toml_lite::parse_file(out.paths.project_config, out.project_values, out.warnings, err)) {
            out.warnings.push_back("failed to load project config: " + err);
        }
        filter_unknown_keys(out.project_values, out.warnings, out.paths.project_config.string());
    }

    out.effective_values = out.global_values;
    merge_into(out.effective_values, out.project_values);
    return out;
}

EffectiveSettings materialize(const LoadedConfig& cfg, std::vector<std::string>* warnings) {
    EffectiveSettings s{};
    const FlatMap& v = cfg.effective_values;

    auto get_string = [&](std::string_view key, std::string& dst) {
        const auto it = v.find(std::string(key));
        if (it == v.end()) return;
        if (const auto* p = as_ptr<std::string>(&it->second); p != nullptr) {
            dst = *p;
            return;
        }
        if (warnings != nullptr) warnings->push_back("config key '" + std::string(key) + "' has wrong type (expected string)");
    };
    auto get_int = [&](std::string_view key, int64_t& dst) {
        const auto it = v.find(std::string(key));
        if (it == v.end()) return;
        if (const auto* p = as_ptr<int64_t>(&it->second); p != nullptr) {
            dst = *p;
            return;
        }
        if (warnings != nullptr) warnings->push_back("config key '" + std::string(key) + "' has wrong type (expected int)");
    };
    auto get_bool = [&](std::string_view key, bool& dst) {
        const auto it = v.find(std::string(key));
        if (it == v.end()) return;
        if (const auto* p = as_ptr<bool>(&it->second); p != nullptr) {
            dst = *p;
            return;
        }
        if (warnings != nullptr) warnings->push_back("config key '" + std::string(key) + "' has wrong type (expected bool)");
    };

    get_string("diag.lang", s.diag_lang);
    get_int("diag.context", s.diag_context);

    get_string("source.newline", s.source_newline);

    get_bool("jit.optimize", s.jit_optimize);
    get_string("compile.emit", s.compile_emit);
    get_bool("warn.dead_emit", s.warn_dead_emit);

    get_string("llvm.target_triple", s.llvm_target_triple);
    get_string("llvm.cpu", s.llvm_cpu);
    get_int("llvm.opt_level", s.llvm_opt_level);

    apply_env_string(s.diag_lang, "QUILL_DIAG_LANG");
    apply_env_int(s.diag_context, "QUILL_DIAG_CONTEXT", warnings);
    apply_env_string(s.source_newline, "QUILL_NEWLINE");

    s.diag_lang = normalize_choice(s.diag_lang, {"en", "ko", "auto"}, "auto", "diag.lang", warnings);
    s.source_newline = normalize_choice(s.source_newline, {"crlf", "lf", "universal"}, "universal", "source.newline", warnings);
    s.compile_emit = normalize_choice(s.compile_emit, {"qir", "llvm-ir", "object"}, "qir", "compile.emit", warnings);

    if (s.diag_context < 0) s.diag_context = 2;
    if (s.llvm_opt_level < 0) s.llvm_opt_level = 0;
    if (s.llvm_opt_level > 3) s.llvm_opt_level = 3;

    return s;
}

std::string render_value_text(const Value& v) {
    if (const auto* s = std::get_if<std::string>(&v)) return *s;
    if (const auto* i = std::get_if<int64_t>(&v)) return std::to_string(*i);
    if (const auto* b = std::get_if<bool>(&v)) return *b ? "true" : "false";
    return {};
}

} // namespace quillc::config
