#include <quillc/config/Config.hpp>
#include <quillc/config/TomlLite.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include <cstdio>
#include <cstdlib>

namespace {

std::pair<int, std::string> run_capture(const std::string& command) {
    const std::string tmp = "/tmp/quill_config_capture.txt";
    const std::string full = command + " > " + tmp + " 2>&1";
    const int rc = std::system(full.c_str());

    std::ifstream ifs(tmp, std::ios::binary);
    std::string out;
    if (ifs) {
        out.assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    }
    std::remove(tmp.c_str());
    return {rc, out};
}

bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

bool contains_any(const std::vector<std::string>& v, const std::string& needle) {
    for (const auto& s : v) {
        if (contains(s, needle)) return true;
    }
    return false;
}

bool write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) return false;
    ofs << text;
    return ofs.good();
}

std::filesystem::path fresh_root(const char* name) {
    std::error_code ec{};
    const auto root = std::filesystem::temp_directory_path(ec) / name;
    std::filesystem::remove_all(root, ec);
    std::filesystem::create_directories(root / "xdg", ec);
    return root;
}

bool test_toml_lite_values() {
    using namespace quillc::config;
    FlatMap out{};
    std::vector<std::string> warnings{};
    std::string err{};

    const bool ok = toml_lite::parse_text(
        "# top comment\n"
        "[diag]\n"
        "lang = \"ko\"   # trailing\n"
        "context = 4\n"
        "\n"
        "[jit]\n"
        "optimize = true\n"
        "[llvm]\n"
        "cpu = \"x\\ty\"\n"
        "cpu = \"generic\"\n",
        "mem.toml", out, warnings, err);
    if (!ok) {
        std::cerr << "toml parse failed: " << err << "\n";
        return false;
    }

    const auto* lang = std::get_if<std::string>(&out["diag.lang"]);
    const auto* ctx = std::get_if<int64_t>(&out["diag.context"]);
    const auto* jit = std::get_if<bool>(&out["jit.optimize"]);
    const auto* cpu = std::get_if<std::string>(&out["llvm.cpu"]);
    if (lang == nullptr || *lang != "ko") return false;
    if (ctx == nullptr || *ctx != 4) return false;
    if (jit == nullptr || !*jit) return false;
    if (cpu == nullptr || *cpu != "generic") return false;
    if (!contains_any(warnings, "duplicate key 'llvm.cpu'")) {
        std::cerr << "duplicate key must warn\n";
        return false;
    }
    return true;
}

bool test_toml_lite_errors() {
    using namespace quillc::config;
    FlatMap out{};
    std::vector<std::string> warnings{};
    std::string err{};

    if (toml_lite::parse_text("[diag\nlang = \"en\"\n", "a.toml", out, warnings, err)) return false;
    if (!contains(err, "a.toml:1")) {
        std::cerr << "error must carry source and line: " << err << "\n";
        return false;
    }
    if (toml_lite::parse_text("lang \"en\"\n", "b.toml", out, warnings, err)) return false;
    if (toml_lite::parse_text("k = [1, 2]\n", "c.toml", out, warnings, err)) return false;
    if (toml_lite::parse_text("k = \"bad\\q\"\n", "d.toml", out, warnings, err)) return false;
    if (toml_lite::parse_text("k = 1.5\n", "e.toml", out, warnings, err)) return false;
    if (toml_lite::parse_text("[a.b]\nk = 1\n", "f.toml", out, warnings, err)) return false;
    if (toml_lite::parse_text("Key = 1\n", "g.toml", out, warnings, err)) return false;
    if (!toml_lite::parse_text("k = -3\n", "h.toml", out, warnings, err)) return false;
    const auto* neg = std::get_if<int64_t>(&out["k"]);
    if (neg == nullptr || *neg != -3) return false;
    return true;
}

bool test_materialize_types_and_choices() {
    using namespace quillc::config;
    LoadedConfig cfg{};
    cfg.effective_values["diag.lang"] = std::string("FR");
    cfg.effective_values["diag.context"] = std::string("three");
    cfg.effective_values["source.newline"] = std::string("LF");
    cfg.effective_values["compile.emit"] = std::string("llvm-ir");
    cfg.effective_values["warn.dead_emit"] = true;
    cfg.effective_values["llvm.opt_level"] = int64_t{9};

    std::vector<std::string> warnings{};
    const auto s = materialize(cfg, &warnings);

    if (s.diag_lang != "auto") return false;
    if (s.diag_context != 2) return false;
    if (s.source_newline != "lf") return false;
    if (s.compile_emit != "llvm-ir") return false;
    if (!s.warn_dead_emit) return false;
    if (s.llvm_opt_level != 3) return false;
    if (s.jit_optimize) return false;
    if (!contains_any(warnings, "diag.lang") || !contains_any(warnings, "expected int")) {
        std::cerr << "unsupported value and wrong type must warn\n";
        return false;
    }
    return true;
}

bool test_known_keys() {
    using namespace quillc::config;
    return is_known_key("diag.lang") &&
           is_known_key("jit.optimize") &&
           is_known_key("llvm.opt_level") &&
           !is_known_key("compile.optimize") &&
           !is_known_key("diag");
}

bool test_project_layer_overrides_global() {
    using namespace quillc::config;
    const auto root = fresh_root("quill-config-layers");
    std::error_code ec{};
    std::filesystem::create_directories(root / "xdg" / "quill", ec);
    std::filesystem::create_directories(root / "proj" / ".quill", ec);
    std::filesystem::create_directories(root / "proj" / "src", ec);
    if (ec) return false;

    if (!write_text(root / "xdg" / "quill" / "config.toml",
                    "[diag]\nlang = \"en\"\ncontext = 5\n[bogus]\nkey = 1\n")) return false;
    if (!write_text(root / "proj" / ".quill" / "config.toml", "[diag]\nlang = \"ko\"\n")) return false;

    setenv("XDG_CONFIG_HOME", (root / "xdg").string().c_str(), 1);
    const auto loaded = load(root / "proj" / "src");
    unsetenv("XDG_CONFIG_HOME");

    if (!loaded.paths.project_root || *loaded.paths.project_root != root / "proj") {
        std::cerr << "project root must be found from a nested directory\n";
        return false;
    }
    if (!contains_any(loaded.warnings, "unknown key 'bogus.key'")) {
        std::cerr << "unknown key must warn\n";
        return false;
    }

    const auto s = materialize(loaded);
    if (s.diag_lang != "ko" || s.diag_context != 5) {
        std::cerr << "project must override global key by key\n";
        return false;
    }

    const auto explicit_cfg = root / "explicit.toml";
    if (!write_text(explicit_cfg, "[diag]\ncontext = 0\n")) return false;
    setenv("XDG_CONFIG_HOME", (root / "xdg").string().c_str(), 1);
    const auto replaced = load(root / "proj" / "src", explicit_cfg);
    unsetenv("XDG_CONFIG_HOME");
    const auto rs = materialize(replaced);
    if (rs.diag_lang != "en" || rs.diag_context != 0) {
        std::cerr << "explicit config must replace the project layer only\n";
        return false;
    }
    return true;
}

bool test_env_overrides_files() {
    using namespace quillc::config;
    LoadedConfig cfg{};
    cfg.effective_values["diag.lang"] = std::string("en");
    cfg.effective_values["source.newline"] = std::string("crlf");

    setenv("QUILL_DIAG_LANG", "ko", 1);
    setenv("QUILL_NEWLINE", "universal", 1);
    setenv("QUILL_DIAG_CONTEXT", "nope", 1);
    std::vector<std::string> warnings{};
    const auto s = materialize(cfg, &warnings);
    unsetenv("QUILL_DIAG_LANG");
    unsetenv("QUILL_NEWLINE");
    unsetenv("QUILL_DIAG_CONTEXT");

    return s.diag_lang == "ko" &&
           s.source_newline == "universal" &&
           s.diag_context == 2 &&
           contains_any(warnings, "QUILL_DIAG_CONTEXT");
}

bool test_cli_reads_config_file() {
    const std::string bin = QUILLC_BUILD_BIN;
    const auto root = fresh_root("quill-config-cli");
    if (!write_text(root / "main.qs", "x\nprint\ny\n")) return false;
    if (!write_text(root / "q.toml", "[warn]\ndead_emit = true\n[diag]\nlang = \"en\"\n")) return false;

    const std::string env = "XDG_CONFIG_HOME=\"" + (root / "xdg").string() + "\" ";
    auto [rc, out] = run_capture(env + "\"" + bin + "\" compile-optimized \"" + (root / "main.qs").string() +
                                 "\" -o \"" + (root / "out.qir").string() + "\" --config \"" + (root / "q.toml").string() + "\"");
    if (rc != 0 || !contains(out, "DeadTrailingEmit")) {
        std::cerr << "config warn.dead_emit must enable the warning\n" << out;
        return false;
    }

    auto [rc_off, out_off] = run_capture(env + "\"" + bin + "\" compile-optimized \"" + (root / "main.qs").string() +
                                         "\" -o \"" + (root / "out.qir").string() + "\" --config \"" +
                                         (root / "q.toml").string() + "\" -Wno-dead-emit");
    if (rc_off != 0 || contains(out_off, "DeadTrailingEmit")) {
        std::cerr << "CLI flag must override config\n" << out_off;
        return false;
    }

    auto [rc_nc, out_nc] = run_capture(env + "\"" + bin + "\" compile-optimized \"" + (root / "main.qs").string() +
                                       "\" -o \"" + (root / "out.qir").string() + "\" --no-config");
    if (rc_nc != 0 || contains(out_nc, "DeadTrailingEmit")) {
        std::cerr << "--no-config must skip config files\n" << out_nc;
        return false;
    }
    return true;
}

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"toml_lite_values", test_toml_lite_values},
        {"toml_lite_errors", test_toml_lite_errors},
        {"materialize_types_and_choices", test_materialize_types_and_choices},
        {"known_keys", test_known_keys},
        {"project_layer_overrides_global", test_project_layer_overrides_global},
        {"env_overrides_files", test_env_overrides_files},
        {"cli_reads_config_file", test_cli_reads_config_file},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "quill config tests passed\n";
    return 0;
}
