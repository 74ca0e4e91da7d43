#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace quillc::config {

using Value = std::variant<std::string, int64_t, bool>;
using FlatMap = std::map<std::string, Value>;

struct Paths {
    std::filesystem::path global_config{};
    std::filesystem::path project_config{};
    std::optional<std::filesystem::path> project_root{};
};

struct LoadedConfig {
    Paths paths{};
    FlatMap global_values{};
    FlatMap project_values{};
    FlatMap effective_values{};
    std::vector<std::string> warnings{};
};

struct EffectiveSettings {
    std::string diag_lang = "auto";
    int64_t diag_context = 2;

    std::string source_newline = "universal";

    bool jit_optimize = false;
    std::string compile_emit = "qir";
    bool warn_dead_emit = false;

    std::string llvm_target_triple{};
    std::string llvm_cpu{};
    int64_t llvm_opt_level = 0;
};

std::optional<std::filesystem::path> find_project_root(std::filesystem::path start);
Paths resolve_paths(const std::optional<std::filesystem::path>& anchor);

/// explicit_config가 있으면 project 계층 파일 대신 그 파일을 읽는다.
LoadedConfig load(const std::optional<std::filesystem::path>& anchor,
                  const std::optional<std::filesystem::path>& explicit_config = std::nullopt);
EffectiveSettings materialize(const LoadedConfig& cfg, std::vector<std::string>* warnings = nullptr);

bool is_known_key(std::string_view key);

std::string render_value_text(const Value& v);

} // namespace quillc::config
