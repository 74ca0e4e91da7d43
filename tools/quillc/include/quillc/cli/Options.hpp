// tools/quillc/include/quillc/cli/Options.hpp
#pragma once

#include <quill/backend/Backend.hpp>
#include <quill/diag/DiagCode.hpp>
#include <quill/text/LineSplit.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>


namespace quillc::cli {

    enum class Mode : uint8_t {
        kUsage,
        kVersion,
        kInterpret,
        kCompile,
        kCompileOptimized,
        kJit,
        kRun,
    };

    enum class DumpKind : uint8_t {
        kNone,
        kStmts,
        kQir,
    };

    /// @brief CLI 옵션. optional 필드는 명시된 경우에만 config 값을 덮어쓴다.
    struct Options {
        Mode mode = Mode::kUsage;

        std::string input_path{};
        std::string output_path{};

        std::optional<quill::diag::Language> lang{};
        std::optional<uint32_t> context_lines{};
        std::optional<quill::text::NewlineMode> newline{};

        std::optional<quill::backend::EmitKind> emit{};
        std::optional<uint8_t> opt_level{};
        std::optional<std::string> target_triple{};
        std::optional<std::string> cpu{};
        std::optional<bool> warn_dead_emit{};

        DumpKind dump = DumpKind::kNone;
        bool verbose = false;

        bool no_config = false;
        std::optional<std::string> config_path{};

        std::vector<std::string> warnings{};

        bool ok = true;
        std::string error{};
    };

    /// @brief `quillc` CLI 사용법을 출력한다.
    void print_usage(std::ostream& os);

    /// @brief CLI 인자를 파싱해 실행 옵션 구조체로 변환한다.
    Options parse_options(int argc, char** argv);

    const char* mode_name(Mode mode);

} // namespace quillc::cli
