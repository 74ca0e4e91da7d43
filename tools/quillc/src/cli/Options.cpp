// tools/quillc/src/cli/Options.cpp
#include <quillc/cli/Options.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace quillc::cli {

    namespace {

        /// @brief 모드 단어를 Mode로 바꾼다.
        std::optional<Mode> parse_mode_word(std::string_view w) {
            if (w == "interpret") return Mode::kInterpret;
            if (w == "compile") return Mode::kCompile;
            if (w == "compile-optimized") return Mode::kCompileOptimized;
            if (w == "jit") return Mode::kJit;
            if (w == "run") return Mode::kRun;
            return std::nullopt;
        }

        std::optional<quill::backend::EmitKind> parse_emit(std::string_view v) {
            using quill::backend::EmitKind;
            if (v == "qir") return EmitKind::kQir;
            if (v == "llvm-ir") return EmitKind::kLlvmIr;
            if (v == "object" || v == "obj") return EmitKind::kObject;
            return std::nullopt;
        }

        /// @brief 값이 필요한 플래그의 다음 인자를 꺼낸다.
        bool take_value(
            const std::vector<std::string_view>& args,
            size_t& i,
            std::string_view flag,
            std::string_view& out,
            Options& opt
        ) {
            if (i + 1 >= args.size()) {
                opt.ok = false;
                opt.error = std::string(flag) + " requires a value";
                return false;
            }
            out = args[++i];
            return true;
        }

        bool fail(Options& opt, std::string msg) {
            opt.ok = false;
            opt.error = std::move(msg);
            return false;
        }

        /// @brief 플래그 하나를 처리한다. 위치 인자면 false를 돌려 호출자가 처리하게 한다.
        bool parse_flag(const std::vector<std::string_view>& args, size_t& i, Options& opt, bool& handled) {
            const std::string_view a = args[i];
            handled = true;
            std::string_view v{};

            if (a == "-o") {
                if (!take_value(args, i, a, v, opt)) return false;
                opt.output_path = std::string(v);
                return true;
            }

            if (a == "--lang") {
                if (!take_value(args, i, a, v, opt)) return false;
                if (v == "ko") opt.lang = quill::diag::Language::kKo;
                else if (v == "en") opt.lang = quill::diag::Language::kEn;
                else return fail(opt, "--lang expects en|ko, got '" + std::string(v) + "'");
                return true;
            }

            if (a == "--context") {
                if (!take_value(args, i, a, v, opt)) return false;
                try {
                    int n = std::stoi(std::string(v));
                    if (n < 0) {
                        opt.warnings.push_back("--context must be >= 0, using 0");
                        n = 0;
                    }
                    opt.context_lines = static_cast<uint32_t>(n);
                } catch (const std::exception&) {
                    return fail(opt, "--context expects an integer, got '" + std::string(v) + "'");
                }
                return true;
            }

            if (a == "--newline") {
                if (!take_value(args, i, a, v, opt)) return false;
                quill::text::NewlineMode m{};
                if (!quill::text::parse_newline_mode(v, m)) {
                    return fail(opt, "--newline expects crlf|lf|universal, got '" + std::string(v) + "'");
                }
                opt.newline = m;
                return true;
            }

            if (a == "--emit") {
                if (!take_value(args, i, a, v, opt)) return false;
                auto k = parse_emit(v);
                if (!k) return fail(opt, "--emit expects qir|llvm-ir|object, got '" + std::string(v) + "'");
                opt.emit = *k;
                return true;
            }

            if (a == "--dump") {
                if (!take_value(args, i, a, v, opt)) return false;
                if (v == "stmts") opt.dump = DumpKind::kStmts;
                else if (v == "qir") opt.dump = DumpKind::kQir;
                else return fail(opt, "--dump expects stmts|qir, got '" + std::string(v) + "'");
                return true;
            }

            if (a == "--target") {
                if (!take_value(args, i, a, v, opt)) return false;
                opt.target_triple = std::string(v);
                return true;
            }

            if (a == "--cpu") {
                if (!take_value(args, i, a, v, opt)) return false;
                opt.cpu = std::string(v);
                return true;
            }

            if (a == "--config") {
                if (!take_value(args, i, a, v, opt)) return false;
                opt.config_path = std::string(v);
                return true;
            }

            if (a == "--no-config") {
                opt.no_config = true;
                return true;
            }

            if (a == "-Wdead-emit") {
                opt.warn_dead_emit = true;
                return true;
            }

            if (a == "-Wno-dead-emit") {
                opt.warn_dead_emit = false;
                return true;
            }

            if (a == "-v" || a == "--verbose") {
                opt.verbose = true;
                return true;
            }

            if (a.size() == 3 && a[0] == '-' && a[1] == 'O') {
                if (a[2] < '0' || a[2] > '3') {
                    return fail(opt, "unsupported optimization level '" + std::string(a) + "' (expected -O0..-O3)");
                }
                opt.opt_level = static_cast<uint8_t>(a[2] - '0');
                return true;
            }

            if (a.size() > 1 && a[0] == '-') {
                return fail(opt, "unknown option '" + std::string(a) + "'");
            }

            handled = false;
            return true;
        }

    } // namespace

    void print_usage(std::ostream& os) {
        os
            << "quillc\n"
            << "  --version\n"
            << "  interpret <src.qs>\n"
            << "  jit <src.qs>\n"
            << "  compile <src.qs> -o <out>\n"
            << "  compile-optimized <src.qs> -o <out>\n"
            << "  run <program.qir>\n"
            << "\n"
            << "Options:\n"
            << "  --newline crlf|lf|universal   (line splitting rule, default universal)\n"
            << "  --lang en|ko\n"
            << "  --context N\n"
            << "  --emit qir|llvm-ir|object     (compile output format, default qir)\n"
            << "  --dump stmts|qir\n"
            << "  -Wdead-emit                   (warn on emits after the last print)\n"
            << "  --target <triple> --cpu <name> -O0..-O3\n"
            << "  --config <path> | --no-config\n"
            << "  -v                            (verbose)\n";
    }

    Options parse_options(int argc, char** argv) {
        Options opt{};

        if (argc <= 1) {
            opt.mode = Mode::kUsage;
            return opt;
        }

        std::vector<std::string_view> args;
        args.reserve(static_cast<size_t>(argc - 1));
        for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

        for (auto a : args) {
            if (a == "--version") {
                opt.mode = Mode::kVersion;
                return opt;
            }
            if (a == "-h" || a == "--help") {
                opt.mode = Mode::kUsage;
                return opt;
            }
        }

        std::vector<std::string_view> positional;
        for (size_t i = 0; i < args.size(); ++i) {
            bool handled = false;
            if (!parse_flag(args, i, opt, handled)) return opt;
            if (!handled) positional.push_back(args[i]);
        }

        if (positional.empty()) {
            opt.ok = false;
            opt.error = "missing mode (interpret|compile|compile-optimized|jit|run)";
            return opt;
        }

        auto mode = parse_mode_word(positional[0]);
        if (!mode) {
            opt.ok = false;
            opt.error = "unknown mode '" + std::string(positional[0]) + "'";
            return opt;
        }
        opt.mode = *mode;

        if (positional.size() < 2) {
            opt.ok = false;
            opt.error = std::string(mode_name(opt.mode)) + " requires an input path";
            return opt;
        }
        if (positional.size() > 2) {
            opt.ok = false;
            opt.error = "unexpected argument '" + std::string(positional[2]) + "'";
            return opt;
        }
        opt.input_path = std::string(positional[1]);

        const bool compiles = opt.mode == Mode::kCompile || opt.mode == Mode::kCompileOptimized;
        if (compiles && opt.output_path.empty()) {
            opt.ok = false;
            opt.error = std::string(mode_name(opt.mode)) + " requires -o <out>";
            return opt;
        }
        if (!compiles && !opt.output_path.empty()) {
            opt.warnings.push_back("-o is ignored in " + std::string(mode_name(opt.mode)) + " mode");
            opt.output_path.clear();
        }
        if (!compiles && opt.emit.has_value()) {
            opt.warnings.push_back("--emit is ignored in " + std::string(mode_name(opt.mode)) + " mode");
        }

        return opt;
    }

    const char* mode_name(Mode mode) {
        switch (mode) {
            case Mode::kUsage: return "usage";
            case Mode::kVersion: return "version";
            case Mode::kInterpret: return "interpret";
            case Mode::kCompile: return "compile";
            case Mode::kCompileOptimized: return "compile-optimized";
            case Mode::kJit: return "jit";
            case Mode::kRun: return "run";
        }
        return "unknown";
    }

} // namespace quillc::cli
