// tools/quillc/src/driver/Driver.cpp
#include <quillc/driver/Driver.hpp>

#include <quillc/config/Config.hpp>
#include <quillc/dump/Dump.hpp>

#include <quill/backend/Backend.hpp>
#include <quill/backend/exec/Executor.hpp>
#include <quill/diag/Render.hpp>
#include <quill/lex/Lexer.hpp>
#include <quill/os/File.hpp>
#include <quill/qir/Passes.hpp>
#include <quill/qir/Text.hpp>
#include <quill/qir/Verify.hpp>
#include <quill/text/SourceManager.hpp>

#include <cstdlib>
#include <initializer_list>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quillc::driver {

    namespace {

        /// @brief config + CLI를 합친 최종 실행 설정.
        struct Settings {
            quill::diag::Language lang = quill::diag::Language::kEn;
            uint32_t context_lines = 2;
            quill::text::NewlineMode newline = quill::text::NewlineMode::kUniversal;
            quill::backend::CompileOptions copt{};
        };

        /// @brief "auto" 언어는 로캘 환경 변수로 정한다.
        quill::diag::Language resolve_lang_(std::string_view name) {
            if (name == "ko") return quill::diag::Language::kKo;
            if (name == "en") return quill::diag::Language::kEn;

            for (const char* key : {"LC_ALL", "LC_MESSAGES", "LANG"}) {
                const char* v = std::getenv(key);
                if (v == nullptr || *v == '\0') continue;
                return (std::string_view(v).substr(0, 2) == "ko")
                    ? quill::diag::Language::kKo
                    : quill::diag::Language::kEn;
            }
            return quill::diag::Language::kEn;
        }

        quill::backend::EmitKind emit_kind_from_config_(std::string_view v) {
            if (v == "llvm-ir") return quill::backend::EmitKind::kLlvmIr;
            if (v == "object") return quill::backend::EmitKind::kObject;
            return quill::backend::EmitKind::kQir;
        }

        /// @brief 설정 파일/환경 변수를 읽고 CLI 값을 그 위에 덮는다.
        Settings resolve_settings_(const cli::Options& opt, std::ostream& err) {
            config::EffectiveSettings cfg{};
            if (!opt.no_config) {
                std::optional<std::filesystem::path> anchor{};
                if (!opt.input_path.empty()) anchor = std::filesystem::path(opt.input_path).parent_path();
                if (anchor && anchor->empty()) anchor.reset();

                std::optional<std::filesystem::path> explicit_cfg{};
                if (opt.config_path) explicit_cfg = std::filesystem::path(*opt.config_path);

                const auto loaded = config::load(anchor, explicit_cfg);
                std::vector<std::string> warnings = loaded.warnings;
                cfg = config::materialize(loaded, &warnings);
                for (const auto& w : warnings) err << "warning: config: " << w << "\n";

                if (opt.verbose) {
                    err << "info: global config: " << loaded.paths.global_config.string() << "\n";
                    if (!loaded.paths.project_config.empty()) {
                        err << "info: project config: " << loaded.paths.project_config.string() << "\n";
                    }
                    for (const auto& [k, v] : loaded.effective_values) {
                        err << "info: config " << k << " = " << config::render_value_text(v) << "\n";
                    }
                }
            }

            Settings s{};
            s.lang = opt.lang.value_or(resolve_lang_(cfg.diag_lang));
            s.context_lines = opt.context_lines.value_or(static_cast<uint32_t>(cfg.diag_context));

            quill::text::NewlineMode nm{};
            if (!quill::text::parse_newline_mode(cfg.source_newline, nm)) nm = quill::text::NewlineMode::kUniversal;
            s.newline = opt.newline.value_or(nm);

            auto& c = s.copt;
            c.optimize = opt.mode == cli::Mode::kCompileOptimized ||
                         (opt.mode == cli::Mode::kJit && cfg.jit_optimize);
            c.warn_dead_emit = opt.warn_dead_emit.value_or(cfg.warn_dead_emit);
            c.emit = opt.emit.value_or(emit_kind_from_config_(cfg.compile_emit));
            c.opt_level = opt.opt_level.value_or(static_cast<uint8_t>(cfg.llvm_opt_level));
            c.target_triple = opt.target_triple.value_or(cfg.llvm_target_triple);
            c.cpu = opt.cpu.value_or(cfg.llvm_cpu);
            return s;
        }

        void render_diag_(
            const quill::diag::Diagnostic& d,
            const Settings& s,
            const quill::SourceManager& sm,
            std::ostream& err
        ) {
            if (s.context_lines == 0) {
                err << quill::diag::render_one(d, s.lang, sm) << "\n";
            } else {
                err << quill::diag::render_one_context(d, s.lang, sm, s.context_lines) << "\n";
            }
        }

        /// @brief 진단을 모두 출력하고 에러가 있었는지 반환한다.
        bool flush_diags_(
            const quill::diag::Bag& bag,
            const Settings& s,
            const quill::SourceManager& sm,
            std::ostream& err
        ) {
            for (const auto& d : bag.diags()) render_diag_(d, s, sm, err);
            return bag.has_error();
        }

        /// @brief 저장된 QIR 프로그램을 읽어 실행한다 (AOT의 "나중 실행" 단계).
        int run_qir_(
            const std::string& name,
            std::string content,
            const cli::Options& opt,
            const Settings& s,
            std::ostream& out,
            std::ostream& err
        ) {
            quill::SourceManager sm;
            const uint32_t file_id = sm.add(name, std::move(content));

            quill::diag::Bag bag;
            auto parsed = quill::qir::parse_text(sm.content(file_id), file_id, &bag);
            if (flush_diags_(bag, s, sm, err) || !parsed.ok) return 1;

            const auto verrs = quill::qir::verify(
                parsed.mod,
                parsed.mod.optimized ? quill::qir::VerifyMode::kOptimized : quill::qir::VerifyMode::kAny
            );
            if (!verrs.empty()) {
                for (const auto& e : verrs) err << "error: QIR verify failed: " << e.msg << "\n";
                return 1;
            }

            if (opt.dump == cli::DumpKind::kQir) dump::dump_qir_module(parsed.mod, err);

            quill::backend::io::StreamOutputChannel chan(out);
            const auto r = quill::backend::exec::execute(parsed.mod, chan);
            return r.ok ? 0 : 1;
        }

        quill::backend::BackendKind backend_for_(cli::Mode mode) {
            switch (mode) {
                case cli::Mode::kCompile:
                case cli::Mode::kCompileOptimized:
                    return quill::backend::BackendKind::kAot;
                case cli::Mode::kJit:
                    return quill::backend::BackendKind::kJit;
                default:
                    return quill::backend::BackendKind::kInterp;
            }
        }

        /// @brief 소스 파일을 분류하고 선택된 백엔드를 돌린다.
        int run_source_(
            const std::string& name,
            std::string content,
            const cli::Options& opt,
            const Settings& s,
            std::ostream& out,
            std::ostream& err
        ) {
            quill::SourceManager sm;
            const uint32_t file_id = sm.add(name, std::move(content), s.newline);

            // invalid 줄의 에러는 백엔드가 실패 지점을 정한 뒤에 출력한다.
            quill::diag::Bag lex_bag;
            quill::Lexer lex(sm.content(file_id), file_id, s.newline, &lex_bag);
            const quill::ast::Program program = lex.classify_all();
            for (const auto& d : lex_bag.diags()) {
                if (d.severity() == quill::diag::Severity::kWarning) render_diag_(d, s, sm, err);
            }

            if (opt.dump == cli::DumpKind::kStmts) dump::dump_program(program, err);
            if (opt.dump == cli::DumpKind::kQir) {
                auto built = s.copt.optimize
                    ? quill::qir::build_optimized_module(program)
                    : quill::qir::build_module(program);
                if (built.ok) dump::dump_qir_module(built.mod, err);
                else err << "\nQIR: skipped because the program contains an invalid statement.\n";
            }

            const auto kind = backend_for_(opt.mode);
            auto backend = quill::backend::make_backend(kind);

            quill::backend::io::StreamOutputChannel chan(out);
            quill::backend::io::FileSink sink(opt.output_path);
            quill::diag::Bag backend_bag;

            quill::backend::RunContext ctx{};
            ctx.output = &chan;
            ctx.sink = (kind == quill::backend::BackendKind::kAot) ? &sink : nullptr;
            ctx.diags = &backend_bag;

            const auto r = backend->run(program, ctx, s.copt);
            flush_diags_(backend_bag, s, sm, err);

            if (!r.ok) {
                if (r.invalid) {
                    quill::diag::Diagnostic d(
                        quill::diag::Severity::kError,
                        quill::diag::Code::kInvalidStatement,
                        r.invalid->span
                    );
                    d.add_arg_int(static_cast<int>(r.invalid->source_line));
                    render_diag_(d, s, sm, err);
                    err << "error: " << cli::mode_name(opt.mode) << " failed at line "
                        << r.invalid->source_line << "\n";
                    return 1;
                }
                for (const auto& m : r.messages) {
                    if (m.is_error) err << "error: " << m.text << "\n";
                }
                return 1;
            }

            if (opt.verbose) {
                for (const auto& m : r.messages) err << "info: " << m.text << "\n";
                err << "info: " << quill::backend::backend_kind_name(kind)
                    << " finished, " << r.outputs_emitted << " output(s)\n";
            }
            return 0;
        }

    } // namespace

    int run(const cli::Options& opt, std::ostream& out, std::ostream& err) {
        switch (opt.mode) {
            case cli::Mode::kUsage:
            case cli::Mode::kVersion:
                return 0;
            default:
                break;
        }

        for (const auto& w : opt.warnings) err << "warning: " << w << "\n";

        const Settings s = resolve_settings_(opt, err);

        std::string content;
        std::string io_err;
        if (!quill::open_file(opt.input_path, content, io_err)) {
            err << "error: " << io_err << "\n";
            return 1;
        }
        const std::string name = quill::normalize_path(opt.input_path);

        if (opt.mode == cli::Mode::kRun) {
            return run_qir_(name, std::move(content), opt, s, out, err);
        }
        return run_source_(name, std::move(content), opt, s, out, err);
    }

    int run(const cli::Options& opt) {
        return run(opt, std::cout, std::cerr);
    }

} // namespace quillc::driver
