// frontend/src/qir/qir_passes.cpp
#include <quill/qir/Passes.hpp>

#include <string>
#include <vector>

namespace quill::qir {

    namespace {

        /// @brief 컴파일 타임에만 존재하는 문자열 상태.
        struct CompileTimeState {
            std::string current{};
        };

        /// @brief 마지막 print 뒤에 남은 emit에 대해 경고를 남긴다.
        void report_dead_emits_(const std::vector<const ast::Statement*>& dead, diag::Bag* diags) {
            if (!diags) return;
            for (const auto* st : dead) {
                diag::Diagnostic d(diag::Severity::kWarning, diag::Code::kDeadTrailingEmit, st->span);
                d.add_arg_int(static_cast<int>(st->source_line));
                diags->add(std::move(d));
            }
        }

    } // namespace

    BuildResult build_optimized_module(
        const ast::Program& program,
        const OptimizeOptions& opt,
        diag::Bag* diags
    ) {
        using syntax::StmtKind;

        BuildResult out{};
        Module mod{};
        mod.optimized = true;

        CompileTimeState state{};

        // 아직 어떤 print에도 소비되지 않은 emit들.
        // 다음 print를 만나면 folded로, 끝까지 남으면 dead로 집계한다.
        std::vector<const ast::Statement*> pending_emits;

        for (const auto& st : program) {
            switch (st.kind) {
                case StmtKind::kComment:
                    ++mod.opt_stats.comments_skipped;
                    break;

                case StmtKind::kEmit:
                    state.current += st.payload;
                    pending_emits.push_back(&st);
                    break;

                case StmtKind::kPrint:
                    // 현재 값의 스냅샷(복사)을 굳힌다.
                    mod.add_inst(Inst{InstPrintLiteral{state.current}, st.source_line});
                    mod.opt_stats.emits_folded += static_cast<uint32_t>(pending_emits.size());
                    pending_emits.clear();
                    break;

                case StmtKind::kInvalid:
                    out.ok = false;
                    out.error = InvalidStatementError{st.source_line, st.span};
                    return out;
            }
        }

        mod.opt_stats.dead_emits_eliminated = static_cast<uint32_t>(pending_emits.size());
        if (opt.warn_dead_emit) report_dead_emits_(pending_emits, diags);

        out.ok = true;
        out.mod = std::move(mod);
        return out;
    }

} // namespace quill::qir
