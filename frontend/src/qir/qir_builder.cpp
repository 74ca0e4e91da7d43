// frontend/src/qir/qir_builder.cpp
#include <quill/qir/Builder.hpp>


namespace quill::qir {

    BuildResult build_module(const ast::Program& program) {
        using syntax::StmtKind;

        BuildResult out{};
        Module mod{};
        mod.insts.reserve(program.size());

        for (const auto& st : program) {
            switch (st.kind) {
                case StmtKind::kComment:
                    ++mod.opt_stats.comments_skipped;
                    break;

                case StmtKind::kEmit:
                    mod.add_inst(Inst{InstAppendLiteral{st.payload}, st.source_line});
                    break;

                case StmtKind::kPrint:
                    mod.add_inst(Inst{InstPrintCurrent{}, st.source_line});
                    break;

                case StmtKind::kInvalid:
                    // 지금까지 만든 명령은 모두 버린다.
                    out.ok = false;
                    out.error = InvalidStatementError{st.source_line, st.span};
                    return out;
            }
        }

        out.ok = true;
        out.mod = std::move(mod);
        return out;
    }

} // namespace quill::qir
