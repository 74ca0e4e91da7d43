// tools/quillc/src/dump/Dump.cpp
#include <quillc/dump/Dump.hpp>

#include <quill/qir/Text.hpp>

#include <variant>

namespace quillc::dump {

    void dump_program(const quill::ast::Program& p, std::ostream& os) {
        using quill::syntax::StmtKind;

        os << "\nSTMTS:\n";
        os << "  total=" << p.size()
           << " emit=" << p.count(StmtKind::kEmit)
           << " print=" << p.count(StmtKind::kPrint)
           << " comment=" << p.count(StmtKind::kComment)
           << " invalid=" << p.count(StmtKind::kInvalid)
           << "\n";

        for (const auto& st : p) {
            os << "  L" << st.source_line << " " << quill::syntax::stmt_kind_name(st.kind);
            if (st.kind == StmtKind::kEmit) {
                os << " \"" << quill::qir::escape_literal(st.payload) << "\"";
            }
            os << "  [" << st.span.lo << ", " << st.span.hi << ")\n";
        }
    }

    void dump_qir_module(const quill::qir::Module& m, std::ostream& os) {
        os << "\nQIR:\n";
        os << "  insts=" << m.insts.size()
           << " prints=" << m.count_prints()
           << " optimized=" << (m.optimized ? "true" : "false")
           << "\n";
        os << "  opt_stats:"
           << " emits_folded=" << m.opt_stats.emits_folded
           << " dead_emits_eliminated=" << m.opt_stats.dead_emits_eliminated
           << " comments_skipped=" << m.opt_stats.comments_skipped
           << "\n";

        for (size_t i = 0; i < m.insts.size(); ++i) {
            const auto& inst = m.insts[i];
            os << "    #" << i << " " << quill::qir::opcode_name(inst.data);
            if (const auto* a = std::get_if<quill::qir::InstAppendLiteral>(&inst.data)) {
                os << " \"" << quill::qir::escape_literal(a->text) << "\"";
            } else if (const auto* p = std::get_if<quill::qir::InstPrintLiteral>(&inst.data)) {
                os << " \"" << quill::qir::escape_literal(p->text) << "\"";
            }
            if (inst.source_line != 0) os << "    ; line " << inst.source_line;
            os << "\n";
        }
    }

} // namespace quillc::dump
