// frontend/src/lex/lexer.cpp
#include <quill/lex/Lexer.hpp>


namespace quill {

    Lexer::Lexer(std::string_view source, std::uint32_t file_id, text::NewlineMode mode, diag::Bag* diags)
        : source_(source), file_id_(file_id), mode_(mode), diags_(diags) {}

    syntax::StmtKind Lexer::classify_line(std::string_view line) {
        using syntax::StmtKind;

        // 빈 줄/공백 시작 줄도 emit으로 취급한다.
        if (line.empty()) return StmtKind::kEmit;

        switch (line.front()) {
            case syntax::k_print_marker:   return StmtKind::kPrint;
            case syntax::k_invalid_marker: return StmtKind::kInvalid;
            case syntax::k_comment_marker: return StmtKind::kComment;
            default:                       return StmtKind::kEmit;
        }
    }

    ast::Statement Lexer::make_stmt_(const text::LogicalLine& ln) const {
        ast::Statement st{};
        st.kind = classify_line(ln.text);
        st.source_line = ln.line_no;
        st.span = Span{
            file_id_,
            ln.lo,
            ln.lo + static_cast<uint32_t>(ln.text.size())
        };
        if (st.kind == syntax::StmtKind::kEmit) st.payload = std::string(ln.text);
        return st;
    }

    void Lexer::report_invalid_(const ast::Statement& st) {
        if (!diags_) return;
        // 캐럿은 마커 한 글자에만 찍는다.
        diag::Diagnostic d(diag::Severity::kError, diag::Code::kInvalidStatement,
                           Span{st.span.file_id, st.span.lo, st.span.lo + 1});
        d.add_arg_int(static_cast<int>(st.source_line));
        diags_->add(std::move(d));
    }

    void Lexer::report_line_ending_mismatch_(const text::LogicalLine& ln) {
        if (!diags_) return;
        const uint32_t lf = ln.lo + static_cast<uint32_t>(ln.text.find('\n'));
        diag::Diagnostic d(diag::Severity::kWarning, diag::Code::kLineEndingMismatch,
                           Span{file_id_, lf, lf + 1});
        d.add_arg_int(static_cast<int>(ln.line_no));
        diags_->add(std::move(d));
    }

    ast::Program Lexer::classify_all() {
        const auto lines = text::split_lines(source_, mode_);

        std::vector<ast::Statement> stmts;
        stmts.reserve(lines.size());

        for (const auto& ln : lines) {
            if (ln.has_bare_lf) report_line_ending_mismatch_(ln);

            auto st = make_stmt_(ln);
            if (st.kind == syntax::StmtKind::kInvalid) report_invalid_(st);
            stmts.push_back(std::move(st));
        }

        return ast::Program(std::move(stmts));
    }

    namespace {

        ClassifyResult check_program_(ast::Program program) {
            ClassifyResult r{};
            const size_t bad = program.first_invalid_index();
            if (bad < program.size()) {
                r.ok = false;
                r.error = InvalidStatementError{program[bad].source_line, program[bad].span};
                return r;
            }
            r.ok = true;
            r.program = std::move(program);
            return r;
        }

    } // namespace

    ClassifyResult classify(std::string_view source, const ClassifyOptions& opt, diag::Bag* diags) {
        Lexer lex(source, opt.file_id, opt.newline, diags);
        return check_program_(lex.classify_all());
    }

    ClassifyResult classify(const std::vector<std::string>& lines) {
        return check_program_(program_from_lines(lines));
    }

    ast::Program program_from_lines(const std::vector<std::string>& lines) {
        std::vector<ast::Statement> stmts;
        stmts.reserve(lines.size());

        // span은 줄들을 '\n'으로 이어 붙였다고 가정한 offset이다.
        uint32_t off = 0;
        uint32_t line_no = 1;
        for (const auto& line : lines) {
            ast::Statement st{};
            st.kind = Lexer::classify_line(line);
            st.source_line = line_no++;
            st.span = Span{0, off, off + static_cast<uint32_t>(line.size())};
            if (st.kind == syntax::StmtKind::kEmit) st.payload = line;
            stmts.push_back(std::move(st));

            off += static_cast<uint32_t>(line.size()) + 1;
        }
        return ast::Program(std::move(stmts));
    }

} // namespace quill
