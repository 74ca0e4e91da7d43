// frontend/src/diag/render.cpp
#include <quill/diag/Render.hpp>

#include <sstream>


namespace quill::diag {

    static constexpr uint32_t digits10(uint32_t v) {
        uint32_t d = 1;
        while (v >= 10) { v /= 10; ++d; }
        return d;
    }

    static std::string replace_all(std::string s, std::string_view from, std::string_view to) {
        size_t pos = 0;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), to);
            pos += to.size();
        }

        return s;
    }

    static std::string format_template(std::string templ, const std::vector<std::string>& args) {
        for (size_t i = 0; i < args.size(); ++i) {
            std::string key = "{" + std::to_string(i) + "}";
            templ = replace_all(std::move(templ), key, args[i]);
        }
        return templ;
    }

    static std::string_view code_name_sv_(Code c) {
        switch (c) {
            case Code::kInvalidStatement: return "InvalidStatement";
            case Code::kLineEndingMismatch: return "LineEndingMismatch";
            case Code::kDeadTrailingEmit: return "DeadTrailingEmit";
            case Code::kQirUnknownOpcode: return "QirUnknownOpcode";
            case Code::kQirMalformedLiteral: return "QirMalformedLiteral";
            case Code::kQirMissingHalt: return "QirMissingHalt";
            case Code::kQirTrailingAfterHalt: return "QirTrailingAfterHalt";
        }
        return "Unknown";
    }

    static std::string template_en(Code c) {
        switch (c) {
            case Code::kInvalidStatement:
                return "invalid statement: line {0} starts with the reserved marker 't'";
            case Code::kLineEndingMismatch:
                return "line {0} contains a bare LF while splitting on CRLF; the file may use a different line-ending convention (try --newline universal)";
            case Code::kDeadTrailingEmit:
                return "line {0} appends text after the last print; it is never observed and was eliminated";
            case Code::kQirUnknownOpcode:
                return "unknown QIR opcode '{0}'";
            case Code::kQirMalformedLiteral:
                return "malformed QIR string literal: {0}";
            case Code::kQirMissingHalt:
                return "QIR program must end with 'halt'";
            case Code::kQirTrailingAfterHalt:
                return "QIR instructions found after 'halt'";
        }
        return "unknown diagnostic";
    }

    static std::string template_ko(Code c) {
        switch (c) {
            case Code::kInvalidStatement:
                return "잘못된 문장: {0}번째 줄이 예약 마커 't'로 시작합니다";
            case Code::kLineEndingMismatch:
                return "{0}번째 줄에 CRLF 분할 중 단독 LF가 있습니다. 파일의 줄바꿈 규칙이 다를 수 있습니다 (--newline universal 사용 권장)";
            case Code::kDeadTrailingEmit:
                return "{0}번째 줄은 마지막 print 이후에 문자열을 덧붙이므로 관측되지 않아 제거되었습니다";
            case Code::kQirUnknownOpcode:
                return "알 수 없는 QIR 명령 '{0}'";
            case Code::kQirMalformedLiteral:
                return "잘못된 QIR 문자열 리터럴: {0}";
            case Code::kQirMissingHalt:
                return "QIR 프로그램은 'halt'로 끝나야 합니다";
            case Code::kQirTrailingAfterHalt:
                return "'halt' 이후에 QIR 명령이 있습니다";
        }
        return "알 수 없는 진단";
    }

    std::string code_name(Code c) {
        return std::string(code_name_sv_(c));
    }

    std::string render_message(const Diagnostic& d, Language lang) {
        std::string msg = (lang == Language::kKo) ? template_ko(d.code()) : template_en(d.code());
        return format_template(std::move(msg), d.args());
    }

    static const char* severity_name_(Severity sev) {
        return (sev == Severity::kWarning) ? "warning" :
               (sev == Severity::kFatal)   ? "fatal"   : "error";
    }

    std::string render_one(const Diagnostic& d, Language lang, const SourceManager& sm) {
        std::string msg = render_message(d, lang);

        const auto sp = d.span();
        auto lc = sm.line_col(sp.file_id, sp.lo);
        auto sn = sm.snippet_for_span(sp);

        std::ostringstream oss;
        oss << severity_name_(d.severity()) << "[" << code_name_sv_(d.code()) << "]: " << msg << "\n";
        oss << " --> " << sm.name(sp.file_id) << ":" << lc.line << ":" << lc.col << "\n";
        oss << "  |\n";
        oss << sn.line_no << " | " << sn.line_text << "\n";
        oss << "  | ";

        for (uint32_t i = 0; i < sn.caret_cols_before; ++i) oss << ' ';
        for (uint32_t i = 0; i < sn.caret_cols_len; ++i) oss << '^';

        return oss.str();
    }

    std::string render_one_context(const Diagnostic& d, Language lang, const SourceManager& sm, uint32_t context_lines) {
        std::string msg = render_message(d, lang);

        const auto sp = d.span();
        auto lc = sm.line_col(sp.file_id, sp.lo);

        // 컨텍스트 스니펫
        auto blk = sm.snippet_block_for_span(sp, context_lines);

        uint32_t last_line_no = blk.first_line_no + static_cast<uint32_t>(blk.lines.size()) - 1;
        uint32_t w = digits10(last_line_no);

        std::ostringstream out;
        out << severity_name_(d.severity()) << "[" << code_name_sv_(d.code()) << "]: " << msg << "\n";
        out << " --> " << sm.name(sp.file_id) << ":" << lc.line << ":" << lc.col << "\n";
        out << "  |\n";

        for (uint32_t i = 0; i < blk.lines.size(); ++i) {
            uint32_t line_no = blk.first_line_no + i;

            // "  12 | code..."
            out << std::string(2, ' ');
            {
                std::string num = std::to_string(line_no);
                out << std::string(w - static_cast<uint32_t>(num.size()), ' ') << num;
            }
            out << " | " << blk.lines[i] << "\n";

            if (i == blk.caret_line_offset) {
                out << std::string(2, ' ');
                out << std::string(w, ' ') << " | ";
                out << std::string(blk.caret_cols_before, ' ');
                out << std::string(blk.caret_cols_len, '^') << "\n";
            }
        }

        return out.str();
    }

} // namespace quill::diag
