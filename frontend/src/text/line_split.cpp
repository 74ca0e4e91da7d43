// frontend/src/text/line_split.cpp
#include <quill/text/LineSplit.hpp>


namespace quill::text {

    namespace {

        /// @brief pos 위치의 줄바꿈 길이(0이면 줄바꿈 아님).
        size_t terminator_len_(std::string_view s, size_t pos, NewlineMode mode) {
            const char c = s[pos];
            const bool next_is_lf = (pos + 1 < s.size() && s[pos + 1] == '\n');

            switch (mode) {
                case NewlineMode::kCrlf:
                    return (c == '\r' && next_is_lf) ? 2 : 0;
                case NewlineMode::kLf:
                    return (c == '\n') ? 1 : 0;
                case NewlineMode::kUniversal:
                    if (c == '\r') return next_is_lf ? 2 : 1;
                    return (c == '\n') ? 1 : 0;
            }
            return 0;
        }

    } // namespace

    std::vector<LogicalLine> split_lines(std::string_view source, NewlineMode mode) {
        std::vector<LogicalLine> out;

        size_t start = 0;
        size_t i = 0;
        uint32_t line_no = 1;

        auto push = [&](size_t lo, size_t hi) {
            LogicalLine ln{};
            ln.text = source.substr(lo, hi - lo);
            ln.line_no = line_no++;
            ln.lo = static_cast<uint32_t>(lo);
            ln.has_bare_lf = (mode == NewlineMode::kCrlf) &&
                             (ln.text.find('\n') != std::string_view::npos);
            out.push_back(ln);
        };

        while (i < source.size()) {
            const size_t n = terminator_len_(source, i, mode);
            if (n == 0) {
                ++i;
                continue;
            }
            push(start, i);
            i += n;
            start = i;
        }

        // 마지막 줄바꿈 뒤에 남은 내용이 있을 때만 줄을 추가한다.
        if (start < source.size()) push(start, source.size());
        return out;
    }

    bool parse_newline_mode(std::string_view text, NewlineMode& out) {
        if (text == "crlf") { out = NewlineMode::kCrlf; return true; }
        if (text == "lf") { out = NewlineMode::kLf; return true; }
        if (text == "universal" || text == "auto") { out = NewlineMode::kUniversal; return true; }
        return false;
    }

    std::string_view newline_mode_name(NewlineMode mode) {
        switch (mode) {
            case NewlineMode::kCrlf: return "crlf";
            case NewlineMode::kLf: return "lf";
            case NewlineMode::kUniversal: return "universal";
        }
        return "universal";
    }

} // namespace quill::text
