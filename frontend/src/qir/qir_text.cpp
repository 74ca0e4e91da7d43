// frontend/src/qir/qir_text.cpp
#include <quill/qir/Text.hpp>

#include <sstream>
#include <type_traits>
#include <variant>


namespace quill::qir {

    namespace {

        constexpr char k_hex[] = "0123456789abcdef";
        constexpr std::string_view k_optimized_marker = "; optimized";

        bool is_space_(char c) {
            return c == ' ' || c == '\t' || c == '\r';
        }

        int hex_value_(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        /// @brief 한 줄을 읽는 커서. 오프셋은 원본 text 기준 byte offset이다.
        struct LineCursor {
            std::string_view line;
            uint32_t base = 0;
            size_t pos = 0;

            void skip_ws() {
                while (pos < line.size() && is_space_(line[pos])) ++pos;
            }

            bool at_end_or_comment() {
                skip_ws();
                return pos >= line.size() || line[pos] == ';';
            }

            std::string_view take_word() {
                skip_ws();
                const size_t b = pos;
                while (pos < line.size() && !is_space_(line[pos]) && line[pos] != ';' && line[pos] != '"') ++pos;
                return line.substr(b, pos - b);
            }

            uint32_t off() const { return base + static_cast<uint32_t>(pos); }
        };

        void report_(diag::Bag* diags, diag::Code code, Span sp, std::string_view arg = {}) {
            if (!diags) return;
            diag::Diagnostic d(diag::Severity::kError, code, sp);
            if (!arg.empty()) d.add_arg(arg);
            diags->add(std::move(d));
        }

        /// @brief "..." 리터럴을 읽어 out에 디코드한다. 실패 시 reason을 채운다.
        bool parse_literal_(LineCursor& cur, std::string& out, std::string& reason) {
            cur.skip_ws();
            if (cur.pos >= cur.line.size() || cur.line[cur.pos] != '"') {
                reason = "expected '\"'";
                return false;
            }
            ++cur.pos;

            while (cur.pos < cur.line.size()) {
                const char c = cur.line[cur.pos++];
                if (c == '"') return true;
                if (c != '\\') {
                    out.push_back(c);
                    continue;
                }

                if (cur.pos >= cur.line.size()) break;
                const char e = cur.line[cur.pos++];
                switch (e) {
                    case '\\': out.push_back('\\'); break;
                    case '"':  out.push_back('"');  break;
                    case 'n':  out.push_back('\n'); break;
                    case 'r':  out.push_back('\r'); break;
                    case 't':  out.push_back('\t'); break;
                    case 'x': {
                        if (cur.pos + 2 > cur.line.size()) {
                            reason = "truncated \\x escape";
                            return false;
                        }
                        const int hi = hex_value_(cur.line[cur.pos]);
                        const int lo = hex_value_(cur.line[cur.pos + 1]);
                        if (hi < 0 || lo < 0) {
                            reason = "invalid \\x escape";
                            return false;
                        }
                        out.push_back(static_cast<char>((hi << 4) | lo));
                        cur.pos += 2;
                        break;
                    }
                    default:
                        reason = std::string("unknown escape '\\") + e + "'";
                        return false;
                }
            }

            reason = "unterminated string literal";
            return false;
        }

    } // namespace

    std::string escape_literal(std::string_view bytes) {
        std::string out;
        out.reserve(bytes.size());
        for (const char ch : bytes) {
            const auto c = static_cast<unsigned char>(ch);
            switch (c) {
                case '\\': out += "\\\\"; break;
                case '"':  out += "\\\""; break;
                case '\n': out += "\\n";  break;
                case '\r': out += "\\r";  break;
                case '\t': out += "\\t";  break;
                default:
                    if (c < 0x20 || c == 0x7f) {
                        out += "\\x";
                        out.push_back(k_hex[c >> 4]);
                        out.push_back(k_hex[c & 0xf]);
                    } else {
                        out.push_back(ch);
                    }
                    break;
            }
        }
        return out;
    }

    std::string print_text(const Module& m) {
        std::ostringstream oss;
        oss << k_text_header << "\n";
        if (m.optimized) oss << k_optimized_marker << "\n";

        bool halted = false;
        for (const auto& inst : m.insts) {
            std::visit([&](auto&& x) {
                using T = std::decay_t<decltype(x)>;
                if constexpr (std::is_same_v<T, InstAppendLiteral>) {
                    oss << "append \"" << escape_literal(x.text) << "\"\n";
                } else if constexpr (std::is_same_v<T, InstPrintCurrent>) {
                    oss << "print\n";
                } else if constexpr (std::is_same_v<T, InstPrintLiteral>) {
                    oss << "printlit \"" << escape_literal(x.text) << "\"\n";
                } else if constexpr (std::is_same_v<T, InstHalt>) {
                    oss << "halt\n";
                    halted = true;
                }
            }, inst.data);
            if (halted) break;
        }

        if (!halted) oss << "halt\n";
        return oss.str();
    }

    ParseTextResult parse_text(std::string_view text, uint32_t file_id, diag::Bag* diags) {
        ParseTextResult out{};
        Module mod{};

        bool ok = true;
        bool halted = false;
        bool reported_trailing = false;

        size_t line_lo = 0;
        while (line_lo < text.size()) {
            size_t nl = text.find('\n', line_lo);
            if (nl == std::string_view::npos) nl = text.size();

            LineCursor cur{text.substr(line_lo, nl - line_lo), static_cast<uint32_t>(line_lo), 0};
            const Span line_sp{file_id, cur.base, cur.base + static_cast<uint32_t>(cur.line.size())};
            line_lo = nl + 1;

            if (cur.at_end_or_comment()) {
                if (mod.insts.empty() && cur.line.substr(cur.pos).rfind(k_optimized_marker, 0) == 0) {
                    mod.optimized = true;
                }
                continue;
            }

            if (halted) {
                if (!reported_trailing) {
                    report_(diags, diag::Code::kQirTrailingAfterHalt, line_sp);
                    reported_trailing = true;
                }
                ok = false;
                continue;
            }

            const uint32_t word_lo = cur.off();
            const std::string_view op = cur.take_word();
            const Span op_sp{file_id, word_lo, cur.off() == word_lo ? word_lo + 1 : cur.off()};

            Inst inst{};
            if (op == "append" || op == "printlit") {
                std::string lit;
                std::string reason;
                const uint32_t lit_lo = cur.off();
                if (!parse_literal_(cur, lit, reason)) {
                    report_(diags, diag::Code::kQirMalformedLiteral, Span{file_id, lit_lo, line_sp.hi}, reason);
                    ok = false;
                    continue;
                }
                if (op == "append") inst.data = InstAppendLiteral{std::move(lit)};
                else inst.data = InstPrintLiteral{std::move(lit)};
            } else if (op == "print") {
                inst.data = InstPrintCurrent{};
            } else if (op == "halt") {
                inst.data = InstHalt{};
                halted = true;
            } else {
                report_(diags, diag::Code::kQirUnknownOpcode, op_sp, op.empty() ? std::string_view("\"") : op);
                ok = false;
                continue;
            }

            if (!cur.at_end_or_comment()) {
                report_(diags, diag::Code::kQirMalformedLiteral,
                        Span{file_id, cur.off(), line_sp.hi}, "unexpected trailing text");
                ok = false;
                continue;
            }

            mod.add_inst(inst);
        }

        if (!halted) {
            const uint32_t end = static_cast<uint32_t>(text.size());
            report_(diags, diag::Code::kQirMissingHalt, Span{file_id, end, end});
            ok = false;
        }

        out.ok = ok;
        if (ok) out.mod = std::move(mod);
        return out;
    }

} // namespace quill::qir
