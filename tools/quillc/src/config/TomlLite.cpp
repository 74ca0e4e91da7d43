#include <quillc/config/TomlLite.hpp>

#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace quillc::config::toml_lite {

namespace {

/// quill 설정은 `[section]` 한 단계와 `key = scalar`만 쓴다.
struct LineReader {
    std::string_view text;
    size_t pos = 0;
    size_t line_no = 0;

    bool next(std::string_view& line) {
        if (pos > text.size()) return false;
        size_t nl = text.find('\n', pos);
        if (nl == std::string_view::npos) nl = text.size();
        line = text.substr(pos, nl - pos);
        pos = nl + 1;
        ++line_no;
        return true;
    }
};

std::string_view trim(std::string_view s) {
    const auto blank = [](char c) { return c == ' ' || c == '\t' || c == '\r'; };
    while (!s.empty() && blank(s.front())) s.remove_prefix(1);
    while (!s.empty() && blank(s.back())) s.remove_suffix(1);
    return s;
}

/// 문자열 밖의 `#`부터 줄 끝까지 버린다.
std::string_view cut_comment(std::string_view line) {
    bool in_string = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_string) {
            if (c == '\\') ++i;
            else if (c == '"') in_string = false;
            continue;
        }
        if (c == '"') in_string = true;
        else if (c == '#') return line.substr(0, i);
    }
    return line;
}

bool is_name(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        const auto u = static_cast<unsigned char>(c);
        if (!(std::islower(u) || std::isdigit(u) || c == '_')) return false;
    }
    return true;
}

bool read_string(std::string_view body, std::string& out, std::string& err) {
    out.clear();
    for (size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (c == '"') {
            err = "unescaped quote inside string literal";
            return false;
        }
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (++i == body.size()) {
            err = "unterminated escape in string literal";
            return false;
        }
        switch (body[i]) {
            case 'n': out.push_back('\n'); break;
            case 't': out.push_back('\t'); break;
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            default:
                err = std::string("unsupported escape '\\") + body[i] + "'";
                return false;
        }
    }
    return true;
}

bool read_scalar(std::string_view v, Value& out, std::string& err) {
    if (v.empty()) {
        err = "empty value";
        return false;
    }
    if (v == "true" || v == "false") {
        out = (v == "true");
        return true;
    }
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
        std::string s{};
        if (!read_string(v.substr(1, v.size() - 2), s, err)) return false;
        out = std::move(s);
        return true;
    }

    std::string_view digits = v;
    if (digits.front() == '+') digits.remove_prefix(1);
    int64_t n = 0;
    const char* first = digits.data();
    const char* last = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(first, last, n);
    if (!digits.empty() && ec == std::errc{} && ptr == last) {
        out = n;
        return true;
    }

    err = "unsupported TOML value (expected string, integer or bool)";
    return false;
}

} // namespace

bool parse_text(std::string_view text,
                std::string_view source_name,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err) {
    out.clear();
    err.clear();

    LineReader reader{text};
    std::string section{};
    std::string_view raw{};
    while (reader.next(raw)) {
        const auto at = [&] {
            return std::string(source_name) + ":" + std::to_string(reader.line_no) + ": ";
        };

        const std::string_view line = trim(cut_comment(raw));
        if (line.empty()) continue;

        if (line.front() == '[') {
            if (line.back() != ']') {
                err = at() + "invalid section header";
                return false;
            }
            const std::string_view name = trim(line.substr(1, line.size() - 2));
            if (!is_name(name)) {
                err = at() + "invalid section name";
                return false;
            }
            section = std::string(name);
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            err = at() + "expected '='";
            return false;
        }
        const std::string_view key = trim(line.substr(0, eq));
        if (!is_name(key)) {
            err = at() + "invalid key";
            return false;
        }

        Value v{};
        std::string value_err{};
        if (!read_scalar(trim(line.substr(eq + 1)), v, value_err)) {
            err = at() + value_err;
            return false;
        }

        std::string full = section.empty() ? std::string(key) : section + "." + std::string(key);
        if (out.contains(full)) {
            warnings.push_back(at() + "duplicate key '" + full + "', overriding");
        }
        out[std::move(full)] = std::move(v);
    }

    return true;
}

bool parse_file(const std::filesystem::path& path,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err) {
    out.clear();
    err.clear();

    std::error_code ec{};
    if (path.empty() || !std::filesystem::exists(path, ec)) return true;
    if (!std::filesystem::is_regular_file(path, ec)) {
        err = "not a regular file: " + path.string();
        return false;
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        err = "failed to open file: " + path.string();
        return false;
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return parse_text(ss.str(), path.string(), out, warnings, err);
}

} // namespace quillc::config::toml_lite
