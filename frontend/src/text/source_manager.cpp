// frontend/src/text/source_manager.cpp
#include <quill/text/SourceManager.hpp>

#include <algorithm>


namespace quill {

    bool SourceManager::utf8_decode_one(std::string_view s, uint32_t& i, uint32_t& cp) {
        if (i >= s.size()) return false;
        unsigned char c0 = static_cast<unsigned char>(s[i]);

        // ASCII
        if (c0 < 0x80) {
            cp = c0;
            i += 1;
            return true;
        }

        auto cont = [&](uint32_t idx) -> bool {
            if (idx >= s.size()) return false;
            unsigned char cc = static_cast<unsigned char>(s[idx]);
            return (cc & 0xC0) == 0x80;
        };

        // 2-byte
        if ((c0 & 0xE0) == 0xC0) {
            if (!cont(i + 1)) { cp = 0xFFFD; i += 1; return false; }
            unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
            cp = ((c0 & 0x1F) << 6) | (c1 & 0x3F);
            i += 2;
            return true;
        }

        // 3-byte
        if ((c0 & 0xF0) == 0xE0) {
            if (!cont(i + 1) || !cont(i + 2)) { cp = 0xFFFD; i += 1; return false; }
            unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
            unsigned char c2 = static_cast<unsigned char>(s[i + 2]);
            cp = ((c0 & 0x0F) << 12) | ((c1 & 0x3F) << 6) | (c2 & 0x3F);
            i += 3;
            return true;
        }

        // 4-byte
        if ((c0 & 0xF8) == 0xF0) {
            if (!cont(i + 1) || !cont(i + 2) || !cont(i + 3)) { cp = 0xFFFD; i += 1; return false; }
            unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
            unsigned char c2 = static_cast<unsigned char>(s[i + 2]);
            unsigned char c3 = static_cast<unsigned char>(s[i + 3]);
            cp = ((c0 & 0x07) << 18) | ((c1 & 0x3F) << 12) | ((c2 & 0x3F) << 6) | (c3 & 0x3F);
            i += 4;
            return true;
        }

        cp = 0xFFFD;
        i += 1;
        return false;
    }

    // Covers ASCII, combining marks (0), Hangul/CJK/Fullwidth (2).
    uint32_t SourceManager::unicode_display_width(uint32_t cp) {
        if (cp == 0) return 0;
        if (cp < 32 || (cp >= 0x7F && cp < 0xA0)) return 0;

        if ((cp >= 0x0300 && cp <= 0x036F) || (cp >= 0x1AB0 && cp <= 0x1AFF) ||
            (cp >= 0x1DC0 && cp <= 0x1DFF) || (cp >= 0x20D0 && cp <= 0x20FF) ||
            (cp >= 0xFE20 && cp <= 0xFE2F)) {
            return 0;
        }

        if ((cp >= 0x1100 && cp <= 0x115F) || // 한글 자모 init
            (cp >= 0x2E80 && cp <= 0xA4CF) || // CJK, Yi, etc (rough)
            (cp >= 0xAC00 && cp <= 0xD7A3) || // 한글 음절
            (cp >= 0xF900 && cp <= 0xFAFF) || // CJK compat
            (cp >= 0xFE30 && cp <= 0xFE6F) ||
            (cp >= 0xFF00 && cp <= 0xFF60) || // Fullwidth forms
            (cp >= 0xFFE0 && cp <= 0xFFE6)) {
            return 2;
        }

        return 1;
    }

    uint32_t SourceManager::display_width_between(std::string_view s, uint32_t byte_lo, uint32_t byte_hi) {
        uint32_t i = byte_lo;
        uint32_t w = 0;
        while (i < byte_hi && i < s.size()) {
            uint32_t cp = 0;
            uint32_t before = i;
            utf8_decode_one(s, i, cp);
            if (i == before) i += 1;
            w += unicode_display_width(cp);
        }
        return w;
    }

    uint32_t SourceManager::add(std::string name, std::string content, text::NewlineMode mode) {
        files_.emplace_back();
        File& f = files_.back();
        f.name = std::move(name);
        f.content = std::move(content);
        f.mode = mode;
        f.lines = text::split_lines(f.content, mode);

        return static_cast<uint32_t>(files_.size() - 1);
    }

    std::string_view SourceManager::name(uint32_t file_id) const {
        return files_[file_id].name;
    }

    std::string_view SourceManager::content(uint32_t file_id) const {
        return files_[file_id].content;
    }

    text::NewlineMode SourceManager::newline_mode(uint32_t file_id) const {
        return files_[file_id].mode;
    }

    const std::vector<text::LogicalLine>& SourceManager::lines(uint32_t file_id) const {
        return files_[file_id].lines;
    }

    uint32_t SourceManager::line_index_from_byte(const File& f, uint32_t byte_off) {
        if (f.lines.empty()) return 0;
        auto it = std::upper_bound(
            f.lines.begin(), f.lines.end(), byte_off,
            [](uint32_t off, const text::LogicalLine& ln) { return off < ln.lo; }
        );
        if (it == f.lines.begin()) return 0;
        return static_cast<uint32_t>((it - f.lines.begin()) - 1);
    }

    LineCol SourceManager::line_col(uint32_t file_id, uint32_t byte_off) const {
        const auto& f = files_[file_id];
        LineCol lc;
        if (f.lines.empty()) return lc;

        const uint32_t idx = line_index_from_byte(f, byte_off);
        const auto& ln = f.lines[idx];

        uint32_t rel = (byte_off > ln.lo) ? (byte_off - ln.lo) : 0;
        rel = std::min<uint32_t>(rel, static_cast<uint32_t>(ln.text.size()));

        lc.line = ln.line_no;
        lc.col = display_width_between(ln.text, 0, rel) + 1;
        return lc;
    }

    Snippet SourceManager::snippet_for_span(const Span& sp) const {
        const auto& f = files_[sp.file_id];
        Snippet sn;
        if (f.lines.empty()) return sn;

        const uint32_t idx = line_index_from_byte(f, sp.lo);
        const auto& ln = f.lines[idx];
        const uint32_t len = static_cast<uint32_t>(ln.text.size());

        uint32_t lo = (sp.lo > ln.lo) ? std::min<uint32_t>(sp.lo - ln.lo, len) : 0;
        uint32_t hi = (sp.hi > ln.lo) ? std::min<uint32_t>(sp.hi - ln.lo, len) : lo;
        if (hi < lo) hi = lo;

        sn.line_text = ln.text;
        sn.line_no = ln.line_no;
        sn.col = display_width_between(ln.text, 0, lo) + 1;
        sn.caret_cols_before = sn.col - 1;
        sn.caret_cols_len = std::max<uint32_t>(1u, display_width_between(ln.text, lo, hi));
        return sn;
    }

    SnippetBlock SourceManager::snippet_block_for_span(const Span& sp, uint32_t context_lines) const {
        const auto& f = files_[sp.file_id];
        SnippetBlock blk;
        if (f.lines.empty()) {
            blk.lines.push_back(std::string_view{});
            return blk;
        }

        const Snippet sn = snippet_for_span(sp);
        const uint32_t idx = line_index_from_byte(f, sp.lo);

        const uint32_t first = (idx > context_lines) ? (idx - context_lines) : 0;
        const uint32_t last = std::min<uint32_t>(
            idx + context_lines, static_cast<uint32_t>(f.lines.size() - 1)
        );

        for (uint32_t i = first; i <= last; ++i) blk.lines.push_back(f.lines[i].text);

        blk.first_line_no = f.lines[first].line_no;
        blk.caret_line_offset = idx - first;
        blk.caret_cols_before = sn.caret_cols_before;
        blk.caret_cols_len = sn.caret_cols_len;
        blk.col = sn.col;
        return blk;
    }

} // namespace quill
