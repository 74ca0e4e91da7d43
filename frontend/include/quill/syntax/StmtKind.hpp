// frontend/include/quill/syntax/StmtKind.hpp
#pragma once
#include <cstdint>
#include <string_view>


namespace quill::syntax {

    /// @brief 한 줄(statement)의 분류. 첫 글자만으로 결정된다.
    enum class StmtKind : uint8_t {
        kComment,   // '#'
        kEmit,      // 그 외 모든 줄 (빈 줄 포함)
        kPrint,     // 'p'
        kInvalid,   // 't' (예약된 invalid 마커)
    };

    inline constexpr char k_comment_marker = '#';
    inline constexpr char k_print_marker   = 'p';
    inline constexpr char k_invalid_marker = 't';

    constexpr std::string_view stmt_kind_name(StmtKind k) {
        switch (k) {
            case StmtKind::kComment: return "comment";
            case StmtKind::kEmit:    return "emit";
            case StmtKind::kPrint:   return "print";
            case StmtKind::kInvalid: return "invalid";
        }
        return "unknown";
    }

} // namespace quill::syntax
