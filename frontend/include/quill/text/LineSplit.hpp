// frontend/include/quill/text/LineSplit.hpp
#pragma once
#include <cstdint>
#include <string_view>
#include <vector>


namespace quill::text {

    /// @brief 논리적 줄을 나누는 줄바꿈 규칙.
    enum class NewlineMode : uint8_t {
        kCrlf,       // "\r\n"만 줄 끝으로 본다
        kLf,         // "\n"만 줄 끝으로 본다
        kUniversal,  // "\r\n", "\n", 단독 "\r" 모두 허용
    };

    struct LogicalLine {
        std::string_view text{};   // 줄바꿈 문자 제외
        uint32_t line_no = 1;      // 1-based
        uint32_t lo = 0;           // source 내 byte offset (줄 시작)
        bool has_bare_lf = false;  // kCrlf 모드에서 줄 안에 단독 '\n'이 섞여 있음
    };

    /// @brief source를 논리적 줄로 나눈다.
    /// @details 입력 끝의 줄바꿈 하나는 마지막 줄을 닫을 뿐 빈 줄을 추가하지 않는다.
    ///          빈 입력은 0줄이다.
    std::vector<LogicalLine> split_lines(std::string_view source, NewlineMode mode);

    bool parse_newline_mode(std::string_view text, NewlineMode& out);
    std::string_view newline_mode_name(NewlineMode mode);

} // namespace quill::text
