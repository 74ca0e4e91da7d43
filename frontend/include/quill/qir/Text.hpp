// frontend/include/quill/qir/Text.hpp
#pragma once
#include <quill/diag/Diagnostic.hpp>
#include <quill/qir/QIR.hpp>

#include <string>
#include <string_view>


namespace quill::qir {

    inline constexpr std::string_view k_text_header = "; quill qir v1";

    /// @brief 모듈을 영속화용 텍스트로 직렬화한다. 항상 마지막 줄은 "halt".
    /// @details 같은 모듈이면 항상 같은 바이트열을 만든다.
    std::string print_text(const Module& m);

    struct ParseTextResult {
        bool ok = false;
        Module mod{};
    };

    /// @brief print_text 형식을 다시 모듈로 읽는다. 오류는 diags에 보고한다.
    /// @details 마지막 halt는 모듈에 InstHalt로 남는다.
    ParseTextResult parse_text(std::string_view text, uint32_t file_id, diag::Bag* diags);

    /// @brief 문자열을 QIR 리터럴 본문("..." 안쪽)으로 이스케이프한다.
    std::string escape_literal(std::string_view bytes);

} // namespace quill::qir
