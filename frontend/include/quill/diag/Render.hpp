// frontend/include/quill/diag/Render.hpp
#pragma once
#include <quill/diag/Diagnostic.hpp>
#include <quill/text/SourceManager.hpp>

#include <string>


namespace quill::diag {

    std::string code_name(Code c);

    /// @brief 진단 메시지 본문만 렌더링한다(위치/스니펫 제외).
    std::string render_message(const Diagnostic& d, Language lang);

    std::string render_one(const Diagnostic& d, Language lang, const SourceManager& sm);

    /// @brief 진단을 렌더링하되, 에러 라인 주변 컨텍스트를 함께 출력
    std::string render_one_context(const Diagnostic& d, Language lang, const SourceManager& sm, uint32_t context_lines);

} // namespace quill::diag
