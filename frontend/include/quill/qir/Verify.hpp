// frontend/include/quill/qir/Verify.hpp
#pragma once
#include <quill/qir/QIR.hpp>
#include <string>
#include <vector>


namespace quill::qir {

    enum class VerifyMode : uint8_t {
        kAny,        // halt가 있다면 마지막이어야 한다
        kOptimized,  // + PrintLiteral 외의 명령 금지
    };

    struct VerifyError { std::string msg; };
    std::vector<VerifyError> verify(const Module& m, VerifyMode mode = VerifyMode::kAny);

} // namespace quill::qir
