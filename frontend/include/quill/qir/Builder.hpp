// frontend/include/quill/qir/Builder.hpp
#pragma once
#include <quill/ast/Program.hpp>
#include <quill/diag/Errors.hpp>
#include <quill/qir/QIR.hpp>

#include <optional>


namespace quill::qir {

    /// @brief Program -> QIR 빌드 결과. 실패 시 mod는 항상 비어 있다.
    struct BuildResult {
        bool ok = false;
        Module mod{};
        std::optional<InvalidStatementError> error{};
    };

    /// @brief 비최적화 빌드: emit -> append, print -> print 를 1:1로 옮긴다.
    /// @details invalid statement가 하나라도 있으면 전체 빌드가 실패한다.
    BuildResult build_module(const ast::Program& program);

} // namespace quill::qir
