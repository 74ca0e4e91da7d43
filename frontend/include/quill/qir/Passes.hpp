// frontend/include/quill/qir/Passes.hpp
#pragma once
#include <quill/diag/Diagnostic.hpp>
#include <quill/qir/Builder.hpp>


namespace quill::qir {

    struct OptimizeOptions {
        // 마지막 print 이후의 emit마다 kDeadTrailingEmit 경고를 남긴다.
        bool warn_dead_emit = false;
    };

    /// @brief 최적화 빌드: emit은 컴파일 타임 문자열에 접어 넣고(constant folding),
    ///        print 위치에서만 PrintLiteral로 물질화한다.
    /// @details 마지막 print 뒤의 emit은 어떤 명령에도 반영되지 않는다(dead-code 제거).
    ///          결과 명령 수 == print statement 수.
    BuildResult build_optimized_module(
        const ast::Program& program,
        const OptimizeOptions& opt = {},
        diag::Bag* diags = nullptr
    );

} // namespace quill::qir
