// backend/include/quill/backend/aot/AOTBackend.hpp
#pragma once
#include <quill/backend/Backend.hpp>


namespace quill::backend::aot {

    /// @brief AOT 백엔드 구현.
    /// @details 모듈을 끝까지 빌드하고 검증한 뒤에만 sink에 넘긴다.
    class AOTBackend final : public Backend {
    public:
        /// @brief 백엔드 종류를 반환한다.
        BackendKind kind() const override;

        /// @brief Program을 AOT 경로로 컴파일하고 sink에 영속화한다.
        RunResult run(
            const ast::Program& program,
            const RunContext& ctx,
            const CompileOptions& opt
        ) override;
    };

} // namespace quill::backend::aot
