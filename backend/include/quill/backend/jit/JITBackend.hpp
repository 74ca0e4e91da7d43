// backend/include/quill/backend/jit/JITBackend.hpp
#pragma once

#include <quill/backend/Backend.hpp>


namespace quill::backend::jit {

    /// @brief Program을 메모리에서 QIR로 빌드한 뒤 곧바로 실행한다.
    /// @details 빌드가 실패하면 실행기는 돌지 않으므로 출력이 전혀 없다.
    RunResult jit_run(const ast::Program& program, io::OutputChannel& channel, const CompileOptions& opt = {});

    /// @brief JIT 백엔드 구현.
    class JITBackend final : public Backend {
    public:
        /// @brief 백엔드 종류를 반환한다.
        BackendKind kind() const override;

        /// @brief build + execute를 한 번에 수행한다.
        RunResult run(
            const ast::Program& program,
            const RunContext& ctx,
            const CompileOptions& opt
        ) override;
    };

} // namespace quill::backend::jit
