// backend/include/quill/backend/exec/Executor.hpp
#pragma once
#include <quill/backend/Backend.hpp>
#include <quill/qir/QIR.hpp>


namespace quill::backend::exec {

    /// @brief QIR 모듈을 새 문자열 상태로 실행한다.
    /// @details halt를 만나면 즉시 멈춘다. 모듈은 이미 검증된 것으로 보고 실패하지 않는다.
    RunResult execute(const qir::Module& m, io::OutputChannel& channel);

} // namespace quill::backend::exec
