// backend/src/jit/JITBackend.cpp
#include <quill/backend/jit/JITBackend.hpp>
#include <quill/backend/exec/Executor.hpp>
#include <quill/qir/Passes.hpp>

namespace quill::backend::jit {

    RunResult jit_run(const ast::Program& program, io::OutputChannel& channel, const CompileOptions& opt) {
        // 최적화 여부와 관계없이 관측 출력은 같다.
        qir::BuildResult built = opt.optimize
            ? qir::build_optimized_module(program)
            : qir::build_module(program);

        if (!built.ok) {
            RunResult r{};
            r.ok = false;
            r.invalid = built.error;
            if (built.error) r.messages.push_back(CompileMessage{true, describe(*built.error)});
            return r;
        }

        return exec::execute(built.mod, channel);
    }

    /// @brief JIT 백엔드 종류를 반환한다.
    BackendKind JITBackend::kind() const {
        return BackendKind::kJit;
    }

    RunResult JITBackend::run(
        const ast::Program& program,
        const RunContext& ctx,
        const CompileOptions& opt
    ) {
        if (ctx.output == nullptr) {
            RunResult r{};
            r.messages.push_back(CompileMessage{true, "JIT backend requires an output channel."});
            return r;
        }
        return jit_run(program, *ctx.output, opt);
    }

} // namespace quill::backend::jit
