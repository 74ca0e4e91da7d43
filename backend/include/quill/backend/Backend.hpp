// backend/include/quill/backend/Backend.hpp
#pragma once

#include <quill/ast/Program.hpp>
#include <quill/backend/io/ExecutionSink.hpp>
#include <quill/backend/io/OutputChannel.hpp>
#include <quill/diag/Diagnostic.hpp>
#include <quill/diag/Errors.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>


namespace quill::backend {

    /// @brief 실행 전략 식별자.
    enum class BackendKind : uint8_t {
        kInterp,
        kAot,
        kJit,
    };

    /// @brief AOT 산출물 형식.
    enum class EmitKind : uint8_t {
        kQir,
        kLlvmIr,
        kObject,
    };

    /// @brief 백엔드 컴파일 옵션.
    struct CompileOptions {
        bool optimize = false;
        bool warn_dead_emit = false;
        EmitKind emit = EmitKind::kQir;

        // LLVM 경로 전용
        uint8_t opt_level = 0;
        std::string target_triple{};
        std::string cpu{};
    };

    /// @brief 백엔드 메시지(오류/경고/정보).
    struct CompileMessage {
        bool is_error = false;
        std::string text{};
    };

    /// @brief 백엔드 실행 결과.
    /// @details invalid와 persist_error는 동시에 채워지지 않는다.
    struct RunResult {
        bool ok = false;
        std::optional<InvalidStatementError> invalid{};
        std::optional<PersistenceError> persist_error{};

        uint32_t outputs_emitted = 0;
        std::vector<CompileMessage> messages{};
    };

    /// @brief 백엔드가 바깥 세계와 닿는 지점들. 필요 없는 포인터는 null일 수 있다.
    struct RunContext {
        io::OutputChannel* output = nullptr;   // interp / jit
        io::ExecutionSink* sink = nullptr;     // aot
        diag::Bag* diags = nullptr;
    };

    /// @brief Program을 받아 하나의 실행 전략을 수행하는 공통 인터페이스.
    class Backend {
    public:
        virtual ~Backend() = default;

        /// @brief 백엔드 종류를 반환한다.
        virtual BackendKind kind() const = 0;

        /// @brief Program을 실행하거나(interp/jit) 산출물로 영속화한다(aot).
        virtual RunResult run(
            const ast::Program& program,
            const RunContext& ctx,
            const CompileOptions& opt
        ) = 0;
    };

    /// @brief 종류에 맞는 백엔드 인스턴스를 만든다.
    std::unique_ptr<Backend> make_backend(BackendKind kind);

    const char* backend_kind_name(BackendKind kind);

} // namespace quill::backend
