// backend/include/quill/backend/interp/Interpreter.hpp
#pragma once
#include <quill/backend/Backend.hpp>

#include <string>


namespace quill::backend::interp {

    /// @brief next()가 돌려주는 한 단계.
    struct Step {
        enum class Kind : uint8_t {
            kOutput,
            kDone,
            kError,
        };

        Kind kind = Kind::kDone;
        std::string text{};                              // kOutput
        std::optional<InvalidStatementError> error{};    // kError
    };

    /// @brief Program을 한 statement씩 평가하는 pull 방식 인터프리터.
    /// @details print 값은 만들어지는 즉시 돌려준다. invalid를 만나면 그 전까지의
    ///          출력은 이미 호출자에게 넘어간 상태로 실패한다.
    class Interpreter {
    public:
        explicit Interpreter(const ast::Program& program) : program_(program) {}
        Interpreter(ast::Program&&) = delete; // program_은 참조로만 보관한다

        /// @brief 다음 출력 또는 종료 상태. 종료 후에는 같은 종료 상태를 반복한다.
        Step next();

        bool finished() const {  return terminal_.has_value();  }
        const std::string& current() const {  return current_;  }

    private:
        const ast::Program& program_;
        size_t pc_ = 0;
        std::string current_{};
        std::optional<Step> terminal_{};
    };

    /// @brief 인터프리터를 끝까지 돌리며 출력을 channel로 흘려보낸다.
    RunResult interpret(const ast::Program& program, io::OutputChannel& channel);

    /// @brief 인터프리터 백엔드.
    class InterpBackend final : public Backend {
    public:
        BackendKind kind() const override;

        RunResult run(
            const ast::Program& program,
            const RunContext& ctx,
            const CompileOptions& opt
        ) override;
    };

} // namespace quill::backend::interp
