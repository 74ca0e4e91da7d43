// backend/src/interp/Interpreter.cpp
#include <quill/backend/interp/Interpreter.hpp>


namespace quill::backend::interp {

    Step Interpreter::next() {
        using syntax::StmtKind;

        if (terminal_) return *terminal_;

        while (pc_ < program_.size()) {
            const auto& st = program_[pc_++];
            switch (st.kind) {
                case StmtKind::kComment:
                    break;

                case StmtKind::kEmit:
                    current_ += st.payload;
                    break;

                case StmtKind::kPrint: {
                    Step s{};
                    s.kind = Step::Kind::kOutput;
                    s.text = current_;
                    return s;
                }

                case StmtKind::kInvalid: {
                    Step s{};
                    s.kind = Step::Kind::kError;
                    s.error = InvalidStatementError{st.source_line, st.span};
                    terminal_ = s;
                    return s;
                }
            }
        }

        terminal_ = Step{};
        return *terminal_;
    }

    RunResult interpret(const ast::Program& program, io::OutputChannel& channel) {
        RunResult r{};
        Interpreter it(program);

        while (true) {
            Step s = it.next();
            if (s.kind == Step::Kind::kOutput) {
                channel.emit(s.text);
                ++r.outputs_emitted;
                continue;
            }

            if (s.kind == Step::Kind::kError) {
                r.ok = false;
                r.invalid = s.error;
                r.messages.push_back(CompileMessage{true, describe(*s.error)});
                return r;
            }

            r.ok = true;
            return r;
        }
    }

    BackendKind InterpBackend::kind() const {
        return BackendKind::kInterp;
    }

    RunResult InterpBackend::run(
        const ast::Program& program,
        const RunContext& ctx,
        const CompileOptions&
    ) {
        if (ctx.output == nullptr) {
            RunResult r{};
            r.messages.push_back(CompileMessage{true, "interpreter requires an output channel."});
            return r;
        }
        return interpret(program, *ctx.output);
    }

} // namespace quill::backend::interp
