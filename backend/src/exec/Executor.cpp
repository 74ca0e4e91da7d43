// backend/src/exec/Executor.cpp
#include <quill/backend/exec/Executor.hpp>

#include <type_traits>
#include <variant>


namespace quill::backend::exec {

    RunResult execute(const qir::Module& m, io::OutputChannel& channel) {
        RunResult r{};
        std::string current{};

        for (const auto& inst : m.insts) {
            bool halt = false;
            std::visit([&](auto&& x) {
                using T = std::decay_t<decltype(x)>;
                if constexpr (std::is_same_v<T, qir::InstAppendLiteral>) {
                    current += x.text;
                } else if constexpr (std::is_same_v<T, qir::InstPrintCurrent>) {
                    channel.emit(current);
                    ++r.outputs_emitted;
                } else if constexpr (std::is_same_v<T, qir::InstPrintLiteral>) {
                    channel.emit(x.text);
                    ++r.outputs_emitted;
                } else if constexpr (std::is_same_v<T, qir::InstHalt>) {
                    halt = true;
                }
            }, inst.data);
            if (halt) break;
        }

        r.ok = true;
        return r;
    }

} // namespace quill::backend::exec
