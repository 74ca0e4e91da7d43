// frontend/include/quill/qir/QIR.hpp
#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>


namespace quill::qir {

    // ----------------------
    // Inst payloads (v1)
    // ----------------------
    struct InstAppendLiteral { std::string text; };  // current += text
    struct InstPrintCurrent  { };                    // output(current)
    struct InstPrintLiteral  { std::string text; };  // output(text), current는 건드리지 않는다
    struct InstHalt          { };                    // 실행 종료

    using InstData = std::variant<
        InstAppendLiteral,
        InstPrintCurrent,
        InstPrintLiteral,
        InstHalt
    >;

    // ----------------------
    // Inst
    // ----------------------
    struct Inst {
        InstData data{};
        uint32_t source_line = 0; // 0 = 소스 위치 없음 (예: 텍스트에서 읽은 명령)
    };

    /// @brief 최적화 빌더가 누적하는 통계.
    struct OptStats {
        uint32_t emits_folded = 0;
        uint32_t dead_emits_eliminated = 0;
        uint32_t comments_skipped = 0;
    };

    // ----------------------
    // Module container
    // ----------------------
    struct Module {
        std::vector<Inst> insts;
        bool optimized = false;
        OptStats opt_stats{};

        void add_inst(const Inst& i) {
            insts.push_back(i);
        }

        uint32_t count_prints() const {
            uint32_t n = 0;
            for (const auto& i : insts) {
                if (std::holds_alternative<InstPrintCurrent>(i.data) ||
                    std::holds_alternative<InstPrintLiteral>(i.data)) {
                    ++n;
                }
            }
            return n;
        }
    };

    inline const char* opcode_name(const InstData& d) {
        switch (d.index()) {
            case 0: return "append";
            case 1: return "print";
            case 2: return "printlit";
            case 3: return "halt";
            default: return "?";
        }
    }

} // namespace quill::qir
