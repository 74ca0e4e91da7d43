// frontend/include/quill/diag/Errors.hpp
#pragma once
#include <quill/text/Span.hpp>

#include <cstdint>
#include <string>


namespace quill {

    /// @brief 예약 마커('t')로 시작하는 statement를 만났을 때의 실패.
    struct InvalidStatementError {
        uint32_t source_line = 0;   // 1-based
        Span span{};
    };

    /// @brief 출력 프로그램을 영속화(파일 쓰기)하지 못했을 때의 실패.
    /// @details InvalidStatementError와 절대 섞지 않는다.
    struct PersistenceError {
        std::string path{};
        std::string reason{};
    };

    inline std::string describe(const InvalidStatementError& e) {
        return "invalid statement at line " + std::to_string(e.source_line);
    }

    inline std::string describe(const PersistenceError& e) {
        if (e.path.empty()) return "persist failed: " + e.reason;
        return "persist failed for '" + e.path + "': " + e.reason;
    }

} // namespace quill
