// frontend/include/quill/diag/DiagCode.hpp
#pragma once
#include <cstdint>


namespace quill::diag {

    enum class Severity : uint8_t {
        kError,
        kWarning,
        kFatal,
    };

    enum class Language : uint8_t {
        kEn,
        kKo,
    };

    enum class Code : uint16_t {
        // ---- source / classify ----
        kInvalidStatement,      // args[0]=line. 't'로 시작하는 줄
        kLineEndingMismatch,    // args[0]=line. CRLF 분할 모드에서 단독 LF 발견 (warning)

        // ---- optimizer ----
        kDeadTrailingEmit,      // args[0]=line. 마지막 print 이후의 emit (warning)

        // ---- QIR text ----
        kQirUnknownOpcode,      // args[0]=opcode
        kQirMalformedLiteral,   // args[0]=reason
        kQirMissingHalt,        // (no args)
        kQirTrailingAfterHalt,  // (no args)
    };

} // namespace quill::diag
