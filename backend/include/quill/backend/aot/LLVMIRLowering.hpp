// backend/include/quill/backend/aot/LLVMIRLowering.hpp
#pragma once

#include <quill/backend/Backend.hpp>
#include <quill/qir/QIR.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace quill::backend::aot {

    /// @brief QIR -> LLVM-IR 텍스트 lowering 옵션.
    struct LLVMIRLoweringOptions {
        std::string module_name = "quill.qir";
        std::string target_triple{};   // 비어 있으면 triple 줄을 생략한다
    };

    /// @brief QIR -> LLVM-IR 텍스트 lowering 결과.
    struct LLVMIRLoweringResult {
        bool ok = false;
        std::string llvm_ir{};
        std::vector<CompileMessage> messages{};
    };

    /// @brief LLVM API 기반 object emission 옵션.
    struct LLVMObjectEmissionOptions {
        std::string target_triple{};
        std::string cpu{};
        uint8_t opt_level = 0;
    };

    /// @brief LLVM API 기반 object emission 결과. object는 메모리에 만든다.
    struct LLVMObjectEmissionResult {
        bool ok = false;
        std::string object_bytes{};
        std::vector<CompileMessage> messages{};
    };

    /// @brief QIR 모듈을 main 하나짜리 LLVM-IR(text)로 낮춘다.
    LLVMIRLoweringResult lower_qir_to_llvm_ir_text(
        const qir::Module& m,
        const LLVMIRLoweringOptions& opt
    );

    /// @brief LLVM-IR 텍스트를 LLVM API로 object 바이트열로 방출한다.
    LLVMObjectEmissionResult emit_object_from_llvm_ir_text(
        std::string_view llvm_ir_text,
        const LLVMObjectEmissionOptions& opt
    );

} // namespace quill::backend::aot
