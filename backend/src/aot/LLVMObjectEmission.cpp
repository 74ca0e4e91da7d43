// backend/src/aot/LLVMObjectEmission.cpp
#include <quill/backend/aot/LLVMIRLowering.hpp>

#include <memory>
#include <optional>
#include <string>

#ifndef QUILL_LLVM_TOOLCHAIN_FOUND
#define QUILL_LLVM_TOOLCHAIN_FOUND 0
#endif

#if QUILL_LLVM_TOOLCHAIN_FOUND
#include <llvm/ADT/SmallVector.h>
#include <llvm/AsmParser/Parser.h>
#include <llvm/Config/llvm-config.h>
#include <llvm/IR/LegacyPassManager.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/MC/TargetRegistry.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/SourceMgr.h>
#include <llvm/Support/TargetSelect.h>
#include <llvm/Support/raw_ostream.h>
#include <llvm/Target/TargetMachine.h>
#include <llvm/Target/TargetOptions.h>
#if __has_include(<llvm/TargetParser/Host.h>)
#include <llvm/TargetParser/Host.h>
#else
#include <llvm/Support/Host.h>
#endif
#if LLVM_VERSION_MAJOR < 16
#include <llvm/ADT/Optional.h>
#endif
#endif

namespace quill::backend::aot {

    namespace {

#if QUILL_LLVM_TOOLCHAIN_FOUND
#if LLVM_VERSION_MAJOR >= 18
        using CodeGenLevel = llvm::CodeGenOptLevel;
#else
        using CodeGenLevel = llvm::CodeGenOpt::Level;
#endif

        /// @brief O 레벨 숫자를 LLVM CodeGen 레벨로 변환한다.
        CodeGenLevel to_codegen_opt_level_(uint8_t opt_level) {
#if LLVM_VERSION_MAJOR >= 18
            switch (opt_level) {
                case 0: return llvm::CodeGenOptLevel::None;
                case 1: return llvm::CodeGenOptLevel::Less;
                case 2: return llvm::CodeGenOptLevel::Default;
                case 3: return llvm::CodeGenOptLevel::Aggressive;
                default: return llvm::CodeGenOptLevel::Default;
            }
#else
            switch (opt_level) {
                case 0: return llvm::CodeGenOpt::None;
                case 1: return llvm::CodeGenOpt::Less;
                case 2: return llvm::CodeGenOpt::Default;
                case 3: return llvm::CodeGenOpt::Aggressive;
                default: return llvm::CodeGenOpt::Default;
            }
#endif
        }

        /// @brief LLVM target 서브시스템을 1회 초기화한다.
        void init_llvm_targets_once_() {
            static const bool inited = [] {
                llvm::InitializeAllTargetInfos();
                llvm::InitializeAllTargets();
                llvm::InitializeAllTargetMCs();
                llvm::InitializeAllAsmParsers();
                llvm::InitializeAllAsmPrinters();
                return true;
            }();
            (void)inited;
        }

        /// @brief LLVM 파서/코드젠 오류를 문자열로 렌더링한다.
        std::string render_diag_(const llvm::SMDiagnostic& diag) {
            std::string s;
            llvm::raw_string_ostream os(s);
            diag.print("quillc", os);
            os.flush();
            return s;
        }
#endif

    } // namespace

    LLVMObjectEmissionResult emit_object_from_llvm_ir_text(
        std::string_view llvm_ir_text,
        const LLVMObjectEmissionOptions& opt
    ) {
        LLVMObjectEmissionResult out{};

#if !QUILL_LLVM_TOOLCHAIN_FOUND
        (void)llvm_ir_text;
        (void)opt;
        out.ok = false;
        out.messages.push_back(CompileMessage{
            true,
            "LLVM toolchain is not available in this build. Object emission requires linking LLVM."
        });
        return out;
#else
        init_llvm_targets_once_();

        llvm::LLVMContext context;
#if LLVM_VERSION_MAJOR < 15
        // lowering은 opaque pointer(ptr) 문법만 쓴다.
        context.enableOpaquePointers();
#endif
        llvm::SMDiagnostic smdiag;
        auto mem = llvm::MemoryBuffer::getMemBufferCopy(std::string(llvm_ir_text), "quill.qir.ll");
        auto module = llvm::parseAssembly(*mem, smdiag, context);
        if (!module) {
            out.ok = false;
            out.messages.push_back(CompileMessage{
                true,
                "failed to parse lowered LLVM-IR: " + render_diag_(smdiag)
            });
            return out;
        }

        const std::string triple =
            opt.target_triple.empty() ? llvm::sys::getDefaultTargetTriple() : opt.target_triple;
        llvm::Triple triple_obj(triple);
#if LLVM_VERSION_MAJOR >= 21
        module->setTargetTriple(triple_obj);
#else
        module->setTargetTriple(triple);
#endif

        std::string target_err;
#if LLVM_VERSION_MAJOR >= 21
        const llvm::Target* target = llvm::TargetRegistry::lookupTarget(triple_obj, target_err);
#else
        const llvm::Target* target = llvm::TargetRegistry::lookupTarget(triple, target_err);
#endif
        if (target == nullptr) {
            out.ok = false;
            out.messages.push_back(CompileMessage{
                true,
                "failed to lookup LLVM target for triple '" + triple + "': " + target_err
            });
            return out;
        }

        llvm::TargetOptions target_opt{};
        const std::string cpu = opt.cpu.empty() ? "generic" : opt.cpu;
        const auto cg_level = to_codegen_opt_level_(opt.opt_level);
#if LLVM_VERSION_MAJOR >= 16
        std::optional<llvm::Reloc::Model> reloc_model = llvm::Reloc::PIC_;
        std::optional<llvm::CodeModel::Model> code_model{};
#else
        llvm::Optional<llvm::Reloc::Model> reloc_model = llvm::Reloc::PIC_;
        llvm::Optional<llvm::CodeModel::Model> code_model{};
#endif
#if LLVM_VERSION_MAJOR >= 21
        auto tm = std::unique_ptr<llvm::TargetMachine>(target->createTargetMachine(
            triple_obj, cpu, "", target_opt, reloc_model, code_model, cg_level
        ));
#else
        auto tm = std::unique_ptr<llvm::TargetMachine>(target->createTargetMachine(
            triple, cpu, "", target_opt, reloc_model, code_model, cg_level
        ));
#endif
        if (!tm) {
            out.ok = false;
            out.messages.push_back(CompileMessage{
                true,
                "failed to create LLVM TargetMachine for triple '" + triple + "'."
            });
            return out;
        }

        module->setDataLayout(tm->createDataLayout());

        // 파일은 sink가 원자적으로 쓰므로 여기서는 메모리에만 만든다.
        llvm::SmallVector<char, 0> obj_buf;
        llvm::raw_svector_ostream obj_out(obj_buf);

        llvm::legacy::PassManager pm;
#if LLVM_VERSION_MAJOR >= 18
        const auto file_type = llvm::CodeGenFileType::ObjectFile;
#else
        const auto file_type = llvm::CGFT_ObjectFile;
#endif
        if (tm->addPassesToEmitFile(pm, obj_out, nullptr, file_type)) {
            out.ok = false;
            out.messages.push_back(CompileMessage{
                true,
                "LLVM target machine does not support object emission for triple '" + triple + "'."
            });
            return out;
        }

        pm.run(*module);

        out.ok = true;
        out.object_bytes.assign(obj_buf.data(), obj_buf.size());
        out.messages.push_back(CompileMessage{
            false,
            "emitted " + std::to_string(out.object_bytes.size()) + " bytes of object code for " + triple
        });
        return out;
#endif
    }

} // namespace quill::backend::aot
