// backend/src/aot/AOTBackend.cpp
#include <quill/backend/aot/AOTBackend.hpp>
#include <quill/backend/aot/LLVMIRLowering.hpp>
#include <quill/qir/Passes.hpp>
#include <quill/qir/Verify.hpp>

namespace quill::backend::aot {

    namespace {

        void append_messages_(RunResult& r, const std::vector<CompileMessage>& msgs) {
            r.messages.insert(r.messages.end(), msgs.begin(), msgs.end());
        }

        /// @brief sink 실패를 결과에 옮긴다. invalid와는 섞지 않는다.
        bool persist_or_fail_(RunResult& r, const io::PersistResult& pr) {
            if (pr.ok) return true;
            r.ok = false;
            r.persist_error = pr.error;
            r.messages.push_back(CompileMessage{
                true,
                pr.error ? describe(*pr.error) : std::string("persist failed")
            });
            return false;
        }

        const char* emit_kind_name_(EmitKind k) {
            switch (k) {
                case EmitKind::kQir: return "QIR";
                case EmitKind::kLlvmIr: return "LLVM-IR";
                case EmitKind::kObject: return "object";
            }
            return "?";
        }

    } // namespace

    /// @brief AOT 백엔드 종류를 반환한다.
    BackendKind AOTBackend::kind() const {
        return BackendKind::kAot;
    }

    /// @brief build -> verify -> (lower) -> persist 순서로 진행한다.
    RunResult AOTBackend::run(
        const ast::Program& program,
        const RunContext& ctx,
        const CompileOptions& opt
    ) {
        RunResult r{};
        if (ctx.sink == nullptr) {
            r.messages.push_back(CompileMessage{true, "AOT backend requires an execution sink."});
            return r;
        }

        qir::OptimizeOptions oo{};
        oo.warn_dead_emit = opt.warn_dead_emit;
        qir::BuildResult built = opt.optimize
            ? qir::build_optimized_module(program, oo, ctx.diags)
            : qir::build_module(program);

        if (!built.ok) {
            // 실패한 빌드는 sink에 닿지 않는다.
            r.ok = false;
            r.invalid = built.error;
            if (built.error) r.messages.push_back(CompileMessage{true, describe(*built.error)});
            return r;
        }

        const auto verrs = qir::verify(built.mod, opt.optimize ? qir::VerifyMode::kOptimized : qir::VerifyMode::kAny);
        if (!verrs.empty()) {
            r.ok = false;
            for (const auto& e : verrs) {
                r.messages.push_back(CompileMessage{true, "QIR verify failed: " + e.msg});
            }
            return r;
        }

        if (opt.optimize) {
            const auto& st = built.mod.opt_stats;
            r.messages.push_back(CompileMessage{
                false,
                "optimized: folded " + std::to_string(st.emits_folded) +
                " emit(s), eliminated " + std::to_string(st.dead_emits_eliminated) +
                " dead emit(s), " + std::to_string(built.mod.insts.size()) + " instruction(s)"
            });
        }

        switch (opt.emit) {
            case EmitKind::kQir: {
                if (!persist_or_fail_(r, ctx.sink->persist(built.mod))) return r;
                break;
            }

            case EmitKind::kLlvmIr:
            case EmitKind::kObject: {
                LLVMIRLoweringOptions lo{};
                lo.target_triple = opt.target_triple;
                auto lowered = lower_qir_to_llvm_ir_text(built.mod, lo);
                append_messages_(r, lowered.messages);
                if (!lowered.ok) {
                    r.ok = false;
                    return r;
                }

                if (opt.emit == EmitKind::kLlvmIr) {
                    if (!persist_or_fail_(r, ctx.sink->persist_bytes(lowered.llvm_ir))) return r;
                    break;
                }

                LLVMObjectEmissionOptions eo{};
                eo.target_triple = opt.target_triple;
                eo.cpu = opt.cpu;
                eo.opt_level = opt.opt_level;
                auto obj = emit_object_from_llvm_ir_text(lowered.llvm_ir, eo);
                append_messages_(r, obj.messages);
                if (!obj.ok) {
                    r.ok = false;
                    return r;
                }
                if (!persist_or_fail_(r, ctx.sink->persist_bytes(obj.object_bytes))) return r;
                break;
            }
        }

        r.ok = true;
        r.messages.push_back(CompileMessage{
            false,
            std::string("wrote ") + emit_kind_name_(opt.emit) + " to " + ctx.sink->describe_target()
        });
        return r;
    }

} // namespace quill::backend::aot
