// backend/src/aot/LLVMIRLowering.cpp
#include <quill/backend/aot/LLVMIRLowering.hpp>
#include <quill/qir/Verify.hpp>

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace quill::backend::aot {

    namespace {

        struct TextConstantInfo {
            std::string symbol{};
            uint64_t len = 0;
        };

        /// @brief 모듈에서 실제로 필요한 런타임 helper 집합.
        struct HelperUse {
            bool append = false;
            bool print_current = false;
            bool write_line = false;
        };

        /// @brief raw bytes를 LLVM c"..." 상수 리터럴 본문으로 이스케이프한다.
        std::string llvm_escape_c_bytes_(std::string_view bytes) {
            static constexpr char kHex[] = "0123456789ABCDEF";
            std::string out;
            out.reserve(bytes.size() + 8);
            for (unsigned char b : bytes) {
                if (b >= 0x20 && b <= 0x7E && b != '\\' && b != '"') {
                    out.push_back(static_cast<char>(b));
                    continue;
                }
                out.push_back('\\');
                out.push_back(kHex[(b >> 4) & 0x0F]);
                out.push_back(kHex[b & 0x0F]);
            }
            return out;
        }

        /// @brief halt 이전의 명령 수. halt가 없으면 전체.
        size_t live_inst_count_(const qir::Module& m) {
            for (size_t i = 0; i < m.insts.size(); ++i) {
                if (std::holds_alternative<qir::InstHalt>(m.insts[i].data)) return i;
            }
            return m.insts.size();
        }

        /// @brief 같은 바이트열은 하나의 상수 심볼을 공유한다.
        class TextConstantTable {
        public:
            const TextConstantInfo& intern(const std::string& bytes) {
                auto it = by_text_.find(bytes);
                if (it != by_text_.end()) return order_[it->second].second;

                TextConstantInfo info{};
                info.symbol = ".quill_text." + std::to_string(order_.size());
                info.len = static_cast<uint64_t>(bytes.size());
                by_text_.emplace(bytes, order_.size());
                order_.emplace_back(bytes, info);
                return order_.back().second;
            }

            void emit(std::ostringstream& os) const {
                for (const auto& [bytes, info] : order_) {
                    os << "@" << info.symbol
                       << " = private unnamed_addr constant ["
                       << info.len
                       << " x i8] c\""
                       << llvm_escape_c_bytes_(bytes)
                       << "\", align 1\n";
                }
                if (!order_.empty()) os << "\n";
            }

        private:
            std::unordered_map<std::string, size_t> by_text_;
            std::vector<std::pair<std::string, TextConstantInfo>> order_;
        };

        void emit_append_helper_(std::ostringstream& os) {
            os << "define internal void @quill_append(ptr %buf, ptr %src, i64 %n) {\n"
               << "entry:\n"
               << "  %data.p = getelementptr inbounds %quill.buf, ptr %buf, i32 0, i32 0\n"
               << "  %len.p = getelementptr inbounds %quill.buf, ptr %buf, i32 0, i32 1\n"
               << "  %data = load ptr, ptr %data.p, align 8\n"
               << "  %len = load i64, ptr %len.p, align 8\n"
               << "  %new.len = add i64 %len, %n\n"
               << "  %new.data = call ptr @realloc(ptr %data, i64 %new.len)\n"
               << "  %oom = icmp eq ptr %new.data, null\n"
               << "  br i1 %oom, label %fail, label %copy\n"
               << "fail:\n"
               << "  call void @abort()\n"
               << "  unreachable\n"
               << "copy:\n"
               << "  %dst = getelementptr inbounds i8, ptr %new.data, i64 %len\n"
               << "  %ignored = call ptr @memcpy(ptr %dst, ptr %src, i64 %n)\n"
               << "  store ptr %new.data, ptr %data.p, align 8\n"
               << "  store i64 %new.len, ptr %len.p, align 8\n"
               << "  ret void\n"
               << "}\n\n";
        }

        void emit_write_line_helper_(std::ostringstream& os) {
            os << "define internal void @quill_write_line(ptr %p, i64 %n) {\n"
               << "entry:\n"
               << "  %w0 = call i64 @write(i32 1, ptr %p, i64 %n)\n"
               << "  %w1 = call i64 @write(i32 1, ptr @.quill_newline, i64 1)\n"
               << "  ret void\n"
               << "}\n\n";
        }

        void emit_print_current_helper_(std::ostringstream& os) {
            os << "define internal void @quill_print_current(ptr %buf) {\n"
               << "entry:\n"
               << "  %data.p = getelementptr inbounds %quill.buf, ptr %buf, i32 0, i32 0\n"
               << "  %len.p = getelementptr inbounds %quill.buf, ptr %buf, i32 0, i32 1\n"
               << "  %data = load ptr, ptr %data.p, align 8\n"
               << "  %len = load i64, ptr %len.p, align 8\n"
               << "  call void @quill_write_line(ptr %data, i64 %len)\n"
               << "  ret void\n"
               << "}\n\n";
        }

    } // namespace

    LLVMIRLoweringResult lower_qir_to_llvm_ir_text(
        const qir::Module& m,
        const LLVMIRLoweringOptions& opt
    ) {
        LLVMIRLoweringResult out{};

        const auto verrs = qir::verify(m, m.optimized ? qir::VerifyMode::kOptimized : qir::VerifyMode::kAny);
        if (!verrs.empty()) {
            out.ok = false;
            for (const auto& e : verrs) {
                out.messages.push_back(CompileMessage{true, "QIR verify failed: " + e.msg});
            }
            return out;
        }

        const size_t live = live_inst_count_(m);

        HelperUse use{};
        TextConstantTable consts{};
        for (size_t i = 0; i < live; ++i) {
            const auto& d = m.insts[i].data;
            if (const auto* a = std::get_if<qir::InstAppendLiteral>(&d)) {
                if (!a->text.empty()) {
                    use.append = true;
                    consts.intern(a->text);
                }
            } else if (std::holds_alternative<qir::InstPrintCurrent>(d)) {
                use.print_current = true;
                use.write_line = true;
            } else if (const auto* p = std::get_if<qir::InstPrintLiteral>(&d)) {
                use.write_line = true;
                consts.intern(p->text);
            }
        }
        const bool needs_buffer = use.append || use.print_current;

        std::ostringstream os;
        os << "; ModuleID = '" << opt.module_name << "'\n";
        os << "source_filename = \"" << opt.module_name << "\"\n";
        if (!opt.target_triple.empty()) {
            os << "target triple = \"" << opt.target_triple << "\"\n";
        }
        os << "\n";

        if (needs_buffer) {
            // { data, len }
            os << "%quill.buf = type { ptr, i64 }\n\n";
        }

        consts.emit(os);
        if (use.write_line) {
            os << "@.quill_newline = private unnamed_addr constant [1 x i8] c\"\\0A\", align 1\n\n";
        }

        if (use.write_line) os << "declare i64 @write(i32, ptr, i64)\n";
        if (use.append) {
            os << "declare ptr @realloc(ptr, i64)\n";
            os << "declare ptr @memcpy(ptr, ptr, i64)\n";
            os << "declare void @abort()\n";
        }
        if (needs_buffer) os << "declare void @free(ptr)\n";
        os << "\n";

        if (use.write_line) emit_write_line_helper_(os);
        if (use.append) emit_append_helper_(os);
        if (use.print_current) emit_print_current_helper_(os);

        os << "define i32 @main() {\n";
        os << "entry:\n";
        if (needs_buffer) {
            os << "  %buf = alloca %quill.buf, align 8\n";
            os << "  store %quill.buf zeroinitializer, ptr %buf, align 8\n";
        }

        for (size_t i = 0; i < live; ++i) {
            const auto& inst = m.insts[i];
            if (inst.source_line != 0) {
                os << "  ; line " << inst.source_line << "\n";
            }

            if (const auto* a = std::get_if<qir::InstAppendLiteral>(&inst.data)) {
                if (a->text.empty()) continue;
                const auto& c = consts.intern(a->text);
                os << "  call void @quill_append(ptr %buf, ptr @" << c.symbol << ", i64 " << c.len << ")\n";
            } else if (std::holds_alternative<qir::InstPrintCurrent>(inst.data)) {
                os << "  call void @quill_print_current(ptr %buf)\n";
            } else if (const auto* p = std::get_if<qir::InstPrintLiteral>(&inst.data)) {
                const auto& c = consts.intern(p->text);
                os << "  call void @quill_write_line(ptr @" << c.symbol << ", i64 " << c.len << ")\n";
            }
        }

        if (needs_buffer) {
            os << "  %final.data.p = getelementptr inbounds %quill.buf, ptr %buf, i32 0, i32 0\n";
            os << "  %final.data = load ptr, ptr %final.data.p, align 8\n";
            os << "  call void @free(ptr %final.data)\n";
        }
        os << "  ret i32 0\n";
        os << "}\n";

        out.ok = true;
        out.llvm_ir = os.str();
        return out;
    }

} // namespace quill::backend::aot
