// frontend/src/qir/qir_verify.cpp
#include <quill/qir/Verify.hpp>

#include <sstream>


namespace quill::qir {

    std::vector<VerifyError> verify(const Module& m, VerifyMode mode) {
        std::vector<VerifyError> errs;

        auto err = [&](size_t idx, const std::string& msg) {
            std::ostringstream oss;
            oss << "inst #" << idx;
            if (m.insts[idx].source_line != 0) oss << " (line " << m.insts[idx].source_line << ")";
            oss << ": " << msg;
            errs.push_back(VerifyError{oss.str()});
        };

        for (size_t i = 0; i < m.insts.size(); ++i) {
            const auto& d = m.insts[i].data;

            if (std::holds_alternative<InstHalt>(d) && i + 1 != m.insts.size()) {
                err(i, "halt must be the last instruction");
            }

            if (mode == VerifyMode::kOptimized) {
                if (std::holds_alternative<InstAppendLiteral>(d)) {
                    err(i, "optimized module must not contain append");
                } else if (std::holds_alternative<InstPrintCurrent>(d)) {
                    err(i, "optimized module must not contain print (use printlit)");
                }
            }
        }

        return errs;
    }

} // namespace quill::qir
