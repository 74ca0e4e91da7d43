// frontend/include/quill/ast/Program.hpp
#pragma once
#include <quill/syntax/StmtKind.hpp>
#include <quill/text/Span.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>


namespace quill::ast {

    /// @brief 소스 한 줄에 대응하는 statement.
    struct Statement {
        syntax::StmtKind kind = syntax::StmtKind::kEmit;
        std::string payload{};       // kEmit 전용 (빈 문자열 허용)
        uint32_t source_line = 1;    // 1-based
        Span span{};
    };

    /// @brief 분류가 끝난 statement 시퀀스. 생성 이후에는 읽기 전용이다.
    class Program {
    public:
        Program() = default;
        explicit Program(std::vector<Statement> stmts) : stmts_(std::move(stmts)) {}

        const std::vector<Statement>& stmts() const { return stmts_; }

        size_t size() const { return stmts_.size(); }
        bool empty() const  { return stmts_.empty(); }

        const Statement& operator[](size_t i) const { return stmts_[i]; }

        auto begin() const { return stmts_.cbegin(); }
        auto end() const   { return stmts_.cend(); }

        uint32_t count(syntax::StmtKind k) const {
            uint32_t n = 0;
            for (const auto& s : stmts_) {
                if (s.kind == k) ++n;
            }
            return n;
        }

        /// @brief 첫 invalid statement의 인덱스. 없으면 size().
        size_t first_invalid_index() const {
            for (size_t i = 0; i < stmts_.size(); ++i) {
                if (stmts_[i].kind == syntax::StmtKind::kInvalid) return i;
            }
            return stmts_.size();
        }

    private:
        std::vector<Statement> stmts_;
    };

} // namespace quill::ast
