// frontend/include/quill/lex/Lexer.hpp
#pragma once
#include <quill/ast/Program.hpp>
#include <quill/diag/Diagnostic.hpp>
#include <quill/diag/Errors.hpp>
#include <quill/text/LineSplit.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace quill {

    /// @brief 소스 텍스트를 논리적 줄로 나누고 줄마다 statement로 분류한다.
    /// @details classify_all()은 실패하지 않는다. invalid 줄도 kInvalid statement로
    ///          Program에 남기고, 실패 정책은 각 백엔드가 정한다.
    class Lexer {
    public:
        Lexer(std::string_view source, std::uint32_t file_id, text::NewlineMode mode)
            : Lexer(source, file_id, mode, nullptr) {}

        Lexer(std::string_view source, std::uint32_t file_id, text::NewlineMode mode, diag::Bag* diags);

        ast::Program classify_all();

        /// @brief 첫 글자만 보고 줄을 분류한다 (순수 함수).
        static syntax::StmtKind classify_line(std::string_view line);

    private:
        ast::Statement make_stmt_(const text::LogicalLine& ln) const;

        void report_invalid_(const ast::Statement& st);
        void report_line_ending_mismatch_(const text::LogicalLine& ln);

        std::string_view source_;
        uint32_t file_id_ = 0;
        text::NewlineMode mode_ = text::NewlineMode::kUniversal;

        diag::Bag* diags_ = nullptr;
    };

    struct ClassifyOptions {
        text::NewlineMode newline = text::NewlineMode::kUniversal;
        uint32_t file_id = 0;
    };

    /// @brief 엄격한 분류 결과. 실패 시 program은 비어 있다.
    struct ClassifyResult {
        bool ok = false;
        ast::Program program{};
        std::optional<InvalidStatementError> error{};
    };

    /// @brief source 전체를 분류하고, 첫 invalid 줄에서 실패한다.
    ClassifyResult classify(std::string_view source, const ClassifyOptions& opt = {}, diag::Bag* diags = nullptr);

    /// @brief 이미 나뉜 줄 목록을 분류하고, 첫 invalid 줄에서 실패한다.
    ClassifyResult classify(const std::vector<std::string>& lines);

    /// @brief 이미 나뉜 줄 목록을 실패 없이 Program으로 만든다 (invalid 줄 포함).
    ast::Program program_from_lines(const std::vector<std::string>& lines);

} // namespace quill
