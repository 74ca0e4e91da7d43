// tools/quillc/include/quillc/dump/Dump.hpp
#pragma once

#include <quill/ast/Program.hpp>
#include <quill/qir/QIR.hpp>

#include <ostream>

namespace quillc::dump {

    /// @brief 분류된 statement 목록을 출력한다.
    void dump_program(const quill::ast::Program& p, std::ostream& os);

    /// @brief QIR 모듈 전체를 사람이 읽기 쉬운 형태로 출력한다.
    void dump_qir_module(const quill::qir::Module& m, std::ostream& os);

} // namespace quillc::dump
