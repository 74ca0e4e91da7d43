// tools/quillc/include/quillc/driver/Driver.hpp
#pragma once

#include <quillc/cli/Options.hpp>

#include <ostream>

namespace quillc::driver {

    /// @brief 단일 입력 파일에 대해 선택된 실행 전략을 수행한다. 종료 코드를 반환한다.
    int run(const cli::Options& opt);

    /// @brief run(opt)과 같되 프로그램 출력과 진단 출력 스트림을 지정한다.
    int run(const cli::Options& opt, std::ostream& out, std::ostream& err);

} // namespace quillc::driver
