// frontend/include/quill/os/File.hpp
#pragma once
#include <string>


namespace quill {

    /// @brief 파일 전체를 바이트 그대로 읽는다 (binary 모드).
    /// @details 줄바꿈은 건드리지 않는다. 분할 규칙은 text::split_lines가 정한다.
    bool open_file(const std::string& path, std::string& out_content, std::string& out_error);

    /// @brief 입력 경로를 표시용으로 정규화한다 (존재하면 절대 경로).
    std::string normalize_path(const std::string& path);

} // namespace quill
