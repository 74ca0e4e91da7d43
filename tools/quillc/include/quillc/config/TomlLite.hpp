#pragma once

#include <quillc/config/Config.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace quillc::config::toml_lite {

/// source_name은 오류/경고 메시지의 위치 접두어로만 쓰인다.
bool parse_text(std::string_view text,
                std::string_view source_name,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err);

/// 파일이 없으면 빈 맵으로 성공한다.
bool parse_file(const std::filesystem::path& path,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err);

} // namespace quillc::config::toml_lite
