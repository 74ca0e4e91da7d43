// backend/src/io/ExecutionSink.cpp
#include <quill/backend/io/ExecutionSink.hpp>
#include <quill/qir/Text.hpp>

#include <atomic>
#include <cstdint>
#include <fstream>
#include <string>
#include <system_error>

#if defined(_WIN32)
#include <process.h>
#else
#include <unistd.h>
#endif


namespace quill::backend::io {

    PersistResult ExecutionSink::persist(const qir::Module& m) {
        return persist_bytes(qir::print_text(m));
    }

    namespace {

        PersistResult fail_(const std::filesystem::path& path, std::string reason) {
            return PersistResult{false, PersistenceError{path.string(), std::move(reason)}};
        }

        /// @brief 같은 디렉터리 안에서 겹치지 않는 임시 파일 경로.
        std::filesystem::path temp_path_for_(const std::filesystem::path& path) {
            static std::atomic<uint64_t> counter{0};
#if defined(_WIN32)
            const long pid = static_cast<long>(::_getpid());
#else
            const long pid = static_cast<long>(::getpid());
#endif
            return path.string() + ".tmp." + std::to_string(pid) + "." + std::to_string(counter.fetch_add(1));
        }

    } // namespace

    PersistResult FileSink::persist_bytes(std::string_view bytes) {
        if (path_.empty()) {
            return fail_(path_, "empty output path");
        }

        std::error_code ec{};
        // 기존 대상은 일반 파일만 교체한다.
        const auto st = std::filesystem::status(path_, ec);
        if (!ec && std::filesystem::exists(st) && !std::filesystem::is_regular_file(st)) {
            return fail_(path_, "output path exists and is not a regular file");
        }
        ec.clear();

        if (path_.has_parent_path()) {
            std::filesystem::create_directories(path_.parent_path(), ec);
            if (ec) {
                return fail_(path_, "failed to create output directory: " + path_.parent_path().string());
            }
        }

        // 같은 디렉터리의 임시 파일에 전부 쓴 뒤 rename한다.
        const std::filesystem::path tmp = temp_path_for_(path_);
        {
            std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
            if (!ofs) {
                return fail_(path_, "failed to open temporary file for write: " + tmp.string());
            }
            ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            ofs.flush();
            if (!ofs.good()) {
                ofs.close();
                std::filesystem::remove(tmp, ec);
                return fail_(path_, "failed to write temporary file: " + tmp.string());
            }
        }

        std::filesystem::rename(tmp, path_, ec);
        if (ec) {
            std::error_code ignore{};
            std::filesystem::remove(tmp, ignore);
            return fail_(path_, "failed to move temporary file to final path: " + ec.message());
        }

        return PersistResult{true, std::nullopt};
    }

} // namespace quill::backend::io
