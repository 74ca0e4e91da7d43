// frontend/src/os/file.cpp
#include <quill/os/File.hpp>

#include <cstdio>

#if defined(_WIN32)
    #include <windows.h>
    #include <fileapi.h>
#else
    #include <cerrno>
    #include <cstring>
    #include <cstdlib>
    #include <limits.h>

    #ifndef PATH_MAX
        #define PATH_MAX 4096
    #endif
#endif

namespace quill {

    bool open_file(const std::string& path, std::string& out_content, std::string& out_error) {
        out_error.clear();
        out_content.clear();

        std::FILE* fp = std::fopen(path.c_str(), "rb");
        if (!fp) {
        #if defined(_WIN32)
            out_error = "cannot open file '" + path + "'";
        #else
            out_error = "cannot open file '" + path + "': " + std::strerror(errno);
        #endif
            return false;
        }

        std::fseek(fp, 0, SEEK_END);
        long sz = std::ftell(fp);
        std::fseek(fp, 0, SEEK_SET);

        if (sz < 0) {
            std::fclose(fp);
            out_error = "cannot determine size of '" + path + "'";
            return false;
        }

        out_content.resize(static_cast<size_t>(sz));
        size_t n = std::fread(out_content.data(), 1, out_content.size(), fp);
        std::fclose(fp);

        if (n != out_content.size()) {
            out_error = "short read from '" + path + "'";
            return false;
        }

        return true;
    }

    std::string normalize_path(const std::string& path) {
    #if defined(_WIN32)
        char buf[MAX_PATH];
        DWORD n = GetFullPathNameA(path.c_str(), MAX_PATH, buf, nullptr);
        if (n == 0 || n >= MAX_PATH) return path;
        return std::string(buf);
    #else
        // realpath는 존재하지 않는 경로에서 실패한다.
        char buf[PATH_MAX];
        if (::realpath(path.c_str(), buf) != nullptr) {
            return std::string(buf);
        }
        return path;
    #endif
    }

} // namespace quill
