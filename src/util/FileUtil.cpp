#include "util/FileUtil.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace proclient::FileUtil {

Expected<std::string> readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return Error{ErrorCode::IoError, "Failed to open " + path.string()};
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

Expected<void> writeFileAtomic(const fs::path& path, const std::string& content, unsigned mode) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) return Error{ErrorCode::IoError, "Failed to create " + path.parent_path().string() + ": " + ec.message()};
    }

    std::string tmpl = (path.parent_path() / ".tmp.XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    int fd = ::mkstemp(buf.data());
    if (fd < 0) return Error{ErrorCode::IoError, "Failed to create temp file for " + path.string() + ": " + std::strerror(errno)};

    const char* p = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string why = std::strerror(errno);
            ::close(fd);
            ::unlink(buf.data());
            return Error{ErrorCode::IoError, "Failed to write " + path.string() + ": " + why};
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    if (::fchmod(fd, static_cast<mode_t>(mode)) != 0 || ::fsync(fd) != 0) {
        std::string why = std::strerror(errno);
        ::close(fd);
        ::unlink(buf.data());
        return Error{ErrorCode::IoError, "Failed to finalize " + path.string() + ": " + why};
    }
    ::close(fd);

    if (::rename(buf.data(), path.c_str()) != 0) {
        std::string why = std::strerror(errno);
        ::unlink(buf.data());
        return Error{ErrorCode::IoError, "Failed to replace " + path.string() + ": " + why};
    }
    return {};
}

Expected<void> removeFile(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) return Error{ErrorCode::IoError, "Failed to remove " + path.string() + ": " + ec.message()};
    return {};
}

}
