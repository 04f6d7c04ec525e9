#include "util/FileLock.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace proclient {

Expected<std::unique_ptr<FileLock>> FileLock::acquire(const fs::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
    if (ec) return Error{ErrorCode::IoError, "Failed to create " + path.parent_path().string() + ": " + ec.message()};

    int fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "Failed to open lock file " + path.string() + ": " + std::strerror(errno)};
    }
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) return Error{ErrorCode::LockHeld, "lock held: " + path.string()};
        return Error{ErrorCode::IoError, "Failed to lock " + path.string() + ": " + std::strerror(err)};
    }
    return std::unique_ptr<FileLock>(new FileLock(fd, path));
}

FileLock::~FileLock() {
    if (fd >= 0) {
        (void)::flock(fd, LOCK_UN);
        ::close(fd);
    }
}

}
