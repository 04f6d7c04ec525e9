#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include "util/Expected.hpp"

namespace proclient {

/**
 * @brief Exclusive advisory lock on a file (flock), released on destruction
 *
 * Non-blocking: acquire() fails with LockHeld if another process owns it.
 */
class FileLock {
public:
    ~FileLock();
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    static Expected<std::unique_ptr<FileLock>> acquire(const std::filesystem::path& path);

    const std::filesystem::path& path() const { return lockPath; }

private:
    FileLock(int fd, std::filesystem::path path) : fd(fd), lockPath(std::move(path)) {}

    int fd{-1};
    std::filesystem::path lockPath;
};

}
