#pragma once

#include <filesystem>
#include <string>

#include "util/Expected.hpp"

namespace proclient {

/**
 * @brief Small file helpers shared by the state store, contract source and
 * platform detection.
 */
namespace FileUtil {

/// Read whole file into a string
Expected<std::string> readFile(const std::filesystem::path& path);

/**
 * @brief Replace a file's content atomically
 *
 * Writes to a temporary file in the same directory, applies @p mode and
 * renames over @p path. Parent directories are created as needed.
 */
Expected<void> writeFileAtomic(const std::filesystem::path& path, const std::string& content, unsigned mode = 0644);

/// Remove a file; a missing file is not an error
Expected<void> removeFile(const std::filesystem::path& path);

}

}
