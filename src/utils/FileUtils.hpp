// FetchKit - File Utilities
// File system operations used by transfer workers and reports

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <optional>
#include <cstdint>

namespace fs = std::filesystem;

namespace fetchkit::utils {

/**
 * @brief File and directory utilities
 *
 * All functions report failure through their return value and never throw.
 */
class FileUtils {
public:
    // Directory operations
    static bool createDirectories(const fs::path& path);
    static bool createParentDirectories(const fs::path& path);

    // File operations
    static bool fileExists(const fs::path& path);

    /**
     * Remove a file; a file that does not exist counts as removed
     */
    static bool deleteFile(const fs::path& path);

    /**
     * Size of a regular file
     * @return -1 if the file does not exist or cannot be queried
     */
    static int64_t getFileSize(const fs::path& path);

    // Read/Write operations
    static std::optional<std::string> readFile(const fs::path& path);
    static bool writeFile(const fs::path& path, const std::string& content);

    // Temporary files
    static fs::path createTempDirectory(const std::string& prefix = "fetchkit_");
};

} // namespace fetchkit::utils
