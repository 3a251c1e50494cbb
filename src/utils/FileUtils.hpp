// KeyRotor - File Utilities
// Owner-only file persistence for credential documents

#pragma once

#include <string>
#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

namespace keyrotor::utils {

/**
 * @brief File and directory utilities
 */
class FileUtils {
public:
    static bool fileExists(const fs::path& path);

    static std::optional<std::string> readFile(const fs::path& path);

    /**
     * @brief Create a directory tree; new directories get mode 0700
     */
    static bool createPrivateDirectories(const fs::path& path, std::string* error = nullptr);

    /**
     * @brief Replace a file's content atomically with mode 0600
     *
     * Writes a sibling temp file and renames it over the target so readers
     * never observe a partially written document.
     *
     * @param path Destination file
     * @param content New content
     * @param error Receives a description on failure (optional)
     * @return true if written
     */
    static bool writeFileSecure(const fs::path& path, const std::string& content,
                                std::string* error = nullptr);
};

} // namespace keyrotor::utils
