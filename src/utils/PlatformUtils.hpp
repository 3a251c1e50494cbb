// KeyRotor - Platform Utilities
// Cross-platform system queries

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace keyrotor::utils {

/**
 * @brief Operating system type
 */
enum class OS {
    Windows,
    macOS,
    Linux,
    Unknown
};

/**
 * @brief Platform-specific utilities
 */
class PlatformUtils {
public:
    // OS detection
    static OS getOS();
    static std::string getOSName(OS os);
    static std::string getUsername();

    // Environment
    static std::optional<std::string> getEnv(const std::string& name);

    // Paths
    static std::filesystem::path getHomeDirectory();
    static std::filesystem::path getAppDataDirectory();

    /**
     * @brief Replace a leading '~' with the home directory
     */
    static std::string expandHomePath(const std::string& path);

    /**
     * @brief First candidate that exists as a regular file
     */
    static std::optional<std::filesystem::path> findExecutable(
        const std::vector<std::filesystem::path>& candidates);

    /**
     * @brief Locate a program by name on PATH
     */
    static std::optional<std::filesystem::path> findInPath(const std::string& name);

    // Signals

    /**
     * @brief Exit with 128 + signal on SIGINT/SIGTERM (and SIGBREAK on Windows).
     * The handler only calls std::_Exit, which is async-signal-safe.
     */
    static void installTerminationHandlers();
};

} // namespace keyrotor::utils
