// KeyRotor - String Utilities
// String manipulation helpers

#pragma once

#include <string>

namespace keyrotor::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Search
    static bool contains(const std::string& str, const std::string& substr);
    static bool startsWith(const std::string& str, const std::string& prefix);
    static bool endsWith(const std::string& str, const std::string& suffix);

    static bool isBlank(const std::string& str);

    /**
     * @brief Escape for interpolation inside a PowerShell double-quoted string
     *
     * Backtick is PowerShell's escape character and is doubled first;
     * '$' and '"' are then prefixed with a backtick.
     */
    static std::string escapePowerShell(const std::string& str);
};

} // namespace keyrotor::utils
