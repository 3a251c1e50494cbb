// KeyRotor - JSON Utilities
// JSON parsing and typed field access helpers

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace keyrotor::utils {

using json = nlohmann::json;

/**
 * @brief JSON utility functions
 */
class JsonUtils {
public:
    // Parsing (nullopt on syntax errors)
    static std::optional<json> parse(const std::string& str);
    static std::optional<json> parseFile(const std::filesystem::path& path);

    // Safe accessors, default when missing or mistyped
    static std::string getString(const json& j, const std::string& key, const std::string& defaultValue = "");
    static int64_t getLong(const json& j, const std::string& key, int64_t defaultValue = 0);
    static double getDouble(const json& j, const std::string& key, double defaultValue = 0.0);
    static bool getBool(const json& j, const std::string& key, bool defaultValue = false);

    // Optional accessors: nullopt when missing, null, mistyped or (for strings) empty
    static std::optional<std::string> optString(const json& j, const std::string& key);
    static std::optional<int64_t> optLong(const json& j, const std::string& key);
    static std::optional<std::vector<std::string>> optStringArray(const json& j, const std::string& key);

    /**
     * @brief true when the key is absent or holds a value of the given type
     */
    static bool isAbsentOr(const json& j, const std::string& key, json::value_t type);
};

} // namespace keyrotor::utils
