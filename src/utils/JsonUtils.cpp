/**
 * JsonUtils.cpp
 *
 * JSON parsing and typed field access helpers.
 */

#include "JsonUtils.hpp"
#include <fstream>

namespace keyrotor::utils {

// -- Parsing --

std::optional<json> JsonUtils::parse(const std::string& str) {
    try { return json::parse(str); }
    catch (const json::exception&) { return std::nullopt; }
}

std::optional<json> JsonUtils::parseFile(const std::filesystem::path& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) return std::nullopt;
        return json::parse(file);
    } catch (const json::exception&) { return std::nullopt; }
}

// -- Safe accessors --

std::string JsonUtils::getString(const json& j, const std::string& key, const std::string& defaultValue) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return defaultValue;
}

int64_t JsonUtils::getLong(const json& j, const std::string& key, int64_t defaultValue) {
    if (j.is_object() && j.contains(key) && j[key].is_number()) return j[key].get<int64_t>();
    return defaultValue;
}

double JsonUtils::getDouble(const json& j, const std::string& key, double defaultValue) {
    if (j.is_object() && j.contains(key) && j[key].is_number()) return j[key].get<double>();
    return defaultValue;
}

bool JsonUtils::getBool(const json& j, const std::string& key, bool defaultValue) {
    if (j.is_object() && j.contains(key) && j[key].is_boolean()) return j[key].get<bool>();
    return defaultValue;
}

// -- Optional accessors --

std::optional<std::string> JsonUtils::optString(const json& j, const std::string& key) {
    if (!j.is_object() || !j.contains(key) || !j[key].is_string()) return std::nullopt;
    auto value = j[key].get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

std::optional<int64_t> JsonUtils::optLong(const json& j, const std::string& key) {
    if (!j.is_object() || !j.contains(key) || !j[key].is_number()) return std::nullopt;
    return j[key].get<int64_t>();
}

std::optional<std::vector<std::string>> JsonUtils::optStringArray(const json& j, const std::string& key) {
    if (!j.is_object() || !j.contains(key) || !j[key].is_array()) return std::nullopt;
    std::vector<std::string> values;
    for (const auto& item : j[key]) {
        if (item.is_string()) values.push_back(item.get<std::string>());
    }
    return values;
}

bool JsonUtils::isAbsentOr(const json& j, const std::string& key, json::value_t type) {
    if (!j.is_object() || !j.contains(key)) return true;
    const auto& value = j[key];
    if (type == json::value_t::number_integer || type == json::value_t::number_float) {
        return value.is_number();
    }
    return value.type() == type;
}

} // namespace keyrotor::utils
