/**
 * CredentialLocator.cpp
 */

#include "CredentialLocator.hpp"
#include "../../utils/HashUtils.hpp"
#include "../../utils/PlatformUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <regex>

namespace keyrotor::core::auth {

using utils::PlatformUtils;
using utils::StringUtils;

std::string CredentialLocator::normalizeConfigDir(const std::string& configDir) {
    std::string trimmed = StringUtils::trim(configDir);
    if (trimmed.empty()) {
        return "";
    }
    return PlatformUtils::expandHomePath(trimmed);
}

std::string CredentialLocator::configDirHash(const std::string& configDir) {
    std::string normalized = normalizeConfigDir(configDir);
    if (normalized.empty()) {
        return "";
    }
    return utils::HashUtils::shortSha256(normalized, 8);
}

std::string CredentialLocator::keychainServiceName(const std::string& configDir) {
    std::string hash = configDirHash(configDir);
    if (hash.empty()) {
        return SERVICE_PREFIX;
    }
    return std::string(SERVICE_PREFIX) + "-" + hash;
}

std::string CredentialLocator::secretServiceAttribute(const std::string& configDir) {
    std::string hash = configDirHash(configDir);
    if (hash.empty()) {
        return SECRET_SERVICE_APPLICATION;
    }
    return std::string(SECRET_SERVICE_APPLICATION) + "-" + hash;
}

std::filesystem::path CredentialLocator::credentialsFilePath(const std::string& configDir) {
    std::string normalized = normalizeConfigDir(configDir);
    if (normalized.empty()) {
        normalized = PlatformUtils::expandHomePath(DEFAULT_CONFIG_DIR);
    }
    return std::filesystem::path(normalized) / CREDENTIALS_FILE_NAME;
}

bool CredentialLocator::isValidTargetName(const std::string& name) {
    static const std::regex pattern("^Claude Code-credentials(-[a-f0-9]{8})?$");
    return std::regex_match(name, pattern);
}

bool CredentialLocator::isValidCredentialsPath(const std::filesystem::path& path) {
    std::string text = path.string();
    if (StringUtils::contains(text, "..")) {
        return false;
    }
    return StringUtils::endsWith(text, CREDENTIALS_FILE_NAME);
}

} // namespace keyrotor::core::auth
