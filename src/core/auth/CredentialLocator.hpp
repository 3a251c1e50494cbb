#pragma once

/**
 * CredentialLocator.hpp
 *
 * Maps an account's config directory to the names and paths under which its
 * credentials are stored on each platform.
 */

#include <filesystem>
#include <string>

namespace keyrotor::core::auth {

class CredentialLocator {
public:
    static constexpr const char* SERVICE_PREFIX = "Claude Code-credentials";
    static constexpr const char* SECRET_SERVICE_APPLICATION = "claude-code";
    static constexpr const char* CREDENTIALS_FILE_NAME = ".credentials.json";
    static constexpr const char* DEFAULT_CONFIG_DIR = "~/.claude";

    /**
     * Expand a leading '~'. The default profile (empty) stays empty.
     */
    static std::string normalizeConfigDir(const std::string& configDir);

    /**
     * First 8 hex characters of SHA-256 over the normalized directory
     * @return Empty for the default profile
     */
    static std::string configDirHash(const std::string& configDir);

    /**
     * Keychain service / Credential Manager target:
     * "Claude Code-credentials" or "Claude Code-credentials-{hash}"
     */
    static std::string keychainServiceName(const std::string& configDir);

    /**
     * Secret Service "application" attribute: "claude-code" or "claude-code-{hash}"
     */
    static std::string secretServiceAttribute(const std::string& configDir);

    /**
     * <configDir or ~/.claude>/.credentials.json
     */
    static std::filesystem::path credentialsFilePath(const std::string& configDir);

    /**
     * ^Claude Code-credentials(-[a-f0-9]{8})?$
     */
    static bool isValidTargetName(const std::string& name);

    /**
     * Rejects paths containing ".." and paths not ending in .credentials.json
     */
    static bool isValidCredentialsPath(const std::filesystem::path& path);
};

} // namespace keyrotor::core::auth
