#pragma once

/**
 * CredentialBackend.hpp
 *
 * One storage location for OAuth credential documents (keychain, Secret
 * Service, credentials file, Windows Credential Manager).
 */

#include "Credentials.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace keyrotor::core::auth {

/**
 * Resolves a helper tool name ("security", "secret-tool", "powershell")
 * to an executable path, nullopt when not installed
 */
using ExecutableResolver = std::function<std::optional<std::filesystem::path>(const std::string& tool)>;

/**
 * Resolver probing the fixed install locations of each helper
 */
ExecutableResolver defaultExecutableResolver();

class CredentialBackend {
public:
    virtual ~CredentialBackend() = default;

    /**
     * Label used in logs
     */
    virtual std::string name() const = 0;

    /**
     * Read the stored document for an account.
     * A missing helper or secret yields empty credentials without an error.
     */
    virtual FullOAuthCredentials read(const std::string& configDir) = 0;

    /**
     * Replace the stored document for an account
     * @param document Serialized credential JSON
     */
    virtual UpdateResult write(const std::string& configDir, const std::string& document) = 0;
};

} // namespace keyrotor::core::auth
