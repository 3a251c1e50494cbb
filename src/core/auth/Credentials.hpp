#pragma once

/**
 * Credentials.hpp
 *
 * Result types shared by the credential store and the token refresher.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace keyrotor::core::auth {

/**
 * Failure taxonomy for credential access and refresh
 */
enum class CredentialErrorKind {
    None,
    NotFound,            // secret absent; normal condition
    MalformedData,       // unexpected JSON shape, treated as absent
    AccessDenied,        // locked store, permission failure, helper timeout
    ToolMissing,         // platform helper not installed
    TransientNetwork,    // refresh endpoint unreachable or non-permanent HTTP error
    PermanentAuth,       // invalid_grant / invalid_client
    PersistenceFailure   // new tokens obtained but not stored
};

inline const char* toString(CredentialErrorKind kind) {
    switch (kind) {
        case CredentialErrorKind::None:               return "none";
        case CredentialErrorKind::NotFound:           return "not_found";
        case CredentialErrorKind::MalformedData:      return "malformed_data";
        case CredentialErrorKind::AccessDenied:       return "access_denied";
        case CredentialErrorKind::ToolMissing:        return "tool_missing";
        case CredentialErrorKind::TransientNetwork:   return "transient_network";
        case CredentialErrorKind::PermanentAuth:      return "permanent_auth";
        case CredentialErrorKind::PersistenceFailure: return "persistence_failure";
    }
    return "unknown";
}

/**
 * Minimal read result
 */
struct PlatformCredentials {
    std::optional<std::string> token;
    std::optional<std::string> email;
    std::optional<std::string> error;
    CredentialErrorKind errorKind{CredentialErrorKind::None};

    bool hasToken() const { return token.has_value(); }
    bool hasError() const { return error.has_value(); }
};

/**
 * Read result including everything needed for a refresh
 */
struct FullOAuthCredentials : PlatformCredentials {
    std::optional<std::string> refreshToken;
    std::optional<int64_t> expiresAt;          // epoch ms; absent means "assume expired"
    std::optional<std::vector<std::string>> scopes;
    std::optional<std::string> subscriptionType;
    std::optional<std::string> rateLimitTier;

    PlatformCredentials basic() const {
        return PlatformCredentials{token, email, error, errorKind};
    }

    static FullOAuthCredentials failure(CredentialErrorKind kind, std::string message) {
        FullOAuthCredentials result;
        result.errorKind = kind;
        result.error = std::move(message);
        return result;
    }
};

/**
 * New token pair to persist after a refresh
 */
struct TokenUpdate {
    std::string accessToken;
    std::string refreshToken;
    int64_t expiresAt{0};
    std::optional<std::vector<std::string>> scopes;
};

struct UpdateResult {
    bool success{false};
    std::optional<std::string> error;
    CredentialErrorKind errorKind{CredentialErrorKind::None};

    static UpdateResult ok() {
        UpdateResult result;
        result.success = true;
        return result;
    }

    static UpdateResult failure(CredentialErrorKind kind, std::string message) {
        UpdateResult result;
        result.errorKind = kind;
        result.error = std::move(message);
        return result;
    }
};

} // namespace keyrotor::core::auth
