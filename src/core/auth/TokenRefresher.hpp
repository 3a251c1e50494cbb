#pragma once

/**
 * TokenRefresher.hpp
 *
 * Keeps OAuth access tokens valid by exchanging refresh tokens before they
 * expire (proactive) or after the API rejects them (reactive).
 *
 * Token lifecycle: VALID -> NEAR_EXPIRY -> REFRESHING -> VALID | REVOKED
 */

#include "CredentialStore.hpp"
#include "Credentials.hpp"
#include "../Clock.hpp"
#include "../../utils/HttpClient.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace keyrotor::core {
class Config;
}

namespace keyrotor::core::auth {

struct TokenRefresherOptions {
    std::string tokenEndpoint{"https://console.anthropic.com/v1/oauth/token"};
    std::string clientId{"9d1c250a-e61b-44d9-88ed-5944d1962f5e"};
    Milliseconds refreshThreshold{std::chrono::minutes(30)};
    int maxRetries{2};
    Milliseconds backoffBase{1000};
    int64_t defaultExpiresInSeconds{28800};

    /**
     * Read the "refresh" section
     */
    static TokenRefresherOptions fromConfig(const Config& config);
};

/**
 * Outcome of one refresh-token exchange with the token endpoint
 */
struct TokenExchangeResult {
    bool success{false};
    std::optional<TokenUpdate> tokens;
    std::optional<std::string> error;
    std::string errorCode;   // invalid_grant, invalid_client, invalid_response, network_error, ...
    CredentialErrorKind errorKind{CredentialErrorKind::None};
    int attempts{0};

    bool isPermanent() const { return errorKind == CredentialErrorKind::PermanentAuth; }
};

/**
 * Outcome of ensureValidToken / reactiveRefresh
 */
struct RefreshResult {
    std::optional<std::string> token;
    bool wasRefreshed{false};
    std::optional<std::string> error;
    std::string errorCode;
    CredentialErrorKind errorKind{CredentialErrorKind::None};
    bool persistenceFailed{false};

    /**
     * The user has to log in again: the grant was revoked, or new tokens
     * were issued (invalidating the stored pair) but could not be stored
     */
    bool needsReauthentication() const {
        return errorKind == CredentialErrorKind::PermanentAuth || persistenceFailed;
    }
};

class TokenRefresher {
public:
    /**
     * Called after every successful exchange, persisted or not
     */
    using RefreshedCallback = std::function<void(const std::string& configDir,
                                                 const std::string& accessToken)>;

    TokenRefresher(CredentialStore& store,
                   utils::HttpClient& http,
                   Clock& clock,
                   TokenRefresherOptions options = {});

    TokenRefresher(const TokenRefresher&) = delete;
    TokenRefresher& operator=(const TokenRefresher&) = delete;

    /**
     * Unknown expiry counts as expired
     * @param expiresAt Epoch milliseconds
     */
    bool isNearExpiry(std::optional<int64_t> expiresAt) const;
    bool isNearExpiry(std::optional<int64_t> expiresAt, Milliseconds threshold) const;

    /**
     * Return a usable access token, refreshing it first when it is near expiry
     * @param configDir Account config directory, empty for the default profile
     */
    RefreshResult ensureValidToken(const std::string& configDir);

    /**
     * Refresh unconditionally, e.g. after a 401 from the API
     */
    RefreshResult reactiveRefresh(const std::string& configDir);

    /**
     * Exchange a refresh token, retrying transient failures with exponential backoff
     */
    TokenExchangeResult refreshOAuthToken(const std::string& refreshToken);

    void setOnRefreshed(RefreshedCallback callback);

    /**
     * @return Time left, zero once expired, nullopt when unknown
     */
    std::optional<Milliseconds> timeUntilExpiry(std::optional<int64_t> expiresAt) const;

    /**
     * "2h 5m", "45m", "expired" or "unknown"
     */
    std::string formatTimeRemaining(std::optional<int64_t> expiresAt) const;

    static std::string formatDuration(std::optional<Milliseconds> remaining);

private:
    RefreshResult refresh(const std::string& configDir, bool proactive);
    RefreshResult refreshLocked(const std::string& configDir, bool proactive);
    void notifyRefreshed(const std::string& configDir, const std::string& accessToken);
    RefreshResult exchangeAndPersist(const std::string& configDir, const FullOAuthCredentials& current,
                                     bool proactive);
    TokenExchangeResult exchangeOnce(const std::string& refreshToken);

    std::mutex& accountMutex(const std::string& configDir);

    CredentialStore& m_store;
    utils::HttpClient& m_http;
    Clock& m_clock;
    TokenRefresherOptions m_options;

    std::mutex m_callbackMutex;
    RefreshedCallback m_onRefreshed;

    std::mutex m_accountMutexesMutex;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> m_accountMutexes;
};

} // namespace keyrotor::core::auth
