/**
 * TokenRefresher.cpp
 */

#include "TokenRefresher.hpp"
#include "CredentialDocument.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../../utils/JsonUtils.hpp"

#include <algorithm>
#include <sstream>

namespace keyrotor::core::auth {

using utils::JsonUtils;

namespace {

// One year; keeps expiresAt arithmetic in range
constexpr int64_t MAX_EXPIRES_IN_SECONDS = 365LL * 24 * 60 * 60;

bool isPermanentErrorCode(const std::string& code) {
    return code == "invalid_grant" || code == "invalid_client";
}

std::vector<std::string> splitScopes(const std::string& scope) {
    std::vector<std::string> scopes;
    std::istringstream stream(scope);
    std::string item;
    while (stream >> item) {
        scopes.push_back(item);
    }
    return scopes;
}

} // namespace

TokenRefresherOptions TokenRefresherOptions::fromConfig(const Config& config) {
    TokenRefresherOptions options;
    options.refreshThreshold = std::chrono::minutes(config.get<int64_t>("refresh.thresholdMinutes", 30));
    options.maxRetries = config.get<int>("refresh.maxRetries", 2);
    options.backoffBase = Milliseconds(config.get<int64_t>("refresh.backoffBaseMs", 1000));
    if (options.maxRetries < 0) options.maxRetries = 0;
    return options;
}

TokenRefresher::TokenRefresher(CredentialStore& store,
                               utils::HttpClient& http,
                               Clock& clock,
                               TokenRefresherOptions options)
    : m_store(store)
    , m_http(http)
    , m_clock(clock)
    , m_options(std::move(options)) {
}

// -- Expiry --

bool TokenRefresher::isNearExpiry(std::optional<int64_t> expiresAt) const {
    return isNearExpiry(expiresAt, m_options.refreshThreshold);
}

bool TokenRefresher::isNearExpiry(std::optional<int64_t> expiresAt, Milliseconds threshold) const {
    if (!expiresAt) {
        return true;
    }
    return m_clock.nowMs() >= *expiresAt - threshold.count();
}

std::optional<Milliseconds> TokenRefresher::timeUntilExpiry(std::optional<int64_t> expiresAt) const {
    if (!expiresAt) {
        return std::nullopt;
    }
    int64_t remaining = *expiresAt - m_clock.nowMs();
    return Milliseconds(remaining > 0 ? remaining : 0);
}

std::string TokenRefresher::formatTimeRemaining(std::optional<int64_t> expiresAt) const {
    return formatDuration(timeUntilExpiry(expiresAt));
}

std::string TokenRefresher::formatDuration(std::optional<Milliseconds> remaining) {
    if (!remaining) return "unknown";
    if (remaining->count() <= 0) return "expired";

    auto minutes = std::chrono::duration_cast<std::chrono::minutes>(*remaining).count();
    auto hours = minutes / 60;
    if (hours > 0) {
        return std::to_string(hours) + "h " + std::to_string(minutes % 60) + "m";
    }
    return std::to_string(minutes) + "m";
}

void TokenRefresher::setOnRefreshed(RefreshedCallback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_onRefreshed = std::move(callback);
}

// -- Public entry points --

RefreshResult TokenRefresher::ensureValidToken(const std::string& configDir) {
    return refresh(configDir, true);
}

RefreshResult TokenRefresher::reactiveRefresh(const std::string& configDir) {
    return refresh(configDir, false);
}

std::mutex& TokenRefresher::accountMutex(const std::string& configDir) {
    std::lock_guard<std::mutex> lock(m_accountMutexesMutex);
    auto& slot = m_accountMutexes[m_store.cacheKey(configDir)];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

RefreshResult TokenRefresher::refresh(const std::string& configDir, bool proactive) {
    RefreshResult result;
    {
        // Serializes read -> decide -> exchange -> write for one account
        std::lock_guard<std::mutex> lock(accountMutex(configDir));
        result = refreshLocked(configDir, proactive);
    }

    // Outside the account lock; listeners may call back into the refresher
    if (result.wasRefreshed && result.token) {
        notifyRefreshed(configDir, *result.token);
    }
    return result;
}

RefreshResult TokenRefresher::refreshLocked(const std::string& configDir, bool proactive) {
    RefreshResult result;
    FullOAuthCredentials current = m_store.getFullCredentials(configDir, true);

    if (current.hasError()) {
        result.error = "Failed to read credentials: " + *current.error;
        result.errorKind = current.errorKind;
        return result;
    }

    if (proactive) {
        if (!current.hasToken()) {
            result.error = "No access token found in credentials";
            result.errorCode = "missing_credentials";
            result.errorKind = CredentialErrorKind::NotFound;
            return result;
        }

        if (!isNearExpiry(current.expiresAt)) {
            Logger::instance().debug("Token {} valid for {}",
                                     tokenFingerprint(current.token),
                                     formatTimeRemaining(current.expiresAt));
            result.token = current.token;
            return result;
        }

        if (!current.refreshToken) {
            Logger::instance().warn("Token near expiry but no refresh token stored");
            result.token = current.token;
            result.error = "Token expired but no refresh token available";
            result.errorCode = "missing_refresh_token";
            result.errorKind = CredentialErrorKind::NotFound;
            return result;
        }

        Logger::instance().info("Token {} expires in {}, refreshing",
                                tokenFingerprint(current.token),
                                formatTimeRemaining(current.expiresAt));
    } else if (!current.refreshToken) {
        result.error = "No refresh token available for reactive refresh";
        result.errorCode = "missing_refresh_token";
        result.errorKind = CredentialErrorKind::NotFound;
        return result;
    }

    return exchangeAndPersist(configDir, current, proactive);
}

RefreshResult TokenRefresher::exchangeAndPersist(const std::string& configDir,
                                                 const FullOAuthCredentials& current,
                                                 bool proactive) {
    RefreshResult result;
    TokenExchangeResult exchange = refreshOAuthToken(*current.refreshToken);

    if (!exchange.success) {
        result.error = "Token refresh failed: " + exchange.error.value_or("unknown error");
        result.errorCode = exchange.errorCode;
        result.errorKind = exchange.errorKind;

        if (exchange.isPermanent()) {
            Logger::instance().error("Refresh token rejected ({}), re-authentication required",
                                     exchange.errorCode);
            m_store.clearCache(configDir);
            return result;
        }

        // Stale token stays usable until it actually expires
        if (proactive) {
            result.token = current.token;
        }
        return result;
    }

    TokenUpdate update = *exchange.tokens;
    if (!update.scopes) {
        update.scopes = current.scopes;
    }

    UpdateResult stored = m_store.updateCredentials(configDir, update);
    m_store.clearCache(configDir);

    result.token = update.accessToken;
    result.wasRefreshed = true;

    if (!stored.success) {
        Logger::instance().error("Refreshed token {} could not be stored: {}",
                                 tokenFingerprint(update.accessToken),
                                 stored.error.value_or("unknown error"));
        result.persistenceFailed = true;
        result.error = stored.error;
        result.errorKind = CredentialErrorKind::PersistenceFailure;
    } else {
        Logger::instance().info("Token refreshed: {} valid for {}",
                                tokenFingerprint(update.accessToken),
                                formatTimeRemaining(update.expiresAt));
    }

    return result;
}

void TokenRefresher::notifyRefreshed(const std::string& configDir, const std::string& accessToken) {
    RefreshedCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        callback = m_onRefreshed;
    }
    if (!callback) {
        return;
    }

    try {
        callback(configDir, accessToken);
    } catch (const std::exception& e) {
        Logger::instance().error("Token refresh listener threw: {}", e.what());
    }
}

// -- Exchange --

TokenExchangeResult TokenRefresher::refreshOAuthToken(const std::string& refreshToken) {
    TokenExchangeResult last;

    if (refreshToken.empty()) {
        last.error = "No refresh token provided";
        last.errorCode = "missing_refresh_token";
        last.errorKind = CredentialErrorKind::NotFound;
        return last;
    }

    for (int attempt = 0; attempt <= m_options.maxRetries; ++attempt) {
        if (attempt > 0) {
            Milliseconds delay = m_options.backoffBase * (int64_t(1) << (attempt - 1));
            Logger::instance().debug("Retrying token refresh in {} ms (attempt {})",
                                     delay.count(), attempt + 1);
            m_clock.sleepFor(delay);
        }

        TokenExchangeResult result = exchangeOnce(refreshToken);
        result.attempts = attempt + 1;

        if (result.success || result.errorKind != CredentialErrorKind::TransientNetwork) {
            return result;
        }

        Logger::instance().warn("Token refresh attempt {} failed: {}",
                                attempt + 1, result.error.value_or("unknown error"));
        last = std::move(result);
    }

    last.errorCode = "network_error";
    return last;
}

TokenExchangeResult TokenRefresher::exchangeOnce(const std::string& refreshToken) {
    TokenExchangeResult result;

    utils::FormFields fields = {
        {"grant_type", "refresh_token"},
        {"refresh_token", refreshToken},
        {"client_id", m_options.clientId}
    };

    utils::HttpResponse response = m_http.postForm(m_options.tokenEndpoint, fields);

    if (response.isTransportError()) {
        result.error = response.error.empty() ? "No response from token endpoint" : response.error;
        result.errorCode = "network_error";
        result.errorKind = CredentialErrorKind::TransientNetwork;
        return result;
    }

    auto body = JsonUtils::parse(response.body);

    if (!response.isSuccess()) {
        json errorBody = body ? *body : json::object();
        std::string code = JsonUtils::getString(errorBody, "error", "http_" + std::to_string(response.statusCode));
        std::string description = JsonUtils::getString(errorBody, "error_description", "");

        result.errorCode = code;
        if (isPermanentErrorCode(code)) {
            result.error = description.empty() ? code : description;
            result.errorKind = CredentialErrorKind::PermanentAuth;
        } else {
            result.error = "HTTP " + std::to_string(response.statusCode) +
                           (description.empty() ? "" : ": " + description);
            result.errorKind = CredentialErrorKind::TransientNetwork;
        }
        return result;
    }

    auto accessToken = body ? JsonUtils::optString(*body, "access_token") : std::nullopt;
    if (!accessToken) {
        result.error = "Response missing access_token";
        result.errorCode = "invalid_response";
        result.errorKind = CredentialErrorKind::MalformedData;
        return result;
    }

    // Refresh tokens rotate on every exchange
    auto newRefreshToken = JsonUtils::optString(*body, "refresh_token");
    if (!newRefreshToken || newRefreshToken->empty()) {
        result.error = "Response missing refresh_token";
        result.errorCode = "invalid_response";
        result.errorKind = CredentialErrorKind::MalformedData;
        return result;
    }

    int64_t expiresIn = JsonUtils::getLong(*body, "expires_in", 0);
    if (expiresIn <= 0) {
        expiresIn = m_options.defaultExpiresInSeconds;
    }
    expiresIn = std::min(expiresIn, MAX_EXPIRES_IN_SECONDS);

    TokenUpdate tokens;
    tokens.accessToken = *accessToken;
    tokens.refreshToken = *newRefreshToken;
    tokens.expiresAt = m_clock.nowMs() + expiresIn * 1000;
    if (auto scope = JsonUtils::optString(*body, "scope")) {
        tokens.scopes = splitScopes(*scope);
    }

    result.success = true;
    result.tokens = std::move(tokens);
    return result;
}

} // namespace keyrotor::core::auth
