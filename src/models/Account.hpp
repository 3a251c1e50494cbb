#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace keyrotor::models {

enum class AccountType {
    OAuth,
    API
};

enum class RateLimitType {
    Session,
    Weekly
};

/**
 * Rate-limit state reported by the external oracle
 */
struct RateLimitState {
    bool limited{false};
    std::optional<RateLimitType> type;
    std::optional<std::chrono::system_clock::time_point> resetAt;
};

struct UsageSnapshot {
    double sessionPercent{0.0};
    double weeklyPercent{0.0};
};

/**
 * OAuth account backed by a platform secret store.
 * configDir is empty for the default profile.
 */
struct OAuthProfile {
    std::string id;
    std::string name;
    std::string configDir;
    bool isAuthenticated{false};
    std::optional<UsageSnapshot> usage;
    RateLimitState rateLimit;
};

/**
 * API-key account. No usage ceiling once authenticated.
 */
struct APIProfile {
    std::string id;
    std::string name;
    std::string apiKey;
    std::string baseUrl;

    bool isAuthenticated() const {
        return apiKey.find_first_not_of(" \t\r\n") != std::string::npos &&
               baseUrl.find_first_not_of(" \t\r\n") != std::string::npos;
    }
};

using Account = std::variant<OAuthProfile, APIProfile>;

inline const std::string& accountId(const Account& account) {
    return std::visit([](const auto& a) -> const std::string& { return a.id; }, account);
}

inline const std::string& accountName(const Account& account) {
    return std::visit([](const auto& a) -> const std::string& { return a.name; }, account);
}

inline AccountType accountType(const Account& account) {
    return std::holds_alternative<OAuthProfile>(account) ? AccountType::OAuth : AccountType::API;
}

/**
 * "oauth-{id}" / "api-{id}"
 */
inline std::string unifiedAccountId(const Account& account) {
    return (accountType(account) == AccountType::OAuth ? "oauth-" : "api-") + accountId(account);
}

inline const char* toString(AccountType type) {
    return type == AccountType::OAuth ? "oauth" : "api";
}

inline const char* toString(RateLimitType type) {
    return type == RateLimitType::Weekly ? "weekly" : "session";
}

/**
 * Normalized view over both account kinds, rebuilt on every selection
 */
struct UnifiedAccount {
    std::string id;          // unified id
    std::string accountId;   // raw profile id
    std::string name;
    AccountType type{AccountType::OAuth};
    bool isAuthenticated{false};
    bool isAvailable{false};
    bool isRateLimited{false};
    std::optional<RateLimitType> rateLimitType;
    std::optional<double> sessionPercent;
    std::optional<double> weeklyPercent;
    double score{0.0};
};

} // namespace keyrotor::models
