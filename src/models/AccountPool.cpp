/**
 * AccountPool.cpp
 */

#include "AccountPool.hpp"
#include "../utils/JsonUtils.hpp"

namespace keyrotor::models {

using utils::JsonUtils;

namespace {

RateLimitState rateLimitFromJson(const json& j) {
    RateLimitState state;
    if (!j.is_object()) {
        return state;
    }

    state.limited = JsonUtils::getBool(j, "limited", false);
    std::string type = JsonUtils::getString(j, "type");
    if (type == "weekly") {
        state.type = RateLimitType::Weekly;
    } else if (type == "session") {
        state.type = RateLimitType::Session;
    }
    if (auto resetAt = JsonUtils::optLong(j, "resetAt")) {
        state.resetAt = std::chrono::system_clock::time_point(std::chrono::milliseconds(*resetAt));
    }
    return state;
}

} // namespace

std::optional<Account> accountFromJson(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    std::string id = JsonUtils::getString(j, "id");
    if (id.empty()) {
        return std::nullopt;
    }

    if (JsonUtils::getString(j, "type", "oauth") == "api") {
        APIProfile api;
        api.id = id;
        api.name = JsonUtils::getString(j, "name", id);
        api.apiKey = JsonUtils::getString(j, "apiKey");
        api.baseUrl = JsonUtils::getString(j, "baseUrl");
        return Account{api};
    }

    OAuthProfile oauth;
    oauth.id = id;
    oauth.name = JsonUtils::getString(j, "name", id);
    oauth.configDir = JsonUtils::getString(j, "configDir");
    oauth.isAuthenticated = JsonUtils::getBool(j, "isAuthenticated", false);

    if (j.contains("usage") && j["usage"].is_object()) {
        UsageSnapshot usage;
        usage.sessionPercent = JsonUtils::getDouble(j["usage"], "sessionPercent", 0.0);
        usage.weeklyPercent = JsonUtils::getDouble(j["usage"], "weeklyPercent", 0.0);
        oauth.usage = usage;
    }
    if (j.contains("rateLimit")) {
        oauth.rateLimit = rateLimitFromJson(j["rateLimit"]);
    }
    return Account{oauth};
}

json toJson(const UnifiedAccount& account) {
    json j = {
        {"id", account.id},
        {"accountId", account.accountId},
        {"name", account.name},
        {"type", toString(account.type)},
        {"isAuthenticated", account.isAuthenticated},
        {"isAvailable", account.isAvailable},
        {"isRateLimited", account.isRateLimited},
        {"score", account.score}
    };
    if (account.rateLimitType) j["rateLimitType"] = toString(*account.rateLimitType);
    if (account.sessionPercent) j["sessionPercent"] = *account.sessionPercent;
    if (account.weeklyPercent) j["weeklyPercent"] = *account.weeklyPercent;
    return j;
}

AccountPool AccountPool::fromJson(const json& j) {
    AccountPool pool;
    if (!j.is_object()) {
        return pool;
    }

    if (j.contains("accounts") && j["accounts"].is_array()) {
        for (const auto& entry : j["accounts"]) {
            if (auto account = accountFromJson(entry)) {
                pool.accounts.push_back(std::move(*account));
            }
        }
    }

    pool.priorityOrder = JsonUtils::optStringArray(j, "priorityOrder").value_or(std::vector<std::string>{});
    pool.exclude = JsonUtils::optString(j, "exclude");
    return pool;
}

} // namespace keyrotor::models
