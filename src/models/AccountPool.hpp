#pragma once

/**
 * AccountPool.hpp
 *
 * JSON form of an account pool snapshot, as consumed by `keyrotor select`:
 *
 *   {"accounts": [
 *      {"type": "oauth", "id", "name", "configDir", "isAuthenticated",
 *       "usage": {"sessionPercent", "weeklyPercent"},
 *       "rateLimit": {"limited", "type": "session"|"weekly", "resetAt": <epoch ms>}},
 *      {"type": "api", "id", "name", "apiKey", "baseUrl"}],
 *    "priorityOrder": ["oauth-a", "api-b"],
 *    "exclude": "oauth-c"}
 */

#include "Account.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace keyrotor::models {

using json = nlohmann::json;

std::optional<Account> accountFromJson(const json& j);

json toJson(const UnifiedAccount& account);

struct AccountPool {
    std::vector<Account> accounts;
    std::vector<std::string> priorityOrder;
    std::optional<std::string> exclude;

    /**
     * Entries that are not objects or lack an id are skipped
     */
    static AccountPool fromJson(const json& j);
};

} // namespace keyrotor::models
