/**
 * ProfileScorer.cpp
 */

#include "ProfileScorer.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"

#include <algorithm>
#include <limits>
#include <sstream>

namespace keyrotor::core::rotation {

using models::APIProfile;
using models::OAuthProfile;
using models::RateLimitType;

namespace {

constexpr double BASE_SCORE = 100.0;
constexpr double UNAUTHENTICATED_PENALTY = 1000.0;
constexpr double WEEKLY_LIMIT_PENALTY = 500.0;
constexpr double SESSION_LIMIT_PENALTY = 200.0;
constexpr double RESET_BONUS_HOURS = 50.0;
constexpr double WEEKLY_OVERAGE_WEIGHT = 2.0;
constexpr double SESSION_OVERAGE_WEIGHT = 1.0;
constexpr double WEEKLY_USAGE_WEIGHT = 0.3;
constexpr double SESSION_USAGE_WEIGHT = 0.1;

constexpr size_t NOT_PRIORITIZED = std::numeric_limits<size_t>::max();

size_t priorityIndexOf(const Account& account, const std::vector<std::string>& priorityOrder) {
    std::string unifiedId = models::unifiedAccountId(account);
    for (size_t i = 0; i < priorityOrder.size(); ++i) {
        if (priorityOrder[i] == unifiedId || priorityOrder[i] == models::accountId(account)) {
            return i;
        }
    }
    return NOT_PRIORITIZED;
}

std::string formatPercent(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

} // namespace

AutoSwitchSettings AutoSwitchSettings::fromConfig(const Config& config) {
    AutoSwitchSettings settings;
    settings.enabled = config.get<bool>("autoSwitch.enabled", false);
    settings.proactiveSwapEnabled = config.get<bool>("autoSwitch.proactiveSwapEnabled", true);
    settings.sessionThreshold = config.get<double>("autoSwitch.sessionThreshold", 95.0);
    settings.weeklyThreshold = config.get<double>("autoSwitch.weeklyThreshold", 99.0);
    return settings;
}

ProfileScorer::ProfileScorer(const Clock& clock)
    : m_clock(clock) {
}

// -- Availability --

bool ProfileScorer::isRateLimited(const OAuthProfile& profile) const {
    if (!profile.rateLimit.limited) {
        return false;
    }
    if (profile.rateLimit.resetAt && *profile.rateLimit.resetAt <= m_clock.now()) {
        return false;
    }
    return true;
}

ThresholdCheck ProfileScorer::checkThresholds(const OAuthProfile& profile, const AutoSwitchSettings& settings) {
    ThresholdCheck check;
    if (profile.usage) {
        check.sessionExceeded = !(profile.usage->sessionPercent < settings.sessionThreshold);
        check.weeklyExceeded = !(profile.usage->weeklyPercent < settings.weeklyThreshold);
    }
    return check;
}

bool ProfileScorer::isAvailable(const Account& account, const AutoSwitchSettings& settings) const {
    if (const auto* api = std::get_if<APIProfile>(&account)) {
        return api->isAuthenticated();
    }

    const auto& oauth = std::get<OAuthProfile>(account);
    return oauth.isAuthenticated &&
           !isRateLimited(oauth) &&
           !checkThresholds(oauth, settings).anyExceeded();
}

// -- Scoring --

double ProfileScorer::score(const Account& account, const AutoSwitchSettings& settings) const {
    if (const auto* api = std::get_if<APIProfile>(&account)) {
        return api->isAuthenticated() ? BASE_SCORE : BASE_SCORE - UNAUTHENTICATED_PENALTY;
    }
    return scoreOAuth(std::get<OAuthProfile>(account), settings);
}

double ProfileScorer::scoreOAuth(const OAuthProfile& profile, const AutoSwitchSettings& settings) const {
    double score = BASE_SCORE;

    if (!profile.isAuthenticated) {
        score -= UNAUTHENTICATED_PENALTY;
    }

    if (isRateLimited(profile)) {
        bool weekly = profile.rateLimit.type && *profile.rateLimit.type == RateLimitType::Weekly;
        score -= weekly ? WEEKLY_LIMIT_PENALTY : SESSION_LIMIT_PENALTY;

        // Sooner reset, smaller penalty
        if (profile.rateLimit.resetAt) {
            double hoursUntilReset = std::chrono::duration<double, std::ratio<3600>>(
                *profile.rateLimit.resetAt - m_clock.now()).count();
            score += std::max(0.0, RESET_BONUS_HOURS - hoursUntilReset);
        }
    }

    if (profile.usage) {
        double weeklyOverage = std::max(0.0, profile.usage->weeklyPercent - settings.weeklyThreshold);
        double sessionOverage = std::max(0.0, profile.usage->sessionPercent - settings.sessionThreshold);

        score -= weeklyOverage * WEEKLY_OVERAGE_WEIGHT;
        score -= sessionOverage * SESSION_OVERAGE_WEIGHT;

        score -= profile.usage->weeklyPercent * WEEKLY_USAGE_WEIGHT;
        score -= profile.usage->sessionPercent * SESSION_USAGE_WEIGHT;
    }

    return score;
}

UnifiedAccount ProfileScorer::toUnified(const Account& account, const AutoSwitchSettings& settings) const {
    UnifiedAccount unified;
    unified.id = models::unifiedAccountId(account);
    unified.accountId = models::accountId(account);
    unified.name = models::accountName(account);
    unified.type = models::accountType(account);
    unified.isAvailable = isAvailable(account, settings);
    unified.score = score(account, settings);

    if (const auto* api = std::get_if<APIProfile>(&account)) {
        unified.isAuthenticated = api->isAuthenticated();
        return unified;
    }

    const auto& oauth = std::get<OAuthProfile>(account);
    unified.isAuthenticated = oauth.isAuthenticated;
    unified.isRateLimited = isRateLimited(oauth);
    if (unified.isRateLimited) {
        unified.rateLimitType = oauth.rateLimit.type;
    }
    if (oauth.usage) {
        unified.sessionPercent = oauth.usage->sessionPercent;
        unified.weeklyPercent = oauth.usage->weeklyPercent;
    }
    return unified;
}

std::vector<UnifiedAccount> ProfileScorer::buildUnifiedAccounts(const std::vector<Account>& pool,
                                                                const AutoSwitchSettings& settings) const {
    std::vector<UnifiedAccount> unified;
    unified.reserve(pool.size());
    for (const auto& account : pool) {
        unified.push_back(toUnified(account, settings));
    }
    return unified;
}

// -- Selection --

std::vector<ProfileScorer::Ranked> ProfileScorer::rank(const std::vector<Account>& pool,
                                                       const AutoSwitchSettings& settings,
                                                       const std::optional<std::string>& excludeId,
                                                       const std::vector<std::string>& priorityOrder) const {
    std::vector<Ranked> ranked;
    for (size_t i = 0; i < pool.size(); ++i) {
        const Account& account = pool[i];
        if (excludeId && (*excludeId == models::unifiedAccountId(account) ||
                          *excludeId == models::accountId(account))) {
            continue;
        }
        ranked.push_back(Ranked{
            i,
            priorityIndexOf(account, priorityOrder),
            score(account, settings),
            isAvailable(account, settings)
        });
    }

    // Stable so equal candidates keep pool order
    std::stable_sort(ranked.begin(), ranked.end(), [](const Ranked& a, const Ranked& b) {
        if (a.available != b.available) {
            return a.available;
        }
        if (a.available && a.priorityIndex != b.priorityIndex) {
            return a.priorityIndex < b.priorityIndex;
        }
        return a.score > b.score;
    });
    return ranked;
}

std::optional<Account> ProfileScorer::selectBestAccount(const std::vector<Account>& pool,
                                                        const AutoSwitchSettings& settings,
                                                        const std::optional<std::string>& excludeId,
                                                        const std::vector<std::string>& priorityOrder) const {
    std::vector<Ranked> ranked = rank(pool, settings, excludeId, priorityOrder);
    if (ranked.empty()) {
        return std::nullopt;
    }

    const Ranked& best = ranked.front();
    const Account& account = pool[best.poolIndex];

    if (best.available) {
        Logger::instance().debug("Selected account {} (score {:.1f})", models::unifiedAccountId(account), best.score);
        return account;
    }

    if (best.score > 0) {
        Logger::instance().warn("No account fully available, falling back to {} (score {:.1f})",
                                models::unifiedAccountId(account), best.score);
        return account;
    }

    Logger::instance().warn("No usable account among {} candidate(s)", ranked.size());
    return std::nullopt;
}

std::vector<Account> ProfileScorer::sortedByAvailability(const std::vector<Account>& pool,
                                                         const AutoSwitchSettings& settings,
                                                         const std::vector<std::string>& priorityOrder) const {
    std::vector<Account> sorted;
    for (const auto& entry : rank(pool, settings, std::nullopt, priorityOrder)) {
        sorted.push_back(pool[entry.poolIndex]);
    }
    return sorted;
}

SwitchDecision ProfileScorer::shouldProactivelySwitch(const Account& current,
                                                      const std::vector<Account>& pool,
                                                      const AutoSwitchSettings& settings,
                                                      const std::vector<std::string>& priorityOrder) const {
    SwitchDecision decision;
    if (!settings.enabled) {
        return decision;
    }

    const auto* oauth = std::get_if<OAuthProfile>(&current);
    if (!oauth) {
        return decision;
    }

    ThresholdCheck check = checkThresholds(*oauth, settings);
    std::string reason;

    if (isRateLimited(*oauth)) {
        reason = std::string("Rate limited (") +
                 (oauth->rateLimit.type ? models::toString(*oauth->rateLimit.type) : "unknown") + ")";
    } else if (check.weeklyExceeded) {
        reason = "Weekly usage at " + formatPercent(oauth->usage->weeklyPercent) +
                 "% (threshold: " + formatPercent(settings.weeklyThreshold) + "%)";
    } else if (check.sessionExceeded) {
        reason = "Session usage at " + formatPercent(oauth->usage->sessionPercent) +
                 "% (threshold: " + formatPercent(settings.sessionThreshold) + "%)";
    } else {
        return decision;
    }

    auto best = selectBestAccount(pool, settings, models::unifiedAccountId(current), priorityOrder);
    if (!best) {
        return decision;
    }

    decision.shouldSwitch = true;
    decision.reason = reason;
    decision.suggestedAccount = std::move(best);
    return decision;
}

} // namespace keyrotor::core::rotation
