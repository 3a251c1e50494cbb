#pragma once

/**
 * ProfileScorer.hpp
 *
 * Picks the account to run on from a pool of OAuth and API accounts.
 *
 * Available accounts are ranked by the user's priority order, then by score.
 * When nothing is available, the highest-scoring account is returned as a
 * degraded choice if its score is still positive.
 *
 * Pure computation: callers gather usage and rate-limit state beforehand.
 */

#include "../Clock.hpp"
#include "../../models/Account.hpp"

#include <optional>
#include <string>
#include <vector>

namespace keyrotor::core {
class Config;
}

namespace keyrotor::core::rotation {

using models::Account;
using models::UnifiedAccount;

struct AutoSwitchSettings {
    bool enabled{false};
    bool proactiveSwapEnabled{true};
    double sessionThreshold{95.0};
    double weeklyThreshold{99.0};

    /**
     * Read the "autoSwitch" section
     */
    static AutoSwitchSettings fromConfig(const Config& config);
};

struct ThresholdCheck {
    bool sessionExceeded{false};
    bool weeklyExceeded{false};

    bool anyExceeded() const { return sessionExceeded || weeklyExceeded; }
};

struct SwitchDecision {
    bool shouldSwitch{false};
    std::string reason;
    std::optional<Account> suggestedAccount;
};

class ProfileScorer {
public:
    explicit ProfileScorer(const Clock& clock);

    /**
     * Pick the account to use
     * @param pool Candidate accounts
     * @param settings Usage thresholds
     * @param excludeId Account to skip (unified or raw id), usually the current one
     * @param priorityOrder Unified ids, most preferred first
     * @return Best account, nullopt when every candidate is unusable
     */
    std::optional<Account> selectBestAccount(const std::vector<Account>& pool,
                                             const AutoSwitchSettings& settings,
                                             const std::optional<std::string>& excludeId = std::nullopt,
                                             const std::vector<std::string>& priorityOrder = {}) const;

    /**
     * Pool in selection order, available accounts first
     */
    std::vector<Account> sortedByAvailability(const std::vector<Account>& pool,
                                              const AutoSwitchSettings& settings,
                                              const std::vector<std::string>& priorityOrder = {}) const;

    std::vector<UnifiedAccount> buildUnifiedAccounts(const std::vector<Account>& pool,
                                                     const AutoSwitchSettings& settings) const;

    UnifiedAccount toUnified(const Account& account, const AutoSwitchSettings& settings) const;

    /**
     * Suggest a switch when the current OAuth account is over a threshold or
     * rate-limited and another account can take over
     */
    SwitchDecision shouldProactivelySwitch(const Account& current,
                                           const std::vector<Account>& pool,
                                           const AutoSwitchSettings& settings,
                                           const std::vector<std::string>& priorityOrder = {}) const;

    double score(const Account& account, const AutoSwitchSettings& settings) const;
    bool isAvailable(const Account& account, const AutoSwitchSettings& settings) const;

    /**
     * Active rate limit; one whose reset time has passed no longer counts
     */
    bool isRateLimited(const models::OAuthProfile& profile) const;

    /**
     * Threshold comparisons are inclusive: usage equal to the threshold counts as exceeded
     */
    static ThresholdCheck checkThresholds(const models::OAuthProfile& profile,
                                          const AutoSwitchSettings& settings);

private:
    struct Ranked {
        size_t poolIndex;
        size_t priorityIndex;
        double score;
        bool available;
    };

    std::vector<Ranked> rank(const std::vector<Account>& pool,
                             const AutoSwitchSettings& settings,
                             const std::optional<std::string>& excludeId,
                             const std::vector<std::string>& priorityOrder) const;

    double scoreOAuth(const models::OAuthProfile& profile, const AutoSwitchSettings& settings) const;

    const Clock& m_clock;
};

} // namespace keyrotor::core::rotation
