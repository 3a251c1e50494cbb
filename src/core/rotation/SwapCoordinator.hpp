#pragma once

/**
 * SwapCoordinator.hpp
 *
 * Proactive swap: moves work off an account that is about to hit its usage
 * limit onto the best alternative, then restarts the operations that were
 * running on the old account.
 */

#include "OperationRegistry.hpp"
#include "ProfileScorer.hpp"
#include "../Signal.hpp"
#include "../../models/Account.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace keyrotor::core::rotation {

struct SwapCompletedEvent {
    std::string fromProfileId;
    std::string toProfileId;
    std::string toProfileName;
    models::AccountType toType;
    models::RateLimitType limitType;
};

struct SwapFailedEvent {
    std::string reason;   // no_alternative, activation_failed
    std::string currentProfileId;
    models::RateLimitType limitType;
};

struct OperationsMigratedEvent {
    std::string fromProfileId;
    std::string toProfileId;
    std::vector<std::string> operationIds;
    size_t restartedCount;
};

struct SwapOutcome {
    bool swapped{false};
    std::optional<Account> target;
    size_t operationsRestarted{0};
    std::string failureReason;
};

class SwapCoordinator {
public:
    /**
     * Makes an account the active one; returns false if it could not be activated
     */
    using ActivateFn = std::function<bool(const Account& account)>;

    SwapCoordinator(ProfileScorer& scorer, OperationRegistry& registry, ActivateFn activate);

    /**
     * @param currentId Raw id of the account being swapped out
     * @param limitType Limit that triggered the swap
     * @param pool All known accounts
     * @param settings Usage thresholds
     * @param priorityOrder Unified ids, most preferred first
     */
    SwapOutcome performProactiveSwap(const std::string& currentId,
                                     models::RateLimitType limitType,
                                     const std::vector<Account>& pool,
                                     const AutoSwitchSettings& settings,
                                     const std::vector<std::string>& priorityOrder = {});

    Signal<SwapCompletedEvent> swapCompleted;
    Signal<SwapFailedEvent> swapFailed;
    Signal<OperationsMigratedEvent> operationsMigrated;

private:
    ProfileScorer& m_scorer;
    OperationRegistry& m_registry;
    ActivateFn m_activate;
};

} // namespace keyrotor::core::rotation
