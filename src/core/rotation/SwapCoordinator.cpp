/**
 * SwapCoordinator.cpp
 */

#include "SwapCoordinator.hpp"
#include "../Logger.hpp"

namespace keyrotor::core::rotation {

SwapCoordinator::SwapCoordinator(ProfileScorer& scorer, OperationRegistry& registry, ActivateFn activate)
    : m_scorer(scorer)
    , m_registry(registry)
    , m_activate(std::move(activate)) {
}

SwapOutcome SwapCoordinator::performProactiveSwap(const std::string& currentId,
                                                  models::RateLimitType limitType,
                                                  const std::vector<Account>& pool,
                                                  const AutoSwitchSettings& settings,
                                                  const std::vector<std::string>& priorityOrder) {
    SwapOutcome outcome;

    auto target = m_scorer.selectBestAccount(pool, settings, currentId, priorityOrder);
    if (!target) {
        Logger::instance().warn("No alternative account for proactive swap from {}", currentId);
        outcome.failureReason = "no_alternative";
        swapFailed.emit(SwapFailedEvent{outcome.failureReason, currentId, limitType});
        return outcome;
    }

    const std::string& targetId = models::accountId(*target);
    const std::string& targetName = models::accountName(*target);

    if (m_activate && !m_activate(*target)) {
        Logger::instance().error("Could not activate {} for proactive swap", models::unifiedAccountId(*target));
        outcome.failureReason = "activation_failed";
        swapFailed.emit(SwapFailedEvent{outcome.failureReason, currentId, limitType});
        return outcome;
    }

    Logger::instance().info("Proactive swap ({} limit): {} -> {}",
                            models::toString(limitType), currentId, targetName);

    outcome.swapped = true;
    outcome.target = target;
    swapCompleted.emit(SwapCompletedEvent{currentId, targetId, targetName,
                                          models::accountType(*target), limitType});

    OperationSummary summary = m_registry.getSummary();
    auto onOldProfile = summary.byProfile.find(currentId);
    if (onOldProfile == summary.byProfile.end() || onOldProfile->second.empty()) {
        return outcome;
    }

    outcome.operationsRestarted = m_registry.restartAllOnProfile(currentId, targetId, targetName);
    operationsMigrated.emit(OperationsMigratedEvent{currentId, targetId, onOldProfile->second,
                                                    outcome.operationsRestarted});
    return outcome;
}

} // namespace keyrotor::core::rotation
