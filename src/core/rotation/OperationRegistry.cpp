/**
 * OperationRegistry.cpp
 */

#include "OperationRegistry.hpp"
#include "../Logger.hpp"

#include <algorithm>

namespace keyrotor::core::rotation {

namespace {

struct TypeName {
    OperationType type;
    const char* name;
};

constexpr TypeName TYPE_NAMES[] = {
    {OperationType::SpecCreation, "spec-creation"},
    {OperationType::TaskExecution, "task-execution"},
    {OperationType::PrReview, "pr-review"},
    {OperationType::MrReview, "mr-review"},
    {OperationType::Insights, "insights"},
    {OperationType::Roadmap, "roadmap"},
    {OperationType::Changelog, "changelog"},
    {OperationType::Ideation, "ideation"},
    {OperationType::Triage, "triage"},
    {OperationType::Other, "other"},
};

} // namespace

const char* toString(OperationType type) {
    for (const auto& entry : TYPE_NAMES) {
        if (entry.type == type) return entry.name;
    }
    return "other";
}

OperationType parseOperationType(const std::string& name) {
    for (const auto& entry : TYPE_NAMES) {
        if (name == entry.name) return entry.type;
    }
    return OperationType::Other;
}

OperationRegistry::OperationRegistry(const Clock& clock)
    : m_clock(clock) {
}

// -- Registration --

void OperationRegistry::registerOperation(const std::string& id,
                                          OperationType type,
                                          const std::string& profileId,
                                          const std::string& profileName,
                                          RestartFn restartFn,
                                          OperationOptions options) {
    RegisteredOperation operation;
    operation.id = id;
    operation.type = type;
    operation.profileId = profileId;
    operation.profileName = profileName;
    operation.startedAt = m_clock.now();
    operation.metadata = std::move(options.metadata);
    operation.restartFn = std::move(restartFn);
    operation.stopFn = std::move(options.stopFn);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_operations.find(id);
        if (it != m_operations.end()) {
            it->second.operation = operation;
        } else {
            m_operations.emplace(id, Entry{m_nextSequence++, operation});
        }
    }

    Logger::instance().debug("Operation registered: {} ({}) on profile {}", id, toString(type), profileName);
    operationRegistered.emit(OperationRegisteredEvent{operation});
}

void OperationRegistry::unregisterOperation(const std::string& id) {
    OperationType type;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_operations.find(id);
        if (it == m_operations.end()) {
            return;
        }
        type = it->second.operation.type;
        m_operations.erase(it);
    }

    Logger::instance().debug("Operation unregistered: {} ({})", id, toString(type));
    operationUnregistered.emit(OperationUnregisteredEvent{id, type});
}

void OperationRegistry::updateOperationProfile(const std::string& id,
                                               const std::string& newProfileId,
                                               const std::string& newProfileName) {
    std::string oldProfileId;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_operations.find(id);
        if (it == m_operations.end()) {
            return;
        }
        oldProfileId = it->second.operation.profileId;
        it->second.operation.profileId = newProfileId;
        it->second.operation.profileName = newProfileName;
    }

    operationProfileUpdated.emit(OperationProfileUpdatedEvent{id, oldProfileId, newProfileId});
}

// -- Restart sweep --

size_t OperationRegistry::restartAllOnProfile(const std::string& oldProfileId,
                                              const std::string& newProfileId,
                                              const std::string& newProfileName) {
    std::vector<RegisteredOperation> snapshot = getOperationsByProfile(oldProfileId);
    if (snapshot.empty()) {
        Logger::instance().debug("No operations to restart on profile {}", oldProfileId);
        return 0;
    }

    Logger::instance().info("Restarting {} operation(s) from profile {} on {}",
                            snapshot.size(), oldProfileId, newProfileId);

    size_t restarted = 0;

    for (const auto& operation : snapshot) {
        try {
            if (operation.stopFn) {
                std::future<void> stopped = operation.stopFn();
                if (stopped.valid()) {
                    stopped.get();
                }
            }

            std::future<bool> outcome = operation.restartFn(newProfileId);
            bool success = outcome.valid() && outcome.get();

            if (!success) {
                Logger::instance().warn("Operation {} did not restart, still on {}", operation.id, oldProfileId);
                continue;
            }

            ++restarted;
            // restartFn may have re-registered under the same id; update whatever is there now
            updateOperationProfile(operation.id, newProfileId, newProfileName);
            operationRestarted.emit(OperationRestartedEvent{operation.id, oldProfileId, newProfileId});

        } catch (const std::exception& e) {
            Logger::instance().error("Operation {} failed to restart: {}", operation.id, e.what());
        }
    }

    Logger::instance().info("Restart sweep {} -> {}: {}/{} succeeded",
                            oldProfileId, newProfileId, restarted, snapshot.size());

    if (restarted > 0) {
        operationsRestarted.emit(OperationsRestartedEvent{restarted, oldProfileId, newProfileId});
    }
    return restarted;
}

// -- Queries --

std::vector<OperationRegistry::Entry> OperationRegistry::orderedEntries() const {
    std::vector<Entry> entries;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        entries.reserve(m_operations.size());
        for (const auto& [id, entry] : m_operations) {
            entries.push_back(entry);
        }
    }

    std::sort(entries.begin(), entries.end(),
        [](const Entry& a, const Entry& b) { return a.sequence < b.sequence; });
    return entries;
}

std::vector<RegisteredOperation> OperationRegistry::getOperationsByProfile(const std::string& profileId) const {
    std::vector<RegisteredOperation> result;
    for (const auto& entry : orderedEntries()) {
        if (entry.operation.profileId == profileId) {
            result.push_back(entry.operation);
        }
    }
    return result;
}

std::map<std::string, std::vector<RegisteredOperation>> OperationRegistry::getAllOperationsByProfile() const {
    std::map<std::string, std::vector<RegisteredOperation>> result;
    for (const auto& entry : orderedEntries()) {
        result[entry.operation.profileId].push_back(entry.operation);
    }
    return result;
}

std::optional<RegisteredOperation> OperationRegistry::getOperation(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_operations.find(id);
    if (it == m_operations.end()) {
        return std::nullopt;
    }
    return it->second.operation;
}

bool OperationRegistry::hasOperation(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_operations.count(id) > 0;
}

size_t OperationRegistry::getOperationCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_operations.size();
}

OperationSummary OperationRegistry::getSummary() const {
    OperationSummary summary;
    for (const auto& entry : orderedEntries()) {
        summary.byProfile[entry.operation.profileId].push_back(entry.operation.id);
        summary.byType[entry.operation.type]++;
        summary.totalRunning++;
    }
    return summary;
}

void OperationRegistry::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_operations.clear();
    Logger::instance().debug("All operations cleared");
}

} // namespace keyrotor::core::rotation
