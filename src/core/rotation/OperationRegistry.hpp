#pragma once

/**
 * OperationRegistry.hpp
 *
 * Tracks long-running operations bound to an account so they can be stopped
 * and restarted on another account when that one is swapped out.
 */

#include "../Clock.hpp"
#include "../Signal.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace keyrotor::core::rotation {

using json = nlohmann::json;

enum class OperationType {
    SpecCreation,
    TaskExecution,
    PrReview,
    MrReview,
    Insights,
    Roadmap,
    Changelog,
    Ideation,
    Triage,
    Other
};

/**
 * "spec-creation", "task-execution", ...
 */
const char* toString(OperationType type);

/**
 * @return Parsed type, Other when unrecognized
 */
OperationType parseOperationType(const std::string& name);

/**
 * Restart the operation under a new account; resolves true on success
 */
using RestartFn = std::function<std::future<bool>(const std::string& newProfileId)>;
using StopFn = std::function<std::future<void>()>;

struct RegisteredOperation {
    std::string id;
    OperationType type{OperationType::Other};
    std::string profileId;
    std::string profileName;
    TimePoint startedAt;
    std::optional<json> metadata;
    RestartFn restartFn;
    StopFn stopFn;
};

struct OperationOptions {
    StopFn stopFn;
    std::optional<json> metadata;
};

struct OperationSummary {
    size_t totalRunning{0};
    std::map<std::string, std::vector<std::string>> byProfile;
    std::map<OperationType, size_t> byType;
};

// Events

struct OperationRegisteredEvent {
    RegisteredOperation operation;
};

struct OperationUnregisteredEvent {
    std::string operationId;
    OperationType type;
};

struct OperationRestartedEvent {
    std::string operationId;
    std::string oldProfileId;
    std::string newProfileId;
};

struct OperationsRestartedEvent {
    size_t count;
    std::string oldProfileId;
    std::string newProfileId;
};

struct OperationProfileUpdatedEvent {
    std::string operationId;
    std::string oldProfileId;
    std::string newProfileId;
};

/**
 * OperationRegistry - Owns the operation table; callers refer to entries by id.
 *
 * The table lock is never held while restartFn, stopFn or a listener runs,
 * so callbacks may re-register or unregister freely.
 */
class OperationRegistry {
public:
    explicit OperationRegistry(const Clock& clock);

    OperationRegistry(const OperationRegistry&) = delete;
    OperationRegistry& operator=(const OperationRegistry&) = delete;

    /**
     * Insert or overwrite an operation. An overwritten entry keeps its
     * position in registration order.
     */
    void registerOperation(const std::string& id,
                           OperationType type,
                           const std::string& profileId,
                           const std::string& profileName,
                           RestartFn restartFn,
                           OperationOptions options = {});

    /**
     * Remove an operation. No-op (and no event) when the id is unknown.
     */
    void unregisterOperation(const std::string& id);

    /**
     * Stop and restart every operation bound to oldProfileId, in
     * registration order, one at a time
     * @return Number of operations now bound to newProfileId
     */
    size_t restartAllOnProfile(const std::string& oldProfileId,
                               const std::string& newProfileId,
                               const std::string& newProfileName);

    void updateOperationProfile(const std::string& id,
                                const std::string& newProfileId,
                                const std::string& newProfileName);

    std::vector<RegisteredOperation> getOperationsByProfile(const std::string& profileId) const;
    std::map<std::string, std::vector<RegisteredOperation>> getAllOperationsByProfile() const;
    std::optional<RegisteredOperation> getOperation(const std::string& id) const;
    bool hasOperation(const std::string& id) const;
    size_t getOperationCount() const;
    OperationSummary getSummary() const;

    /**
     * Drop every operation without emitting events
     */
    void clear();

    Signal<OperationRegisteredEvent> operationRegistered;
    Signal<OperationUnregisteredEvent> operationUnregistered;
    Signal<OperationRestartedEvent> operationRestarted;
    Signal<OperationsRestartedEvent> operationsRestarted;
    Signal<OperationProfileUpdatedEvent> operationProfileUpdated;

private:
    struct Entry {
        uint64_t sequence;
        RegisteredOperation operation;
    };

    std::vector<Entry> orderedEntries() const;

    const Clock& m_clock;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Entry> m_operations;
    uint64_t m_nextSequence{0};
};

} // namespace keyrotor::core::rotation
