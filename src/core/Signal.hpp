#pragma once

/**
 * Signal.hpp
 *
 * Typed observer list, one per event kind.
 * subscribe() returns a handle that detaches the callback when unsubscribed.
 */

#include "Logger.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace keyrotor::core {

/**
 * Subscription handle returned by Signal::subscribe
 */
class Subscription {
public:
    Subscription(uint64_t id, std::function<void(uint64_t)> detach)
        : m_id(id), m_detach(std::move(detach)), m_active(true) {}

    uint64_t getId() const { return m_id; }
    bool isActive() const { return m_active; }

    /**
     * Stop receiving events. Safe to call more than once, and safe to call
     * after the owning signal is gone.
     */
    void unsubscribe() {
        if (m_active.exchange(false) && m_detach) {
            m_detach(m_id);
        }
    }

private:
    uint64_t m_id;
    std::function<void(uint64_t)> m_detach;
    std::atomic<bool> m_active;
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

/**
 * Signal - Thread-safe publish/subscribe for a single payload type
 */
template<typename Event>
class Signal {
public:
    using Callback = std::function<void(const Event&)>;

    Signal() : m_state(std::make_shared<State>()) {}

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /**
     * Subscribe to the signal
     * @param callback Callback function
     * @return Subscription handle for unsubscribing
     */
    SubscriptionPtr subscribe(Callback callback) {
        std::lock_guard<std::mutex> lock(m_state->mutex);

        uint64_t id = m_state->nextId++;
        std::weak_ptr<State> weakState = m_state;
        auto subscription = std::make_shared<Subscription>(id, [weakState](uint64_t subId) {
            if (auto state = weakState.lock()) {
                state->remove(subId);
            }
        });

        m_state->entries.push_back({id, std::move(callback), subscription});
        return subscription;
    }

    /**
     * Emit an event to every active subscriber
     * @param event Event payload
     */
    void emit(const Event& event) const {
        std::vector<Callback> callbacks;

        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            for (const auto& entry : m_state->entries) {
                if (entry.subscription->isActive()) {
                    callbacks.push_back(entry.callback);
                }
            }
        }

        // Call callbacks outside of lock
        for (const auto& callback : callbacks) {
            try {
                callback(event);
            } catch (const std::exception& e) {
                Logger::instance().error("Event listener threw: {}", e.what());
            }
        }
    }

    size_t subscriberCount() const {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->entries.size();
    }

    /**
     * Drop all subscribers
     */
    void clear() {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->entries.clear();
    }

private:
    struct Entry {
        uint64_t id;
        Callback callback;
        SubscriptionPtr subscription;
    };

    struct State {
        std::mutex mutex;
        std::vector<Entry> entries;
        uint64_t nextId{0};

        void remove(uint64_t id) {
            std::lock_guard<std::mutex> lock(mutex);
            entries.erase(
                std::remove_if(entries.begin(), entries.end(),
                    [id](const Entry& entry) { return entry.id == id; }),
                entries.end()
            );
        }
    };

    std::shared_ptr<State> m_state;
};

} // namespace keyrotor::core
