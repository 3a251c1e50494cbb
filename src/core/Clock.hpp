#pragma once

/**
 * Clock.hpp
 *
 * Wall-clock source used for cache ages, token expiry and retry backoff.
 */

#include <chrono>
#include <cstdint>
#include <thread>

namespace keyrotor::core {

using TimePoint = std::chrono::system_clock::time_point;
using Milliseconds = std::chrono::milliseconds;

class Clock {
public:
    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;

    /**
     * Block the calling thread (backoff between refresh attempts)
     */
    virtual void sleepFor(Milliseconds duration) = 0;

    /**
     * Current time as Unix epoch milliseconds
     */
    int64_t nowMs() const {
        return std::chrono::duration_cast<Milliseconds>(now().time_since_epoch()).count();
    }
};

class SystemClock : public Clock {
public:
    TimePoint now() const override {
        return std::chrono::system_clock::now();
    }

    void sleepFor(Milliseconds duration) override {
        std::this_thread::sleep_for(duration);
    }
};

} // namespace keyrotor::core
