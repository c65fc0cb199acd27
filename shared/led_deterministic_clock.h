// Copyright 2025 LED Theme Player Project
// SPDX-License-Identifier: MIT

#ifndef LED_DETERMINISTIC_CLOCK_H
#define LED_DETERMINISTIC_CLOCK_H

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>

namespace ledplayer {

// Time source used by the timing code (PerformanceRecorder, FrameClock).
// Defaults to std::chrono::steady_clock::now.
using SteadyClock = std::chrono::steady_clock;
using TimeSource = std::function<SteadyClock::time_point()>;

inline TimeSource systemTimeSource() {
    return []() { return SteadyClock::now(); };
}

namespace testing {

/**
 * DeterministicClock - Controllable steady clock for timing tests.
 *
 * Disabled: now() returns the real steady_clock time.
 * Enabled: now() returns a mocked time that only moves through
 * setCurrentTime() / advanceBy(). Thread-safe.
 */
class DeterministicClock {
public:
    using time_point = SteadyClock::time_point;
    using duration = SteadyClock::duration;

    DeterministicClock() : enabled_(false), mocked_time_(SteadyClock::now()) {}

    /**
     * Enable deterministic mode, starting from the current real time.
     */
    void enable() {
        std::lock_guard<std::mutex> lock(mutex_);
        mocked_time_ = SteadyClock::now();
        enabled_.store(true, std::memory_order_release);
    }

    void disable() { enabled_.store(false, std::memory_order_release); }

    bool isEnabled() const { return enabled_.load(std::memory_order_acquire); }

    void setCurrentTime(time_point t) {
        std::lock_guard<std::mutex> lock(mutex_);
        mocked_time_ = t;
    }

    template <typename Rep, typename Period>
    void advanceBy(std::chrono::duration<Rep, Period> delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        mocked_time_ += std::chrono::duration_cast<duration>(delta);
    }

    time_point now() const {
        if (enabled_.load(std::memory_order_acquire)) {
            std::lock_guard<std::mutex> lock(mutex_);
            return mocked_time_;
        }
        return SteadyClock::now();
    }

    /**
     * Adapter for components that take a TimeSource.
     * The clock must outlive every component holding the returned function.
     */
    TimeSource source() const {
        return [this]() { return now(); };
    }

private:
    std::atomic<bool> enabled_;
    mutable std::mutex mutex_;
    time_point mocked_time_;
};

}  // namespace testing
}  // namespace ledplayer

#endif  // LED_DETERMINISTIC_CLOCK_H
