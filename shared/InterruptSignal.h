// InterruptSignal.h - Cooperative cancellation flag shared with running themes
//
// The render worker raises the signal to end an episode (switch or shutdown).
// Themes poll isSet() at least once per step; long inner loops should poll
// more often. waitFor() gives an interruptible sleep.

#ifndef LEDPLAYER_INTERRUPT_SIGNAL_H
#define LEDPLAYER_INTERRUPT_SIGNAL_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace ledplayer {

class InterruptSignal {
public:
    InterruptSignal() = default;

    InterruptSignal(const InterruptSignal&) = delete;
    InterruptSignal& operator=(const InterruptSignal&) = delete;

    void set() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            flag_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        flag_.store(false, std::memory_order_release);
    }

    bool isSet() const { return flag_.load(std::memory_order_acquire); }

    // Sleep up to `timeout`; returns true if the signal was (or became) set
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return flag_.load(std::memory_order_acquire); });
    }

private:
    std::atomic<bool> flag_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

}  // namespace ledplayer

#endif  // LEDPLAYER_INTERRUPT_SIGNAL_H
