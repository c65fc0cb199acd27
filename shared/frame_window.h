// frame_window.h - Time-windowed frame statistics for FPS and frame-time metrics
// Copyright (c) 2025 LED Theme Player Project

#ifndef SHARED_FRAME_WINDOW_H
#define SHARED_FRAME_WINDOW_H

#include <chrono>
#include <cstddef>
#include <deque>

namespace ledplayer {

// Sliding window of (timestamp, frame duration) samples.
// Samples older than the window span (relative to the newest sample) are
// dropped on every insertion. Not thread-safe; PerformanceRecorder guards it.
class FrameWindow {
   public:
    using time_point = std::chrono::steady_clock::time_point;

    explicit FrameWindow(std::chrono::nanoseconds span = std::chrono::seconds(1)) : span_(span) {}

    void add(time_point timestamp, double durationSec) {
        samples_.push_back({timestamp, durationSec});
        const time_point cutoff = timestamp - span_;
        // Strictly newer than the cutoff stays in the window
        while (!samples_.empty() && samples_.front().timestamp <= cutoff) {
            samples_.pop_front();
        }
    }

    // count / (newest - oldest); 0 with fewer than 2 samples or a zero span
    double fps() const {
        if (samples_.size() < 2) return 0.0;
        const double spanSec =
            std::chrono::duration<double>(samples_.back().timestamp - samples_.front().timestamp).count();
        if (spanSec <= 0.0) return 0.0;
        return static_cast<double>(samples_.size()) / spanSec;
    }

    // Mean frame duration in seconds; 0 with fewer than 2 samples
    double meanDuration() const {
        if (samples_.size() < 2) return 0.0;
        double sum = 0.0;
        for (const auto& s : samples_) sum += s.durationSec;
        return sum / static_cast<double>(samples_.size());
    }

    size_t count() const { return samples_.size(); }

    void reset() { samples_.clear(); }

   private:
    struct Sample {
        time_point timestamp;
        double durationSec;
    };

    std::deque<Sample> samples_;
    std::chrono::nanoseconds span_;
};

}  // namespace ledplayer

#endif  // SHARED_FRAME_WINDOW_H
