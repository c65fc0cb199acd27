// FrameClock.h - Fixed-period frame pacing for the render worker
//
// One step() call is one frame. When a frame overruns the period the next
// frame starts immediately: no backlog, no catch-up, no skipped frames.

#ifndef LEDPLAYER_FRAME_CLOCK_H
#define LEDPLAYER_FRAME_CLOCK_H

#include <chrono>

namespace ledplayer {

class FrameClock {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::nanoseconds;

    static constexpr double kDefaultTargetFps = 60.0;

    explicit FrameClock(double targetFps = kDefaultTargetFps) { setTargetFps(targetFps); }

    // Non-positive rates fall back to the default
    void setTargetFps(double fps) {
        if (fps <= 0.0) fps = kDefaultTargetFps;
        targetFps_ = fps;
        period_ = std::chrono::duration_cast<Duration>(std::chrono::duration<double>(1.0 / fps));
    }

    double targetFps() const { return targetFps_; }
    Duration period() const { return period_; }

    // max(0, period - elapsed)
    Duration sleepFor(Duration elapsed) const {
        if (elapsed >= period_) return Duration::zero();
        return period_ - elapsed;
    }

    // Frame bookkeeping used by the worker loop
    Clock::time_point beginFrame() {
        frameStart_ = Clock::now();
        return frameStart_;
    }

    // Elapsed time since beginFrame()
    Duration endFrame() {
        return std::chrono::duration_cast<Duration>(Clock::now() - frameStart_);
    }

private:
    double targetFps_ = kDefaultTargetFps;
    Duration period_{};
    Clock::time_point frameStart_{};
};

}  // namespace ledplayer

#endif  // LEDPLAYER_FRAME_CLOCK_H
