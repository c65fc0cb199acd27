// test_frame_clock.cpp - Tests for frame pacing, the frame window and the interrupt signal
//
// Run: ./test_frame_clock

#include <chrono>
#include <thread>

#include "../shared/FrameClock.h"
#include "../shared/InterruptSignal.h"
#include "../shared/frame_window.h"
#include "test_framework.h"

using namespace ledplayer;
using namespace std::chrono_literals;

// =============================================================================
// FrameClock
// =============================================================================

TEST(period_matches_target_rate) {
    FrameClock clock(50.0);
    ASSERT_EQ(clock.period(), std::chrono::nanoseconds(20000000));

    clock.setTargetFps(60.0);
    ASSERT_TRUE(clock.period() > 16666000ns);
    ASSERT_TRUE(clock.period() < 16668000ns);
}

TEST(invalid_rate_uses_default) {
    FrameClock clock(0.0);
    ASSERT_FLOAT_EQ(clock.targetFps(), FrameClock::kDefaultTargetFps, 1e-9);
    clock.setTargetFps(-5.0);
    ASSERT_FLOAT_EQ(clock.targetFps(), FrameClock::kDefaultTargetFps, 1e-9);
}

TEST(sleep_fills_remaining_period) {
    FrameClock clock(100.0);  // 10 ms
    ASSERT_EQ(clock.sleepFor(3ms), std::chrono::nanoseconds(7ms));
    ASSERT_EQ(clock.sleepFor(0ms), std::chrono::nanoseconds(10ms));
}

TEST(overrun_does_not_sleep) {
    FrameClock clock(100.0);
    ASSERT_EQ(clock.sleepFor(10ms), FrameClock::Duration::zero());
    ASSERT_EQ(clock.sleepFor(25ms), FrameClock::Duration::zero());
}

TEST(end_frame_measures_elapsed) {
    FrameClock clock;
    clock.beginFrame();
    std::this_thread::sleep_for(2ms);
    const FrameClock::Duration elapsed = clock.endFrame();
    ASSERT_TRUE(elapsed >= 2ms);
}

// =============================================================================
// FrameWindow
// =============================================================================

TEST(window_needs_two_samples) {
    FrameWindow window;
    const auto t0 = std::chrono::steady_clock::time_point();
    window.add(t0, 0.01);
    ASSERT_FLOAT_EQ(window.fps(), 0.0, 1e-9);
    ASSERT_FLOAT_EQ(window.meanDuration(), 0.0, 1e-9);
    ASSERT_EQ(window.count(), 1u);
}

TEST(window_prunes_by_newest_timestamp) {
    FrameWindow window(1s);
    const auto t0 = std::chrono::steady_clock::time_point();
    window.add(t0, 0.1);
    window.add(t0 + 500ms, 0.1);
    window.add(t0 + 1000ms, 0.1);  // t0 sits exactly on the cutoff and is dropped

    ASSERT_EQ(window.count(), 2u);
    ASSERT_FLOAT_EQ(window.fps(), 4.0, 1e-9);
    ASSERT_FLOAT_EQ(window.meanDuration(), 0.1, 1e-9);

    window.reset();
    ASSERT_EQ(window.count(), 0u);
}

TEST(window_identical_timestamps_report_zero) {
    FrameWindow window;
    const auto t0 = std::chrono::steady_clock::time_point();
    window.add(t0, 0.01);
    window.add(t0, 0.03);
    ASSERT_FLOAT_EQ(window.fps(), 0.0, 1e-9);
    ASSERT_FLOAT_EQ(window.meanDuration(), 0.02, 1e-9);
}

// =============================================================================
// InterruptSignal
// =============================================================================

TEST(signal_set_and_clear) {
    InterruptSignal signal;
    ASSERT_FALSE(signal.isSet());
    signal.set();
    ASSERT_TRUE(signal.isSet());
    ASSERT_TRUE(signal.waitFor(0ms));
    signal.clear();
    ASSERT_FALSE(signal.isSet());
}

TEST(wait_times_out_when_not_set) {
    InterruptSignal signal;
    const auto start = std::chrono::steady_clock::now();
    ASSERT_FALSE(signal.waitFor(20ms));
    ASSERT_TRUE(std::chrono::steady_clock::now() - start >= 15ms);
}

TEST(wait_wakes_on_set) {
    InterruptSignal signal;
    std::thread setter([&]() {
        std::this_thread::sleep_for(10ms);
        signal.set();
    });

    const auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(signal.waitFor(2s));
    ASSERT_TRUE(std::chrono::steady_clock::now() - start < 1s);
    setter.join();
}

int main() {
    return runAllTests("FrameClock - Unit Tests");
}
