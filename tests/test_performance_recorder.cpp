// test_performance_recorder.cpp - Unit tests for PerformanceRecorder and the report formatter
//
// Frame timestamps come from a DeterministicClock so FPS math is exact.
//
// Run: ./test_performance_recorder

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "../shared/PerformanceRecorder.h"
#include "../shared/led_deterministic_clock.h"
#include "test_framework.h"

using namespace ledplayer;
using namespace std::chrono_literals;
using ledplayer::testing::DeterministicClock;

// =============================================================================
// Fake metrics sources
// =============================================================================

class FixedSource : public MetricsSource {
public:
    SystemMetrics sample() override {
        calls++;
        SystemMetrics m;
        m.cpuPercent = 37.5;
        m.memoryPercent = 61.0;
        m.processId = 4242;
        m.threadCount = 7;
        m.cpuCount = 4;
        m.perCorePercent = {10.0, 20.0, 30.0, 40.0};
        m.cpuAffinity = {0, 1, 2, 3};
        return m;
    }

    std::atomic<int> calls{0};
};

// Fails every other call
class FlakySource : public MetricsSource {
public:
    SystemMetrics sample() override {
        if (calls++ % 2 == 1) {
            throw std::runtime_error("sensor read failed");
        }
        SystemMetrics m;
        m.cpuPercent = 12.0;
        return m;
    }

    std::atomic<int> calls{0};
};

// Blocks until released
class BlockingSource : public MetricsSource {
public:
    SystemMetrics sample() override {
        entered = true;
        while (!release.load()) {
            std::this_thread::sleep_for(1ms);
        }
        return SystemMetrics();
    }

    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
};

// The first caller blocks until released; every caller thread is counted
class FirstCallBlocksSource : public MetricsSource {
public:
    SystemMetrics sample() override {
        const std::thread::id self = std::this_thread::get_id();
        bool isFirst;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!hasFirst) {
                first = self;
                hasFirst = true;
            }
            isFirst = (self == first);
            if (isFirst) {
                firstThreadCalls++;
            } else {
                otherThreadCalls++;
            }
        }
        if (isFirst) {
            entered = true;
            while (!release.load()) {
                std::this_thread::sleep_for(1ms);
            }
        }
        return SystemMetrics();
    }

    std::mutex mutex;
    std::thread::id first;
    bool hasFirst = false;
    std::atomic<int> firstThreadCalls{0};
    std::atomic<int> otherThreadCalls{0};
    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
};

static PerformanceRecorder::Options fastOptions() {
    PerformanceRecorder::Options options;
    options.pollInterval = 10ms;
    options.stopTimeout = 200ms;
    return options;
}

// =============================================================================
// Frame-rate estimation
// =============================================================================

TEST(sixty_frames_at_sixty_hz) {
    DeterministicClock clock;
    clock.enable();
    PerformanceRecorder recorder(nullptr, PerformanceRecorder::Options(), clock.source());

    for (int i = 0; i < 60; ++i) {
        recorder.recordFrameSeconds(0.004);
        clock.advanceBy(std::chrono::microseconds(16667));
    }

    const PerformanceSummary summary = recorder.getSummary();
    ASSERT_FLOAT_EQ(summary.ledFps, 60.0, 2.0);
    ASSERT_FLOAT_EQ(summary.ledFrameTimeMs, 4.0, 0.001);
    ASSERT_EQ(summary.framesRecorded, 60u);
}

TEST(fewer_than_two_samples_report_zero) {
    DeterministicClock clock;
    clock.enable();
    PerformanceRecorder recorder(nullptr, PerformanceRecorder::Options(), clock.source());

    PerformanceSummary summary = recorder.getSummary();
    ASSERT_FLOAT_EQ(summary.ledFps, 0.0, 1e-9);
    ASSERT_FLOAT_EQ(summary.ledFrameTimeMs, 0.0, 1e-9);

    recorder.recordFrameSeconds(0.010);
    summary = recorder.getSummary();
    ASSERT_FLOAT_EQ(summary.ledFps, 0.0, 1e-9);
    ASSERT_FLOAT_EQ(summary.ledFrameTimeMs, 0.0, 1e-9);
    ASSERT_EQ(summary.framesRecorded, 1u);
}

TEST(samples_older_than_window_are_dropped) {
    DeterministicClock clock;
    clock.enable();
    PerformanceRecorder recorder(nullptr, PerformanceRecorder::Options(), clock.source());

    // One slow second at 10 FPS with 50 ms frames...
    for (int i = 0; i < 10; ++i) {
        recorder.recordFrameSeconds(0.050);
        clock.advanceBy(100ms);
    }
    clock.advanceBy(2s);

    // ...then a fast burst at 100 FPS with 2 ms frames
    for (int i = 0; i < 20; ++i) {
        recorder.recordFrameSeconds(0.002);
        clock.advanceBy(10ms);
    }

    const PerformanceSummary summary = recorder.getSummary();
    ASSERT_FLOAT_EQ(summary.ledFrameTimeMs, 2.0, 0.001);
    // 20 samples spanning 190 ms
    ASSERT_FLOAT_EQ(summary.ledFps, 20.0 / 0.190, 0.5);
}

TEST(recording_nanoseconds_matches_seconds) {
    DeterministicClock clock;
    clock.enable();
    PerformanceRecorder recorder(nullptr, PerformanceRecorder::Options(), clock.source());

    recorder.recordFrame(8ms);
    clock.advanceBy(20ms);
    recorder.recordFrame(std::chrono::milliseconds(12));

    const PerformanceSummary summary = recorder.getSummary();
    ASSERT_FLOAT_EQ(summary.ledFrameTimeMs, 10.0, 0.001);
    ASSERT_FLOAT_EQ(summary.ledFps, 100.0, 0.001);
}

TEST(reset_clears_frames) {
    DeterministicClock clock;
    clock.enable();
    PerformanceRecorder recorder(nullptr, PerformanceRecorder::Options(), clock.source());

    for (int i = 0; i < 5; ++i) {
        recorder.recordFrameSeconds(0.01);
        clock.advanceBy(10ms);
    }
    recorder.reset();

    const PerformanceSummary summary = recorder.getSummary();
    ASSERT_EQ(summary.framesRecorded, 0u);
    ASSERT_FLOAT_EQ(summary.ledFps, 0.0, 1e-9);
}

// =============================================================================
// System metrics
// =============================================================================

TEST(poll_once_copies_metrics) {
    auto source = std::make_shared<FixedSource>();
    PerformanceRecorder recorder(source);

    ASSERT_TRUE(recorder.pollOnce());
    const PerformanceSummary summary = recorder.getSummary();
    ASSERT_FLOAT_EQ(summary.cpuPercent, 37.5, 1e-9);
    ASSERT_FLOAT_EQ(summary.memoryPercent, 61.0, 1e-9);
    ASSERT_EQ(summary.processId, 4242);
    ASSERT_EQ(summary.threadCount, 7);
    ASSERT_EQ(summary.cpuCount, 4);
    ASSERT_EQ(summary.perCorePercent.size(), 4u);
    ASSERT_EQ(summary.cpuAffinity.size(), 4u);
}

TEST(summary_reports_own_pid_without_source) {
    PerformanceRecorder recorder;
    ASSERT_EQ(recorder.getSummary().processId, static_cast<int>(::getpid()));
}

TEST(poll_without_source_fails) {
    PerformanceRecorder recorder;
    ASSERT_FALSE(recorder.pollOnce());
    ASSERT_EQ(recorder.getSummary().samplingFailures, 0u);
}

TEST(source_failure_keeps_previous_values) {
    auto source = std::make_shared<FlakySource>();
    PerformanceRecorder recorder(source);

    ASSERT_TRUE(recorder.pollOnce());
    ASSERT_FALSE(recorder.pollOnce());

    const PerformanceSummary summary = recorder.getSummary();
    ASSERT_FLOAT_EQ(summary.cpuPercent, 12.0, 1e-9);
    ASSERT_EQ(summary.samplingFailures, 1u);
}

TEST(sampler_thread_polls_and_stops) {
    auto source = std::make_shared<FixedSource>();
    PerformanceRecorder recorder(source, fastOptions());

    recorder.startMonitoring();
    recorder.startMonitoring();  // second call is a no-op
    ASSERT_TRUE(recorder.isMonitoring());
    ASSERT_TRUE(waitUntil([&] { return source->calls.load() >= 3; }));

    ASSERT_TRUE(recorder.stopMonitoring());
    ASSERT_FALSE(recorder.isMonitoring());

    const int calls = source->calls.load();
    std::this_thread::sleep_for(50ms);
    ASSERT_EQ(source->calls.load(), calls);
}

TEST(sampler_survives_failing_source) {
    auto source = std::make_shared<FlakySource>();
    PerformanceRecorder recorder(source, fastOptions());

    recorder.startMonitoring();
    ASSERT_TRUE(waitUntil([&] { return recorder.getSummary().samplingFailures >= 2u; }));
    ASSERT_TRUE(recorder.isMonitoring());
    ASSERT_TRUE(recorder.stopMonitoring());
}

TEST(stop_is_bounded_when_source_blocks) {
    // Leaked on purpose: the detached sampler may still be inside sample()
    auto source = std::make_shared<BlockingSource>();
    auto* recorder = new PerformanceRecorder(source, fastOptions());

    recorder->startMonitoring();
    ASSERT_TRUE(waitUntil([&] { return source->entered.load(); }));

    const auto start = std::chrono::steady_clock::now();
    ASSERT_FALSE(recorder->stopMonitoring());
    ASSERT_TRUE(std::chrono::steady_clock::now() - start < 1500ms);
    ASSERT_FALSE(recorder->isMonitoring());

    source->release = true;
}

TEST(restart_does_not_revive_detached_sampler) {
    // Leaked on purpose: the detached sampler may still reference the recorder
    auto source = std::make_shared<FirstCallBlocksSource>();
    auto* recorder = new PerformanceRecorder(source, fastOptions());

    recorder->startMonitoring();
    ASSERT_TRUE(waitUntil([&] { return source->entered.load(); }));
    ASSERT_FALSE(recorder->stopMonitoring());

    recorder->startMonitoring();
    ASSERT_TRUE(waitUntil([&] { return source->otherThreadCalls.load() >= 2; }));

    // The old sampler finishes its blocked call and exits instead of polling again
    source->release = true;
    std::this_thread::sleep_for(100ms);
    ASSERT_EQ(source->firstThreadCalls.load(), 1);
    ASSERT_TRUE(source->otherThreadCalls.load() >= 3);

    ASSERT_TRUE(recorder->stopMonitoring());
}

TEST(summary_does_not_wait_for_sampler) {
    auto source = std::make_shared<BlockingSource>();
    auto* recorder = new PerformanceRecorder(source, fastOptions());

    recorder->startMonitoring();
    ASSERT_TRUE(waitUntil([&] { return source->entered.load(); }));

    const auto start = std::chrono::steady_clock::now();
    recorder->recordFrameSeconds(0.01);
    recorder->getSummary();
    ASSERT_TRUE(std::chrono::steady_clock::now() - start < 100ms);

    source->release = true;
    ASSERT_TRUE(recorder->stopMonitoring());
    delete recorder;
}

// =============================================================================
// Report
// =============================================================================

TEST(report_lists_all_sections) {
    PerformanceSummary summary;
    summary.cpuPercent = 25.0;
    summary.memoryPercent = 50.0;
    summary.ledFps = 59.8;
    summary.ledFrameTimeMs = 3.2;
    summary.processId = 99;
    summary.threadCount = 5;
    summary.cpuCount = 4;
    summary.perCorePercent = {1.0, 2.0, 3.0, 4.0};
    summary.cpuAffinity = {2, 3};

    const std::string report = formatPerformanceReport(summary, 60.0);
    ASSERT_TRUE(report.find("System Performance Monitor") != std::string::npos);
    ASSERT_TRUE(report.find("Overall CPU Usage: 25.0%") != std::string::npos);
    ASSERT_TRUE(report.find("Memory Usage: 50.0%") != std::string::npos);
    ASSERT_TRUE(report.find("CPU Affinity: [2, 3]") != std::string::npos);
    ASSERT_TRUE(report.find("Core 0 (UI)") != std::string::npos);
    ASSERT_TRUE(report.find("Core 3 (LED)") != std::string::npos);
    ASSERT_TRUE(report.find("LED FPS: 59.8 (target: 60)") != std::string::npos);
    ASSERT_TRUE(report.find("Frame Time: 3.2 ms (target: <16.7ms)") != std::string::npos);
    ASSERT_TRUE(report.find("Process ID: 99") != std::string::npos);
    ASSERT_TRUE(report.find("Active Threads: 5") != std::string::npos);
}

TEST(report_marks_missing_cpu_info) {
    PerformanceSummary summary;
    const std::string report = formatPerformanceReport(summary);
    ASSERT_TRUE(report.find("CPU Count: Unknown") != std::string::npos);
    ASSERT_TRUE(report.find("CPU Affinity: Not available") != std::string::npos);
}

int main() {
    return runAllTests("PerformanceRecorder - Unit Tests");
}
