// PerformanceRecorder.h - LED frame-rate estimator plus low-rate system metrics poll
//
// The render worker feeds frame durations through recordFrame(). A separate
// sampler thread polls a MetricsSource once per interval. getSummary() only
// takes the recorder's own short-lived lock, so it never waits on the render
// worker or on a slow metrics source.

#ifndef LEDPLAYER_PERFORMANCE_RECORDER_H
#define LEDPLAYER_PERFORMANCE_RECORDER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "frame_window.h"
#include "led_deterministic_clock.h"

namespace ledplayer {

// One reading from the host system
struct SystemMetrics {
    double cpuPercent = 0.0;             // System-wide CPU usage
    double memoryPercent = 0.0;          // System-wide memory usage
    int processId = 0;
    int threadCount = 0;                 // Threads in this process
    int cpuCount = 0;
    std::vector<double> perCorePercent;  // Empty when unavailable
    std::vector<int> cpuAffinity;        // Cores this process may run on; empty when unavailable
};

// Opaque source of CPU/memory numbers. sample() may throw; the recorder logs
// the failure and keeps the previous values for that cycle.
class MetricsSource {
public:
    virtual ~MetricsSource() = default;
    virtual SystemMetrics sample() = 0;
};

// Read-only snapshot returned by getSummary()
struct PerformanceSummary {
    double cpuPercent = 0.0;
    double memoryPercent = 0.0;
    double ledFps = 0.0;
    double ledFrameTimeMs = 0.0;
    int processId = 0;
    int threadCount = 0;

    int cpuCount = 0;
    std::vector<double> perCorePercent;
    std::vector<int> cpuAffinity;
    uint64_t framesRecorded = 0;  // Total since construction / reset()
    uint64_t samplingFailures = 0;
};

class PerformanceRecorder {
public:
    struct Options {
        std::chrono::milliseconds window{1000};        // Frame sample window
        std::chrono::milliseconds pollInterval{1000};  // System metrics poll
        std::chrono::milliseconds stopTimeout{2000};   // Bound on stopMonitoring()
    };

    PerformanceRecorder();
    explicit PerformanceRecorder(std::shared_ptr<MetricsSource> source);
    PerformanceRecorder(std::shared_ptr<MetricsSource> source, Options options,
                        TimeSource timeSource = systemTimeSource());
    ~PerformanceRecorder();

    PerformanceRecorder(const PerformanceRecorder&) = delete;
    PerformanceRecorder& operator=(const PerformanceRecorder&) = delete;

    // Called by the render worker after every frame
    void recordFrame(std::chrono::nanoseconds frameTime);
    void recordFrameSeconds(double frameTimeSec);

    // Sampler lifecycle
    void startMonitoring();
    bool stopMonitoring();  // false if the sampler did not exit within stopTimeout
    bool isMonitoring() const { return monitoring_.load(); }

    // Run one sampling cycle on the calling thread. Returns false (and logs)
    // if there is no source or the source failed.
    bool pollOnce();

    PerformanceSummary getSummary() const;

    void reset();

private:
    // Stop token for one sampler thread. A sampler detached by a timed-out
    // stopMonitoring() keeps its own token, so a later start never revives it.
    struct SamplerRun {
        std::atomic<bool> stopRequested{false};
        std::mutex wakeMutex;
        std::condition_variable wakeCV;
    };

    void samplerLoop(std::shared_ptr<SamplerRun> run, std::promise<void> exited);

    std::shared_ptr<MetricsSource> source_;
    Options options_;
    TimeSource now_;

    mutable std::mutex metricsMutex_;
    FrameWindow frames_;
    double ledFps_ = 0.0;
    double ledFrameTimeSec_ = 0.0;
    uint64_t framesRecorded_ = 0;
    SystemMetrics latest_;
    uint64_t samplingFailures_ = 0;
    const int processId_;

    std::atomic<bool> monitoring_{false};
    std::shared_ptr<SamplerRun> run_;
    std::thread samplerThread_;
    std::future<void> samplerExited_;
};

// Human-readable report (the debug page layout): timestamp, CPU & memory,
// per-core usage, LED FPS and frame time against the target, process info.
std::string formatPerformanceReport(const PerformanceSummary& summary, double targetFps = 60.0);

}  // namespace ledplayer

#endif  // LEDPLAYER_PERFORMANCE_RECORDER_H
