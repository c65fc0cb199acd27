// PerformanceRecorder.cpp - Frame-rate estimator and system metrics sampler

#include "PerformanceRecorder.h"

#include <unistd.h>

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ledplayer {

PerformanceRecorder::PerformanceRecorder() : PerformanceRecorder(nullptr, Options()) {}

PerformanceRecorder::PerformanceRecorder(std::shared_ptr<MetricsSource> source)
    : PerformanceRecorder(std::move(source), Options()) {}

PerformanceRecorder::PerformanceRecorder(std::shared_ptr<MetricsSource> source, Options options,
                                         TimeSource timeSource)
    : source_(std::move(source)),
      options_(options),
      now_(timeSource ? std::move(timeSource) : systemTimeSource()),
      frames_(options.window),
      processId_(static_cast<int>(::getpid())) {}

PerformanceRecorder::~PerformanceRecorder() {
    stopMonitoring();
}

// =============================================================================
// Frame samples
// =============================================================================

void PerformanceRecorder::recordFrame(std::chrono::nanoseconds frameTime) {
    recordFrameSeconds(std::chrono::duration<double>(frameTime).count());
}

void PerformanceRecorder::recordFrameSeconds(double frameTimeSec) {
    const auto timestamp = now_();

    std::lock_guard<std::mutex> lock(metricsMutex_);
    frames_.add(timestamp, frameTimeSec);
    framesRecorded_++;

    // Both read 0 until the window holds 2 samples
    ledFps_ = frames_.fps();
    ledFrameTimeSec_ = frames_.meanDuration();
}

// =============================================================================
// System metrics sampler
// =============================================================================

void PerformanceRecorder::startMonitoring() {
    bool expected = false;
    if (!monitoring_.compare_exchange_strong(expected, true)) {
        return;  // Already running
    }

    run_ = std::make_shared<SamplerRun>();
    std::promise<void> exited;
    samplerExited_ = exited.get_future();
    samplerThread_ = std::thread(&PerformanceRecorder::samplerLoop, this, run_, std::move(exited));
}

bool PerformanceRecorder::stopMonitoring() {
    if (!monitoring_.load()) return true;

    {
        std::lock_guard<std::mutex> lock(run_->wakeMutex);
        run_->stopRequested.store(true);
    }
    run_->wakeCV.notify_all();

    bool exitedInTime = true;
    if (samplerThread_.joinable()) {
        if (samplerExited_.wait_for(options_.stopTimeout) == std::future_status::ready) {
            samplerThread_.join();
        } else {
            // A blocked metrics source keeps the sampler alive; let it finish on its own
            std::cerr << "[PerformanceRecorder] WARNING: sampler did not stop within "
                      << options_.stopTimeout.count() << "ms" << std::endl;
            samplerThread_.detach();
            exitedInTime = false;
        }
    }

    monitoring_.store(false);
    return exitedInTime;
}

void PerformanceRecorder::samplerLoop(std::shared_ptr<SamplerRun> run, std::promise<void> exited) {
    while (!run->stopRequested.load()) {
        pollOnce();

        std::unique_lock<std::mutex> lock(run->wakeMutex);
        run->wakeCV.wait_for(lock, options_.pollInterval, [&run]() { return run->stopRequested.load(); });
    }
    exited.set_value();
}

bool PerformanceRecorder::pollOnce() {
    if (!source_) return false;

    SystemMetrics metrics;
    try {
        metrics = source_->sample();
    } catch (const std::exception& e) {
        std::cerr << "[PerformanceRecorder] Performance monitoring error: " << e.what() << std::endl;
        std::lock_guard<std::mutex> lock(metricsMutex_);
        samplingFailures_++;
        return false;
    }

    std::lock_guard<std::mutex> lock(metricsMutex_);
    latest_ = std::move(metrics);
    return true;
}

// =============================================================================
// Snapshot
// =============================================================================

PerformanceSummary PerformanceRecorder::getSummary() const {
    std::lock_guard<std::mutex> lock(metricsMutex_);

    PerformanceSummary summary;
    summary.cpuPercent = latest_.cpuPercent;
    summary.memoryPercent = latest_.memoryPercent;
    summary.ledFps = ledFps_;
    summary.ledFrameTimeMs = ledFrameTimeSec_ * 1000.0;
    summary.processId = latest_.processId != 0 ? latest_.processId : processId_;
    summary.threadCount = latest_.threadCount;
    summary.cpuCount = latest_.cpuCount;
    summary.perCorePercent = latest_.perCorePercent;
    summary.cpuAffinity = latest_.cpuAffinity;
    summary.framesRecorded = framesRecorded_;
    summary.samplingFailures = samplingFailures_;
    return summary;
}

void PerformanceRecorder::reset() {
    std::lock_guard<std::mutex> lock(metricsMutex_);
    frames_.reset();
    ledFps_ = 0.0;
    ledFrameTimeSec_ = 0.0;
    framesRecorded_ = 0;
}

// =============================================================================
// Report formatting
// =============================================================================

std::string formatPerformanceReport(const PerformanceSummary& s, double targetFps) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);

    char timeBuf[16] = {0};
    std::time_t t = std::time(nullptr);
    std::tm localTm{};
    if (localtime_r(&t, &localTm) != nullptr) {
        std::strftime(timeBuf, sizeof(timeBuf), "%H:%M:%S", &localTm);
    }

    oss << "System Performance Monitor - " << timeBuf << "\n\n";

    oss << "CPU & Memory:\n";
    oss << "  Overall CPU Usage: " << s.cpuPercent << "%\n";
    oss << "  Memory Usage: " << s.memoryPercent << "%\n";
    oss << "  CPU Count: ";
    if (s.cpuCount > 0) {
        oss << s.cpuCount;
    } else {
        oss << "Unknown";
    }
    oss << "\n";
    oss << "  CPU Affinity: ";
    if (s.cpuAffinity.empty()) {
        oss << "Not available";
    } else {
        oss << "[";
        for (size_t i = 0; i < s.cpuAffinity.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << s.cpuAffinity[i];
        }
        oss << "]";
    }
    oss << "\n\n";

    oss << "Per-Core Usage:";
    for (size_t i = 0; i < s.perCorePercent.size(); ++i) {
        // Cores 0-1 are left to the UI, the render worker is hinted onto 2-3
        const char* role = (i < 2) ? "UI" : "LED";
        oss << "\n  Core " << i << " (" << role << "): " << s.perCorePercent[i] << "%";
    }
    oss << "\n\n";

    oss << "LED Processing:\n";
    oss << "  LED FPS: " << s.ledFps << " (target: " << std::setprecision(0) << targetFps << ")\n";
    oss << std::setprecision(1);
    oss << "  Frame Time: " << s.ledFrameTimeMs << " ms (target: <" << (1000.0 / targetFps) << "ms)\n\n";

    oss << "Threading:\n";
    oss << "  Process ID: " << s.processId << "\n";
    oss << "  Active Threads: " << s.threadCount << "\n";
    return oss.str();
}

}  // namespace ledplayer
