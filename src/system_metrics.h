// system_metrics.h - MetricsSource backed by /proc
//
// CPU percentages are deltas between consecutive sample() calls, so the
// first sample reports 0% (the same as a psutil-style first call).

#ifndef LEDPLAYER_SYSTEM_METRICS_H
#define LEDPLAYER_SYSTEM_METRICS_H

#include <cstdint>
#include <string>
#include <vector>

#include "PerformanceRecorder.h"

namespace ledplayer {

// Aggregate jiffies for one "cpu" line of /proc/stat
struct CpuTimes {
    uint64_t busy = 0;
    uint64_t total = 0;
};

// Parses /proc/stat text. Element 0 is the aggregate line, then one per core.
// Throws std::runtime_error when no cpu line is present.
std::vector<CpuTimes> parseProcStat(const std::string& text);

// Parses /proc/meminfo text into a used-memory percentage
// (MemTotal - MemAvailable). Throws std::runtime_error on missing fields.
double parseMemInfoPercent(const std::string& text);

// Percentage of busy time between two readings, 0 when no time passed
double cpuPercentBetween(const CpuTimes& previous, const CpuTimes& current);

class ProcMetricsSource : public MetricsSource {
public:
    // Paths are overridable for tests
    explicit ProcMetricsSource(std::string statPath = "/proc/stat",
                               std::string meminfoPath = "/proc/meminfo");

    SystemMetrics sample() override;

private:
    std::string statPath_;
    std::string meminfoPath_;
    std::vector<CpuTimes> previous_;
};

}  // namespace ledplayer

#endif  // LEDPLAYER_SYSTEM_METRICS_H
