// system_metrics.cpp - /proc readers for the performance recorder

#include "system_metrics.h"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "platform.h"

namespace ledplayer {

namespace {

std::string readWholeFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

}  // namespace

std::vector<CpuTimes> parseProcStat(const std::string& text) {
    std::vector<CpuTimes> result;
    std::istringstream lines(text);
    std::string line;

    while (std::getline(lines, line)) {
        if (line.compare(0, 3, "cpu") != 0) continue;

        std::istringstream iss(line);
        std::string label;
        iss >> label;

        // user nice system idle iowait irq softirq steal
        uint64_t fields[8] = {0, 0, 0, 0, 0, 0, 0, 0};
        int parsed = 0;
        while (parsed < 8 && iss >> fields[parsed]) {
            parsed++;
        }
        if (parsed < 4) {
            throw std::runtime_error("malformed /proc/stat line: " + line);
        }

        CpuTimes times;
        for (int i = 0; i < parsed; ++i) {
            times.total += fields[i];
        }
        const uint64_t idle = fields[3] + fields[4];
        times.busy = times.total - idle;
        result.push_back(times);
    }

    if (result.empty()) {
        throw std::runtime_error("no cpu lines in /proc/stat");
    }
    return result;
}

double parseMemInfoPercent(const std::string& text) {
    std::istringstream lines(text);
    std::string line;
    uint64_t total = 0;
    uint64_t available = 0;
    bool haveTotal = false;
    bool haveAvailable = false;

    while (std::getline(lines, line)) {
        std::istringstream iss(line);
        std::string key;
        uint64_t value = 0;
        if (!(iss >> key >> value)) continue;

        if (key == "MemTotal:") {
            total = value;
            haveTotal = true;
        } else if (key == "MemAvailable:") {
            available = value;
            haveAvailable = true;
        }
    }

    if (!haveTotal || !haveAvailable || total == 0) {
        throw std::runtime_error("MemTotal/MemAvailable missing from /proc/meminfo");
    }
    if (available > total) available = total;
    return 100.0 * static_cast<double>(total - available) / static_cast<double>(total);
}

double cpuPercentBetween(const CpuTimes& previous, const CpuTimes& current) {
    if (current.total <= previous.total || current.busy < previous.busy) {
        return 0.0;
    }
    const double totalDelta = static_cast<double>(current.total - previous.total);
    const double busyDelta = static_cast<double>(current.busy - previous.busy);
    return 100.0 * busyDelta / totalDelta;
}

ProcMetricsSource::ProcMetricsSource(std::string statPath, std::string meminfoPath)
    : statPath_(std::move(statPath)), meminfoPath_(std::move(meminfoPath)) {}

SystemMetrics ProcMetricsSource::sample() {
    const std::vector<CpuTimes> current = parseProcStat(readWholeFile(statPath_));

    SystemMetrics metrics;
    metrics.memoryPercent = parseMemInfoPercent(readWholeFile(meminfoPath_));

    if (previous_.size() == current.size()) {
        metrics.cpuPercent = cpuPercentBetween(previous_[0], current[0]);
        for (size_t i = 1; i < current.size(); ++i) {
            metrics.perCorePercent.push_back(cpuPercentBetween(previous_[i], current[i]));
        }
    } else {
        metrics.perCorePercent.assign(current.size() - 1, 0.0);
    }
    previous_ = current;

    const ProcessStats stats = getProcessStats();
    metrics.processId = stats.processId;
    metrics.threadCount = stats.totalThreads;
    metrics.cpuCount = getCpuCount();
    metrics.cpuAffinity = getCpuAffinity();
    return metrics;
}

}  // namespace ledplayer
