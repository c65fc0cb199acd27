// platform.h - Platform abstraction for the LED Theme Player
// Provides process statistics and render thread scheduling hints

#pragma once

#include <string>
#include <vector>

//==============================================================================
// Platform Detection
//==============================================================================

#if defined(__linux__)
    #define PLATFORM_LINUX 1
    #define PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define PLATFORM_APPLE 1
    #define PLATFORM_NAME "macOS"
#else
    #define PLATFORM_UNKNOWN 1
    #define PLATFORM_NAME "Unknown"
#endif

//==============================================================================
// Process Statistics Structure
//==============================================================================

struct ProcessStats {
    int processId;          // getpid()
    int totalThreads;       // Total threads in process
    int activeThreads;      // Threads currently running (not idle/waiting)
};

// Cores the render worker is pinned to when the machine has at least 4
constexpr int kRenderCoreFirst = 2;
constexpr int kRenderCoreLast = 3;
constexpr int kRenderThreadNice = -5;

//==============================================================================
// Platform-Specific Implementations
//==============================================================================

#if defined(PLATFORM_LINUX)

// Linux: Use /proc filesystem and sched_* calls
#include <dirent.h>
#include <sched.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

#include <fstream>

inline ProcessStats getProcessStats() {
    ProcessStats stats = {static_cast<int>(getpid()), 0, 0};

    // Count threads from /proc/self/task, and those in R state
    DIR* taskDir = opendir("/proc/self/task");
    if (taskDir) {
        struct dirent* entry;
        while ((entry = readdir(taskDir)) != nullptr) {
            if (entry->d_name[0] == '.') continue;
            stats.totalThreads++;

            std::ifstream threadStat("/proc/self/task/" + std::string(entry->d_name) + "/stat");
            std::string line;
            if (threadStat.is_open() && std::getline(threadStat, line)) {
                size_t pos = line.rfind(')');
                if (pos != std::string::npos && pos + 2 < line.size() && line[pos + 2] == 'R') {
                    stats.activeThreads++;
                }
            }
        }
        closedir(taskDir);
    }

    return stats;
}

inline int getCpuCount() {
    long count = sysconf(_SC_NPROCESSORS_ONLN);
    return count > 0 ? static_cast<int>(count) : 0;
}

// Cores this process may run on; empty if the call fails
inline std::vector<int> getCpuAffinity() {
    std::vector<int> cores;
    cpu_set_t set;
    CPU_ZERO(&set);
    if (sched_getaffinity(0, sizeof(set), &set) != 0) {
        return cores;
    }
    for (int i = 0; i < CPU_SETSIZE; ++i) {
        if (CPU_ISSET(i, &set)) cores.push_back(i);
    }
    return cores;
}

// Raise priority of the calling thread and pin it to the render cores.
// Returns true if at least one hint took effect. Failing is normal without
// CAP_SYS_NICE and is never an error.
inline bool applyRenderThreadHints() {
    bool applied = false;

    pid_t tid = static_cast<pid_t>(syscall(SYS_gettid));
    if (setpriority(PRIO_PROCESS, static_cast<id_t>(tid), kRenderThreadNice) == 0) {
        applied = true;
    }

    if (getCpuCount() >= 4) {
        cpu_set_t set;
        CPU_ZERO(&set);
        for (int core = kRenderCoreFirst; core <= kRenderCoreLast; ++core) {
            CPU_SET(core, &set);
        }
        if (sched_setaffinity(0, sizeof(set), &set) == 0) {
            applied = true;
        }
    }

    return applied;
}

#else

// Other platforms: statistics unavailable, hints are no-ops
#include <thread>
#include <unistd.h>

inline ProcessStats getProcessStats() {
    return ProcessStats{static_cast<int>(getpid()), 0, 0};
}

inline int getCpuCount() {
    return static_cast<int>(std::thread::hardware_concurrency());
}

inline std::vector<int> getCpuAffinity() {
    return {};
}

inline bool applyRenderThreadHints() {
    return false;
}

#endif

//==============================================================================
// Platform Notes
//==============================================================================

inline const char* getPlatformNote() {
#if defined(PLATFORM_LINUX)
    return "Render thread hints need CAP_SYS_NICE to raise priority.";
#else
    return "Render thread hints are not supported on this platform.";
#endif
}
