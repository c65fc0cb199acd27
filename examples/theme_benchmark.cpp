// theme_benchmark.cpp - Benchmark built-in theme rendering and the paced render loop
//
// Part 1 steps every theme directly (no pacing) to measure raw frame cost.
// Part 2 runs each theme through the RenderController at the target rate and
// reports the achieved FPS and how long each switch took to be acknowledged.

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "../shared/InterruptSignal.h"
#include "../shared/PerformanceRecorder.h"
#include "../shared/PixelSink.h"
#include "../shared/RenderController.h"
#include "../shared/ThemeRegistry.h"
#include "../src/builtin_themes.h"

using namespace ledplayer;

using Clock = std::chrono::steady_clock;
using DurationMs = std::chrono::duration<double, std::milli>;

struct StepResult {
    std::string name;
    double avgMs = 0.0;
    double minMs = 0.0;
    double maxMs = 0.0;
};

struct PacedResult {
    std::string name;
    double fps = 0.0;
    double frameTimeMs = 0.0;
    double switchMs = 0.0;
    bool acknowledged = false;
};

StepResult benchmarkSteps(Theme& theme, size_t ledCount, int iterations) {
    StepResult result;
    result.name = theme.id();

    MemoryPixelSink sink(ledCount);
    InterruptSignal interrupt;
    ThemeContext context;
    context.ledCount = ledCount;

    ThemeResult init = theme.initialize(context, sink, interrupt);
    if (!init.ok()) {
        std::cerr << "  " << theme.id() << ": initialize failed: " << init.error() << std::endl;
        return result;
    }

    std::vector<double> times;
    times.reserve(iterations);
    for (int i = 0; i < iterations; i++) {
        auto start = Clock::now();
        theme.step();
        times.push_back(DurationMs(Clock::now() - start).count());
    }

    double sum = 0.0;
    result.minMs = times[0];
    result.maxMs = times[0];
    for (double t : times) {
        sum += t;
        result.minMs = std::min(result.minMs, t);
        result.maxMs = std::max(result.maxMs, t);
    }
    result.avgMs = sum / iterations;
    return result;
}

PacedResult benchmarkPaced(RenderController& controller, PerformanceRecorder& recorder, const std::string& id,
                           std::chrono::milliseconds runTime) {
    PacedResult result;
    result.name = id;

    auto start = Clock::now();
    result.acknowledged = controller.setTheme(id);
    result.switchMs = DurationMs(Clock::now() - start).count();

    // Let the window fill with frames of this theme only
    recorder.reset();
    std::this_thread::sleep_for(runTime);

    PerformanceSummary summary = recorder.getSummary();
    result.fps = summary.ledFps;
    result.frameTimeMs = summary.ledFrameTimeMs;
    return result;
}

int main(int argc, char* argv[]) {
    size_t ledCount = 300;
    int iterations = 2000;
    std::chrono::milliseconds runTime(2000);

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--leds") == 0 && i + 1 < argc) {
            ledCount = static_cast<size_t>(std::max(1, std::atoi(argv[++i])));
        } else if (strcmp(argv[i], "--iterations") == 0 && i + 1 < argc) {
            iterations = std::max(1, std::atoi(argv[++i]));
        } else if (strcmp(argv[i], "--seconds") == 0 && i + 1 < argc) {
            runTime = std::chrono::milliseconds(std::max(1, std::atoi(argv[++i])) * 1000);
        } else {
            std::cerr << "Usage: " << argv[0] << " [--leds N] [--iterations N] [--seconds N]" << std::endl;
            return 1;
        }
    }

    ThemeRegistry registry;
    registerBuiltinThemes(registry);
    const std::vector<std::string> ids = registry.themeIds();

    std::cout << "╔════════════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║           LED Theme Benchmark                                  ║" << std::endl;
    std::cout << "╚════════════════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
    std::cout << "LEDs: " << ledCount << ", steps per theme: " << iterations << ", paced run: " << runTime.count()
              << " ms per theme" << std::endl;
    std::cout << std::endl;

    // === Raw step cost ===
    std::cout << "Stepping themes directly..." << std::endl;
    std::vector<StepResult> stepResults;
    for (const std::string& id : ids) {
        stepResults.push_back(benchmarkSteps(*registry.lookup(id), ledCount, iterations));
    }

    std::cout << std::endl;
    std::cout << "╔═══════════════╦═══════════════╦═══════════════╦══════════════════╗" << std::endl;
    std::cout << "║ Theme         ║ Avg (ms)      ║ Min (ms)      ║ Max (ms)         ║" << std::endl;
    std::cout << "╠═══════════════╬═══════════════╬═══════════════╬══════════════════╣" << std::endl;
    for (const StepResult& r : stepResults) {
        std::cout << "║ " << std::left << std::setw(13) << r.name << " ║ " << std::right << std::setw(13) << std::fixed
                  << std::setprecision(4) << r.avgMs << " ║ " << std::setw(13) << r.minMs << " ║ " << std::setw(16)
                  << r.maxMs << " ║" << std::endl;
    }
    std::cout << "╚═══════════════╩═══════════════╩═══════════════╩══════════════════╝" << std::endl;
    std::cout << std::endl;

    // === Paced render loop ===
    std::cout << "Running themes through the render worker..." << std::endl;
    MemoryPixelSink sink(ledCount);
    PerformanceRecorder recorder;
    RenderConfig config;
    config.switchGracePeriod = std::chrono::milliseconds(500);
    RenderController controller(sink, registry, config);
    controller.setPerformanceRecorder(&recorder);
    controller.start();

    std::vector<PacedResult> pacedResults;
    for (const std::string& id : ids) {
        pacedResults.push_back(benchmarkPaced(controller, recorder, id, runTime));
    }
    controller.setTheme(NullTheme::kId);

    std::cout << std::endl;
    std::cout << "╔═══════════════╦═══════════════╦═══════════════╦══════════════════╗" << std::endl;
    std::cout << "║ Theme         ║ FPS           ║ Frame (ms)    ║ Switch ack (ms)  ║" << std::endl;
    std::cout << "╠═══════════════╬═══════════════╬═══════════════╬══════════════════╣" << std::endl;
    for (const PacedResult& r : pacedResults) {
        std::cout << "║ " << std::left << std::setw(13) << r.name << " ║ " << std::right << std::setw(13) << std::fixed
                  << std::setprecision(1) << r.fps << " ║ " << std::setw(13) << std::setprecision(3) << r.frameTimeMs
                  << " ║ " << std::setw(16) << std::setprecision(2) << r.switchMs << (r.acknowledged ? " " : "!")
                  << "║" << std::endl;
    }
    std::cout << "╚═══════════════╩═══════════════╩═══════════════╩══════════════════╝" << std::endl;
    std::cout << "(! = switch not acknowledged within the grace period)" << std::endl;
    std::cout << std::endl;

    if (!controller.shutdown()) {
        std::cerr << "Render worker did not stop in time" << std::endl;
        std::_Exit(EXIT_FAILURE);
    }
    std::cout << "Total frames: " << controller.frameCount() << " in " << controller.episodeCount() << " episodes"
              << std::endl;
    return 0;
}
