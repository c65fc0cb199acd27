// led_player.cpp - LED Theme Player (Linux)
// Runs the theme render worker against an in-memory strip and shows it in an
// SDL2 preview window (or runs headless for a fixed duration).

#include <SDL.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "../shared/PerformanceRecorder.h"
#include "../shared/PixelSink.h"
#include "../shared/RenderController.h"
#include "../shared/ThemeRegistry.h"
#include "../shared/led_instrumentation.h"
#include "../shared/version.h"
#include "builtin_themes.h"
#include "led_preview_window.h"
#include "platform.h"
#include "system_metrics.h"

using namespace ledplayer;

// =============================================================================
// Global shutdown flag for graceful termination
// =============================================================================
static std::atomic<bool> g_shutdownRequested{false};

// Signal handler for graceful shutdown (SIGINT, SIGTERM)
void signalHandler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        g_shutdownRequested.store(true);
    }
}

void installSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

// =============================================================================
// Command line
// =============================================================================

struct PlayerOptions {
    long ledCount = 300;
    long brightness = 255;
    long targetFps = 60;
    std::string themeId = "null";
    bool headless = false;
    double durationSec = 0.0;  // 0 = until interrupted
    bool showStats = false;
    bool trace = false;
    bool listThemes = false;
    bool schedulingHints = true;
};

void printHelp(const char* programName) {
    std::cerr << LedPlayerVersion::getVersionBanner() << "\n\n";
    std::cerr << "USAGE:\n";
    std::cerr << "    " << programName << " [OPTIONS]\n\n";
    std::cerr << "DESCRIPTION:\n";
    std::cerr << "    Plays animated themes on an addressable LED strip. A single render\n";
    std::cerr << "    worker runs the selected theme at a fixed frame rate; the strip is\n";
    std::cerr << "    shown in a preview window.\n\n";
    std::cerr << "OPTIONS:\n";
    std::cerr << "    -h, --help          Show this help message and exit\n";
    std::cerr << "    -v, --version       Show version information and exit\n";
    std::cerr << "    --leds N            Number of LEDs on the strip (default 300)\n";
    std::cerr << "    --brightness N      Initial brightness 0-255 (default 255)\n";
    std::cerr << "    --theme ID          Theme to start with (default: null, strip off)\n";
    std::cerr << "    --fps N             Target frame rate (default 60)\n";
    std::cerr << "    --headless          No preview window\n";
    std::cerr << "    --duration SEC      Exit after SEC seconds\n";
    std::cerr << "    --stats             Print the performance report every second\n";
    std::cerr << "    --trace             Log render state changes and episodes\n";
    std::cerr << "    --list-themes       List available themes and exit\n";
    std::cerr << "    --no-hints          Do not raise render thread priority or pin it to cores\n\n";
    std::cerr << "KEYBOARD CONTROLS:\n";
    std::cerr << "    1-9           Select theme by position in --list-themes\n";
    std::cerr << "    0             Null theme (stop animating)\n";
    std::cerr << "    O             All LEDs off\n";
    std::cerr << "    W             All LEDs white\n";
    std::cerr << "    +/-           Brightness up/down\n";
    std::cerr << "    S             Print the performance report\n";
    std::cerr << "    Q, Escape     Quit player\n\n";
    std::cerr << "EXAMPLES:\n";
    std::cerr << "    " << programName << " --theme rainbow\n";
    std::cerr << "    " << programName << " --leds 144 --theme ocean --brightness 96\n";
    std::cerr << "    " << programName << " --headless --theme twinkle --duration 10 --stats\n";
}

// Parse an integer option value within [minValue, maxValue]
bool parseIntArg(const char* option, const char* value, long minValue, long maxValue, long& out) {
    if (!value) {
        std::cerr << "Error: " << option << " requires a value" << std::endl;
        return false;
    }
    char* end = nullptr;
    long parsed = std::strtol(value, &end, 10);
    if (end == value || *end != '\0' || parsed < minValue || parsed > maxValue) {
        std::cerr << "Error: " << option << " expects an integer in [" << minValue << ", " << maxValue
                  << "], got '" << value << "'" << std::endl;
        return false;
    }
    out = parsed;
    return true;
}

// Returns -1 to continue, otherwise the exit code
int parseArguments(int argc, char* argv[], PlayerOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const char* next = (i + 1 < argc) ? argv[i + 1] : nullptr;

        if (strcmp(argv[i], "--version") == 0 || strcmp(argv[i], "-v") == 0) {
            std::cerr << LedPlayerVersion::getVersionBanner() << std::endl;
            return 0;
        }
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            printHelp(argv[0]);
            return 0;
        }

        if (strcmp(argv[i], "--leds") == 0) {
            if (!parseIntArg("--leds", next, 1, 10000, opts.ledCount)) return 1;
            i++;
        } else if (strcmp(argv[i], "--brightness") == 0) {
            if (!parseIntArg("--brightness", next, 0, 255, opts.brightness)) return 1;
            i++;
        } else if (strcmp(argv[i], "--fps") == 0) {
            if (!parseIntArg("--fps", next, 1, 1000, opts.targetFps)) return 1;
            i++;
        } else if (strcmp(argv[i], "--duration") == 0) {
            long seconds = 0;
            if (!parseIntArg("--duration", next, 1, 86400, seconds)) return 1;
            opts.durationSec = static_cast<double>(seconds);
            i++;
        } else if (strcmp(argv[i], "--theme") == 0) {
            if (!next) {
                std::cerr << "Error: --theme requires a value" << std::endl;
                return 1;
            }
            opts.themeId = next;
            i++;
        } else if (strcmp(argv[i], "--headless") == 0) {
            opts.headless = true;
        } else if (strcmp(argv[i], "--stats") == 0) {
            opts.showStats = true;
        } else if (strcmp(argv[i], "--trace") == 0) {
            opts.trace = true;
        } else if (strcmp(argv[i], "--list-themes") == 0) {
            opts.listThemes = true;
        } else if (strcmp(argv[i], "--no-hints") == 0) {
            opts.schedulingHints = false;
        } else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            std::cerr << "Use --help for usage information." << std::endl;
            return 1;
        }
    }
    return -1;
}

// =============================================================================
// Main loops
// =============================================================================

using Clock = std::chrono::steady_clock;
using DurationSec = std::chrono::duration<double>;

void printStats(const PerformanceRecorder& recorder, const RenderController& controller, double targetFps) {
    std::cout << "\n" << formatPerformanceReport(recorder.getSummary(), targetFps);
    std::cout << "  Theme: " << controller.currentThemeId() << " (" << renderStateName(controller.state())
              << ")\n" << std::endl;
}

void runHeadless(const PlayerOptions& opts, PerformanceRecorder& recorder, RenderController& controller) {
    const auto start = Clock::now();
    auto lastStats = start;

    while (!g_shutdownRequested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        const auto now = Clock::now();
        if (opts.durationSec > 0.0 && DurationSec(now - start).count() >= opts.durationSec) {
            break;
        }
        if (opts.showStats && now - lastStats >= std::chrono::seconds(1)) {
            printStats(recorder, controller, static_cast<double>(opts.targetFps));
            lastStats = now;
        }
    }
}

int runWindowed(const PlayerOptions& opts, const MemoryPixelSink& sink, const ThemeRegistry& registry,
                PerformanceRecorder& recorder, RenderController& controller) {
    if (SDL_Init(SDL_INIT_VIDEO) < 0) {
        std::cerr << "SDL init failed: " << SDL_GetError() << std::endl;
        return 1;
    }

    LedPreviewWindow preview(sink);
    if (!preview.open(std::string(LED_PLAYER_NAME) + " - Preview")) {
        SDL_Quit();
        return 1;
    }

    const std::vector<std::string> themeIds = registry.themeIds();
    int brightness = static_cast<int>(opts.brightness);
    bool showStats = opts.showStats;

    const auto start = Clock::now();
    auto lastTitle = start;
    auto lastStats = start;
    bool running = true;

    while (running && !g_shutdownRequested.load()) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_QUIT) {
                running = false;
            } else if (event.type == SDL_KEYDOWN && !event.key.repeat) {
                const SDL_Keycode key = event.key.keysym.sym;
                if (key == SDLK_q || key == SDLK_ESCAPE) {
                    running = false;
                } else if (key >= SDLK_1 && key <= SDLK_9) {
                    const size_t index = static_cast<size_t>(key - SDLK_1);
                    if (index < themeIds.size()) {
                        if (!controller.setTheme(themeIds[index])) {
                            std::cout << "Theme switch to '" << themeIds[index] << "' still pending" << std::endl;
                        }
                    }
                } else if (key == SDLK_0) {
                    controller.setTheme(NullTheme::kId);
                } else if (key == SDLK_o) {
                    controller.off();
                } else if (key == SDLK_w) {
                    controller.setSolidColor(255, 255, 255);
                } else if (key == SDLK_PLUS || key == SDLK_EQUALS || key == SDLK_KP_PLUS) {
                    brightness = std::min(255, brightness + 16);
                    controller.setBrightness(brightness);
                    std::cout << "Brightness: " << brightness << std::endl;
                } else if (key == SDLK_MINUS || key == SDLK_KP_MINUS) {
                    brightness = std::max(0, brightness - 16);
                    controller.setBrightness(brightness);
                    std::cout << "Brightness: " << brightness << std::endl;
                } else if (key == SDLK_s) {
                    showStats = !showStats;
                    printStats(recorder, controller, static_cast<double>(opts.targetFps));
                }
            }
        }

        if (!preview.present()) {
            SDL_Delay(2);  // Nothing new from the worker
        }

        const auto now = Clock::now();
        if (now - lastTitle >= std::chrono::milliseconds(500)) {
            std::ostringstream title;
            title << LED_PLAYER_NAME << " - " << controller.currentThemeId() << " - " << std::fixed
                  << std::setprecision(1) << recorder.getSummary().ledFps << " FPS";
            preview.setTitle(title.str());
            lastTitle = now;
        }
        if (showStats && now - lastStats >= std::chrono::seconds(1)) {
            printStats(recorder, controller, static_cast<double>(opts.targetFps));
            lastStats = now;
        }
        if (opts.durationSec > 0.0 && DurationSec(now - start).count() >= opts.durationSec) {
            running = false;
        }
    }

    preview.close();
    SDL_Quit();
    return 0;
}

int main(int argc, char* argv[]) {
    PlayerOptions opts;
    int exitCode = parseArguments(argc, argv, opts);
    if (exitCode >= 0) {
        return exitCode;
    }

    ThemeRegistry registry;
    registerBuiltinThemes(registry);

    if (opts.listThemes) {
        int position = 1;
        for (const std::string& id : registry.themeIds()) {
            std::cout << "  " << position++ << "  " << id << "\n";
        }
        std::cout << "  0  " << NullTheme::kId << std::endl;
        return 0;
    }

    if (!ThemeRegistry::isNullId(opts.themeId) && !registry.lookup(opts.themeId)) {
        std::cerr << "Error: Unknown theme: " << opts.themeId << std::endl;
        std::cerr << "Use --list-themes to see the available themes." << std::endl;
        return 1;
    }

    std::cout << LedPlayerVersion::getStartupBanner() << std::endl;
    std::cout << getPlatformNote() << std::endl;
    installSignalHandlers();

    StripConfig strip;
    strip.ledCount = static_cast<size_t>(opts.ledCount);
    strip.brightness = static_cast<uint8_t>(opts.brightness);
    MemoryPixelSink sink(strip.ledCount, strip.brightness);
    PerformanceRecorder recorder(std::make_shared<ProcMetricsSource>());

    RenderConfig config;
    config.targetFps = static_cast<double>(opts.targetFps);
    RenderController controller(sink, registry, config);
    controller.setPerformanceRecorder(&recorder);
    if (opts.schedulingHints) {
        controller.setSchedulingHint(applyRenderThreadHints);
    }

#if LED_INSTRUMENTATION_ENABLED
    std::unique_ptr<instrumentation::HookInstaller> traceHooks;
    if (opts.trace) {
        traceHooks = std::make_unique<instrumentation::HookInstaller>();
        traceHooks
            ->onStateChange([](RenderState from, RenderState to) {
                std::cout << "[Trace] " << renderStateName(from) << " -> " << renderStateName(to) << std::endl;
            })
            .onEpisodeStart([](const std::string& id) { std::cout << "[Trace] episode start: " << id << std::endl; })
            .onEpisodeEnd([](const std::string& id, const std::string& reason) {
                std::cout << "[Trace] episode end: " << id << " (" << reason << ")" << std::endl;
            });
    }
#else
    if (opts.trace) {
        std::cerr << "Warning: --trace needs a build with LED_INSTRUMENTATION_ENABLED" << std::endl;
    }
#endif

    controller.setTheme(opts.themeId);
    recorder.startMonitoring();
    controller.start();

    if (opts.headless) {
        runHeadless(opts, recorder, controller);
        exitCode = 0;
    } else {
        exitCode = runWindowed(opts, sink, registry, recorder, controller);
    }

    std::cout << "Shutting down..." << std::endl;
    const bool workerStopped = controller.shutdown();
    recorder.stopMonitoring();

    if (!workerStopped) {
        // The worker still references the sink and the recorder on this stack
        std::cerr << "Render worker did not stop; exiting without cleanup" << std::endl;
        std::fflush(nullptr);
        std::_Exit(EXIT_FAILURE);
    }

    const PerformanceSummary summary = recorder.getSummary();
    std::cout << "Rendered " << controller.frameCount() << " frames in " << controller.episodeCount()
              << " episode(s)" << std::endl;
    if (summary.samplingFailures > 0) {
        std::cout << "Metrics sampling failed " << summary.samplingFailures << " time(s)" << std::endl;
    }
    return exitCode;
}
