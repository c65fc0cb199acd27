// RenderController.h - Theme-hosting render loop for a single LED strip
//
// Threading model:
// - One render worker thread owns the PixelSink and runs theme episodes
//   (initialize once, then step once per frame at the target rate)
// - Caller threads (UI, CLI, tests) only post commands and wait for the
//   worker to acknowledge them; they never touch the sink or a theme
// - Cancellation is cooperative: the worker raises the interrupt signal and
//   the running theme returns from step() at its next check
//
// States: Idle -> Initializing -> Running -> Switching -> Idle ...,
// and ShuttingDown (terminal) once shutdown() is called.

#ifndef LEDPLAYER_RENDER_CONTROLLER_H
#define LEDPLAYER_RENDER_CONTROLLER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>

#include "FrameClock.h"
#include "InterruptSignal.h"
#include "LedTypes.h"
#include "PixelSink.h"
#include "Theme.h"
#include "ThemeRegistry.h"

namespace ledplayer {

class PerformanceRecorder;

struct RenderConfig {
    double targetFps = 60.0;
    std::chrono::milliseconds idlePollInterval{10};
    std::chrono::milliseconds initFailureBackoff{100};
    std::chrono::milliseconds switchGracePeriod{50};  // Bound on waiting for the worker's ack
    std::chrono::milliseconds shutdownTimeout{1000};
    uint32_t randomSeed = 0;
};

using ErrorCallback = std::function<void(const std::string& message)>;

// Optional latency hint run once on the worker thread before the first frame
// (thread priority, CPU affinity). Returning false only gets logged.
using SchedulingHint = std::function<bool()>;

class RenderController {
public:
    RenderController(PixelSink& sink, ThemeRegistry& registry, RenderConfig config = RenderConfig());
    ~RenderController();

    // Non-copyable, non-movable (owns thread)
    RenderController(const RenderController&) = delete;
    RenderController& operator=(const RenderController&) = delete;

    // Setup (call before start)
    void setPerformanceRecorder(PerformanceRecorder* recorder) { recorder_ = recorder; }
    void setSchedulingHint(SchedulingHint hint) { schedulingHint_ = std::move(hint); }

    // Replaceable at any time; the default logs to stderr
    void setErrorCallback(ErrorCallback callback);

    // Start the render worker (no-op if already started or shut down)
    void start();

    // Switch the active theme. nullptr, "" and "null" select the null theme;
    // an unknown id is reported and treated as null.
    // Returns true once the worker has adopted the theme. Returns false when
    // the request was ignored (another switch is still in flight), when the
    // grace period elapsed first (the switch still completes later), or after
    // shutdown.
    bool setTheme(Theme* theme);
    bool setTheme(const std::string& themeId);

    // Clamped to 0-255, applied by the worker between frames
    bool setBrightness(int brightness);

    // Switch to the null theme, then paint every pixel and flush
    bool setSolidColor(uint8_t r, uint8_t g, uint8_t b);
    bool off() { return setSolidColor(0, 0, 0); }

    // Stop the worker and join it for up to `timeout`. Returns false if the
    // worker is still stuck in a theme call; it is then left detached.
    bool shutdown();
    bool shutdown(std::chrono::milliseconds timeout);

    // State queries (thread-safe)
    RenderState state() const { return state_.load(); }
    std::string currentThemeId() const;
    bool isSwitchInProgress() const;
    bool hasSwitchTimedOut() const;
    bool isWorkerRunning() const { return workerAlive_.load(); }
    uint64_t episodeCount() const { return episodeCount_.load(); }
    uint64_t frameCount() const { return frameCount_.load(); }
    const RenderConfig& config() const { return config_; }

private:
    struct Command {
        enum class Type { SwitchTo, Fill, Brightness };
        Type type;
        Theme* theme;
        Rgb color;
        uint8_t brightness;
        uint64_t sequence;
    };

    void workerLoop(std::promise<void> exited);
    void runEpisode(Theme* theme);
    bool initializeTheme(Theme* theme);

    // Executes queued commands in order. With inEpisode set, only brightness
    // commands run; returns true when a switch-type command is waiting, which
    // means the current episode must end. Called with mutex_ held.
    bool drainCommands(std::unique_lock<std::mutex>& lock, bool inEpisode);
    void executeCommand(const Command& cmd);

    uint64_t postCommand(Command cmd, bool interruptEpisode);
    bool waitForAck(uint64_t sequence, std::chrono::milliseconds timeout);
    void fallBackToNull(Theme* failed);
    void setState(RenderState next);
    void reportError(const std::string& message);

    PixelSink& sink_;
    ThemeRegistry& registry_;
    const RenderConfig config_;
    PerformanceRecorder* recorder_ = nullptr;
    SchedulingHint schedulingHint_;
    FrameClock frameClock_;

    // Guarded by mutex_
    mutable std::mutex mutex_;
    std::condition_variable wakeCV_;  // Worker waits here while idle
    std::condition_variable ackCV_;   // Callers wait here for acknowledgements
    Theme* current_;
    std::deque<Command> commands_;
    uint64_t nextSequence_ = 0;
    uint64_t completedSequence_ = 0;
    uint64_t lastSwitchSequence_ = 0;  // Latest command that ends an episode
    bool switchInProgress_ = false;
    bool switchTimedOut_ = false;
    bool started_ = false;
    bool shutdownRequested_ = false;

    // Interrupts for the running episode
    InterruptSignal stopRequested_;        // Handed to themes
    std::atomic<bool> switchRequested_{false};
    std::atomic<bool> commandsPending_{false};

    std::atomic<bool> running_{false};
    std::atomic<bool> workerAlive_{false};
    std::atomic<RenderState> state_{RenderState::Idle};
    std::atomic<uint64_t> episodeCount_{0};
    std::atomic<uint64_t> frameCount_{0};

    std::mutex callbackMutex_;
    ErrorCallback errorCallback_;

    std::thread worker_;
    std::future<void> workerExited_;
};

}  // namespace ledplayer

#endif  // LEDPLAYER_RENDER_CONTROLLER_H
