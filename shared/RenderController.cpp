// RenderController.cpp - Render worker, theme switching and frame pacing

#include "RenderController.h"

#include <algorithm>
#include <iostream>

#include "PerformanceRecorder.h"
#include "led_instrumentation.h"

namespace ledplayer {

RenderController::RenderController(PixelSink& sink, ThemeRegistry& registry, RenderConfig config)
    : sink_(sink),
      registry_(registry),
      config_(config),
      frameClock_(config.targetFps),
      current_(&registry.null()),
      errorCallback_([](const std::string& message) {
          std::cerr << "[RenderController] ERROR: " << message << std::endl;
      }) {}

RenderController::~RenderController() {
    shutdown(config_.shutdownTimeout);
}

void RenderController::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    errorCallback_ = std::move(callback);
}

// =============================================================================
// Lifecycle
// =============================================================================

void RenderController::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_ || shutdownRequested_) return;

    started_ = true;
    running_.store(true);
    workerAlive_.store(true);

    std::promise<void> exited;
    workerExited_ = exited.get_future();
    worker_ = std::thread(&RenderController::workerLoop, this, std::move(exited));

    std::cout << "[RenderController] Render worker started (target " << frameClock_.targetFps() << " FPS, "
              << sink_.length() << " LEDs)" << std::endl;
}

bool RenderController::shutdown() {
    return shutdown(config_.shutdownTimeout);
}

bool RenderController::shutdown(std::chrono::milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!shutdownRequested_) {
            shutdownRequested_ = true;
            running_.store(false);
            switchRequested_.store(true);
            stopRequested_.set();
        }
    }
    wakeCV_.notify_all();
    ackCV_.notify_all();
    setState(RenderState::ShuttingDown);

    if (!worker_.joinable()) {
        // Never started, or already joined / detached by an earlier call
        return !workerAlive_.load();
    }

    if (workerExited_.wait_for(timeout) == std::future_status::ready) {
        worker_.join();
        return true;
    }

    // The active theme is not returning from step(); there is no way to
    // preempt it, so hand control back to the caller and leave it running.
    std::cerr << "[RenderController] WARNING: render worker did not exit within " << timeout.count()
              << "ms; a theme is still inside step()" << std::endl;
    worker_.detach();
    return false;
}

// =============================================================================
// Commands (caller side)
// =============================================================================

bool RenderController::setTheme(const std::string& themeId) {
    if (ThemeRegistry::isNullId(themeId)) {
        return setTheme(nullptr);
    }

    Theme* theme = registry_.lookup(themeId);
    if (!theme) {
        std::cerr << "[RenderController] Unknown theme '" << themeId << "', switching to null theme"
                  << std::endl;
        setTheme(nullptr);
        return false;
    }
    return setTheme(theme);
}

bool RenderController::setTheme(Theme* theme) {
    Theme* target = theme ? theme : &registry_.null();

    std::unique_lock<std::mutex> lock(mutex_);
    if (shutdownRequested_) return false;

    // A switch is still in flight and has not timed out: drop this request
    if (switchInProgress_ && !switchTimedOut_) {
        return false;
    }

    if (!switchInProgress_ && target->id() == current_->id()) {
        return true;
    }

    if (!started_) {
        // No worker yet, so no episode can be running
        current_ = target;
        return true;
    }

    Command cmd{Command::Type::SwitchTo, target, kBlack, 0, 0};
    const uint64_t sequence = postCommand(cmd, true);
    lock.unlock();

    return waitForAck(sequence, config_.switchGracePeriod);
}

bool RenderController::setBrightness(int brightness) {
    const uint8_t value = static_cast<uint8_t>(std::clamp(brightness, 0, 255));

    std::unique_lock<std::mutex> lock(mutex_);
    if (shutdownRequested_) return false;

    if (!started_) {
        lock.unlock();
        sink_.setBrightness(value);
        sink_.flush();
        return true;
    }

    Command cmd{Command::Type::Brightness, nullptr, kBlack, value, 0};
    const uint64_t sequence = postCommand(cmd, false);
    lock.unlock();

    return waitForAck(sequence, config_.switchGracePeriod);
}

bool RenderController::setSolidColor(uint8_t r, uint8_t g, uint8_t b) {
    const Rgb color(r, g, b);

    std::unique_lock<std::mutex> lock(mutex_);
    if (shutdownRequested_) return false;

    if (!started_) {
        current_ = &registry_.null();
        lock.unlock();
        sink_.fill(color);
        sink_.flush();
        return true;
    }

    Command cmd{Command::Type::Fill, nullptr, color, 0, 0};
    const uint64_t sequence = postCommand(cmd, true);
    lock.unlock();

    return waitForAck(sequence, config_.switchGracePeriod);
}

uint64_t RenderController::postCommand(Command cmd, bool interruptEpisode) {
    cmd.sequence = ++nextSequence_;
    commands_.push_back(cmd);
    commandsPending_.store(true);

    if (interruptEpisode) {
        switchInProgress_ = true;
        switchTimedOut_ = false;
        lastSwitchSequence_ = cmd.sequence;
        switchRequested_.store(true);
        stopRequested_.set();
    }

    wakeCV_.notify_all();
    return cmd.sequence;
}

bool RenderController::waitForAck(uint64_t sequence, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    ackCV_.wait_for(lock, timeout, [this, sequence]() {
        return completedSequence_ >= sequence || shutdownRequested_;
    });

    if (completedSequence_ >= sequence) return true;

    if (shutdownRequested_) return false;

    // The worker still picks the command up once the episode quiesces. Only
    // the newest switch owns the timed-out flag; brightness waits never set it.
    if (switchInProgress_ && sequence == lastSwitchSequence_) {
        switchTimedOut_ = true;
    }
    std::cerr << "[RenderController] WARNING: request not acknowledged within " << timeout.count() << "ms"
              << std::endl;
    return false;
}

// =============================================================================
// Queries
// =============================================================================

std::string RenderController::currentThemeId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_->id();
}

bool RenderController::isSwitchInProgress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return switchInProgress_;
}

bool RenderController::hasSwitchTimedOut() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return switchTimedOut_;
}

// =============================================================================
// Render worker
// =============================================================================

void RenderController::workerLoop(std::promise<void> exited) {
    if (schedulingHint_) {
        if (schedulingHint_()) {
            std::cout << "[RenderController] Scheduling hints applied to render worker" << std::endl;
        } else {
            std::cout << "[RenderController] Scheduling hints unavailable, continuing normally" << std::endl;
        }
    }

    Theme* const nullTheme = &registry_.null();

    while (running_.load()) {
        Theme* theme = nullptr;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            drainCommands(lock, false);
            if (!running_.load()) break;

            theme = current_;
            // Both interrupts are cleared together with adopting the theme, so a
            // request posted after this point always ends the next episode.
            switchRequested_.store(false);
            stopRequested_.clear();
        }

        setState(RenderState::Idle);
        if (theme == nullTheme) {
            std::unique_lock<std::mutex> lock(mutex_);
            wakeCV_.wait_for(lock, config_.idlePollInterval,
                             [this]() { return !commands_.empty() || !running_.load(); });
            continue;
        }

        setState(RenderState::Initializing);
        if (!initializeTheme(theme)) {
            fallBackToNull(theme);
            setState(RenderState::Idle);
            std::unique_lock<std::mutex> lock(mutex_);
            wakeCV_.wait_for(lock, config_.initFailureBackoff,
                             [this]() { return !commands_.empty() || !running_.load(); });
            continue;
        }

        setState(RenderState::Running);
        episodeCount_++;
        LED_INSTRUMENT_EPISODE_START(theme->id());
        std::cout << "[RenderController] Theme '" << theme->id() << "' running" << std::endl;

        runEpisode(theme);

        setState(RenderState::Switching);
    }

    setState(RenderState::ShuttingDown);
    workerAlive_.store(false);
    std::cout << "[RenderController] Render worker stopped after " << frameCount_.load() << " frames"
              << std::endl;
    exited.set_value();
}

bool RenderController::initializeTheme(Theme* theme) {
    ThemeContext context;
    context.ledCount = sink_.length();
    context.targetFps = frameClock_.targetFps();
    context.randomSeed = config_.randomSeed + static_cast<uint32_t>(episodeCount_.load());

    ThemeResult result = ThemeResult::failure("initialize did not run");
    try {
        result = theme->initialize(context, sink_, stopRequested_);
    } catch (const std::exception& e) {
        result = ThemeResult::failure(e.what());
    } catch (...) {
        result = ThemeResult::failure("unknown exception");
    }

    if (!result.ok()) {
        reportError("Failed to initialize theme '" + theme->id() + "': " + result.error());
        return false;
    }
    return true;
}

void RenderController::runEpisode(Theme* theme) {
    const std::string& id = theme->id();
    std::string endReason = "switch requested";

    while (running_.load()) {
        if (stopRequested_.isSet() || switchRequested_.load()) break;

        if (commandsPending_.load()) {
            std::unique_lock<std::mutex> lock(mutex_);
            if (drainCommands(lock, true)) break;
        }

        frameClock_.beginFrame();

        StepOutcome outcome = StepOutcome::Continue();
        bool faulted = false;
        std::string fault;
        try {
            outcome = theme->step();
        } catch (const std::exception& e) {
            faulted = true;
            fault = e.what();
        } catch (...) {
            faulted = true;
            fault = "unknown exception";
        }

        const FrameClock::Duration elapsed = frameClock_.endFrame();
        frameCount_++;
        if (recorder_) {
            recorder_->recordFrame(elapsed);
        }
        const double frameMs = std::chrono::duration<double, std::milli>(elapsed).count();
        LED_INSTRUMENT_FRAME_RENDERED(id, frameMs);

        if (faulted) {
            reportError("Theme '" + id + "' failed during step: " + fault);
            fallBackToNull(theme);
            endReason = "step fault";
            stopRequested_.set();
            break;
        }

        if (outcome.isStop()) {
            endReason = outcome.reason().empty() ? "stopped" : outcome.reason();
            std::cout << "[RenderController] Theme '" << id << "' stopped: " << endReason << std::endl;
            stopRequested_.set();
            break;
        }

        // Overruns go straight to the next frame
        const FrameClock::Duration sleep = frameClock_.sleepFor(elapsed);
        if (sleep > FrameClock::Duration::zero()) {
            stopRequested_.waitFor(sleep);
        }
    }

    if (!running_.load()) endReason = "shutdown";
    LED_INSTRUMENT_EPISODE_END(id, endReason);
}

bool RenderController::drainCommands(std::unique_lock<std::mutex>& lock, bool inEpisode) {
    while (!commands_.empty()) {
        const Command cmd = commands_.front();
        if (inEpisode && cmd.type != Command::Type::Brightness) {
            return true;
        }
        commands_.pop_front();

        if (cmd.type == Command::Type::SwitchTo) {
            current_ = cmd.theme;
        } else if (cmd.type == Command::Type::Fill) {
            current_ = &registry_.null();
        }

        lock.unlock();
        executeCommand(cmd);
        lock.lock();

        completedSequence_ = std::max(completedSequence_, cmd.sequence);
        if (completedSequence_ >= lastSwitchSequence_) {
            switchInProgress_ = false;
            switchTimedOut_ = false;
        }
        ackCV_.notify_all();

        if (cmd.type != Command::Type::Brightness) {
            const std::string adopted = current_->id();
            lock.unlock();
            LED_INSTRUMENT_SWITCH_COMPLETED(adopted, cmd.sequence);
            lock.lock();
        }
    }

    commandsPending_.store(false);
    return false;
}

void RenderController::executeCommand(const Command& cmd) {
    switch (cmd.type) {
        case Command::Type::SwitchTo:
            std::cout << "[RenderController] Switched to theme '" << cmd.theme->id() << "'" << std::endl;
            break;
        case Command::Type::Fill:
            sink_.fill(cmd.color);
            sink_.flush();
            break;
        case Command::Type::Brightness:
            sink_.setBrightness(cmd.brightness);
            sink_.flush();
            break;
    }
}

void RenderController::fallBackToNull(Theme* failed) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_ == failed) {
        current_ = &registry_.null();
    }
}

void RenderController::setState(RenderState next) {
    RenderState prev = state_.load();
    do {
        // ShuttingDown is terminal
        if (prev == RenderState::ShuttingDown || prev == next) return;
    } while (!state_.compare_exchange_weak(prev, next));

    LED_INSTRUMENT_STATE_CHANGE(prev, next);
}

void RenderController::reportError(const std::string& message) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = errorCallback_;
    }
    if (!callback) return;

    try {
        callback(message);
    } catch (const std::exception& e) {
        std::cerr << "[RenderController] Error callback threw: " << e.what() << " (while reporting: "
                  << message << ")" << std::endl;
    }
}

}  // namespace ledplayer
