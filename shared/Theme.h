// Theme.h - Plugin interface for LED animation themes
//
// A theme is a named, stateful animation. The render worker calls
// initialize() once per selection episode and then step() once per frame
// until the episode ends. A theme is never called from two threads at once,
// and no two themes run at the same time.

#ifndef LEDPLAYER_THEME_H
#define LEDPLAYER_THEME_H

#include <cstdint>
#include <string>
#include <utility>

#include "InterruptSignal.h"
#include "PixelSink.h"

namespace ledplayer {

// Shared rendering context handed to every theme on initialize()
struct ThemeContext {
    size_t ledCount = 0;
    double targetFps = 60.0;
    uint32_t randomSeed = 0;
};

// Result of Theme::initialize()
class ThemeResult {
public:
    static ThemeResult success() { return ThemeResult(true, std::string()); }
    static ThemeResult failure(std::string error) { return ThemeResult(false, std::move(error)); }

    bool ok() const { return ok_; }
    const std::string& error() const { return error_; }

private:
    ThemeResult(bool ok, std::string error) : ok_(ok), error_(std::move(error)) {}

    bool ok_;
    std::string error_;
};

// Result of Theme::step()
class StepOutcome {
public:
    enum class Kind { Continue, Stop };

    static StepOutcome Continue() { return StepOutcome(Kind::Continue, std::string()); }
    static StepOutcome Stop(std::string reason) { return StepOutcome(Kind::Stop, std::move(reason)); }

    Kind kind() const { return kind_; }
    bool isStop() const { return kind_ == Kind::Stop; }
    const std::string& reason() const { return reason_; }

private:
    StepOutcome(Kind kind, std::string reason) : kind_(kind), reason_(std::move(reason)) {}

    Kind kind_;
    std::string reason_;
};

class Theme {
public:
    explicit Theme(std::string id) : id_(std::move(id)) {}
    virtual ~Theme() = default;

    Theme(const Theme&) = delete;
    Theme& operator=(const Theme&) = delete;

    const std::string& id() const { return id_; }

    // Called once per episode before the first step(). The sink and the
    // interrupt signal stay valid for the whole episode.
    virtual ThemeResult initialize(const ThemeContext& context, PixelSink& sink,
                                   const InterruptSignal& interrupt) = 0;

    // Render one frame. Must return promptly once the interrupt signal is set.
    virtual StepOutcome step() = 0;

private:
    std::string id_;
};

// The distinguished "off" theme. The render worker never steps it.
class NullTheme : public Theme {
public:
    static constexpr const char* kId = "null";

    NullTheme() : Theme(kId) {}

    ThemeResult initialize(const ThemeContext&, PixelSink&, const InterruptSignal&) override {
        return ThemeResult::success();
    }
    StepOutcome step() override { return StepOutcome::Continue(); }
};

}  // namespace ledplayer

#endif  // LEDPLAYER_THEME_H
