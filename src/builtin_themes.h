// builtin_themes.h - Themes shipped with the player
//
// All built-in themes advance one animation tick per step() and derive their
// timing from the frame count, so they render identically at any wall clock
// speed (useful for the benchmark and the tests).

#ifndef LEDPLAYER_BUILTIN_THEMES_H
#define LEDPLAYER_BUILTIN_THEMES_H

#include <cstdint>
#include <random>
#include <vector>

#include "Theme.h"
#include "ThemeRegistry.h"

namespace ledplayer {

// Common plumbing: remembers the sink and interrupt, counts frames
class FrameTheme : public Theme {
public:
    using Theme::Theme;

    ThemeResult initialize(const ThemeContext& context, PixelSink& sink,
                           const InterruptSignal& interrupt) override;
    StepOutcome step() override;

protected:
    virtual ThemeResult onInitialize() { return ThemeResult::success(); }
    virtual void render(uint64_t frame) = 0;

    PixelSink& sink() { return *sink_; }
    const ThemeContext& context() const { return context_; }
    bool interrupted() const { return interrupt_->isSet(); }

private:
    ThemeContext context_;
    PixelSink* sink_ = nullptr;
    const InterruptSignal* interrupt_ = nullptr;
    uint64_t frame_ = 0;
};

// Color wheel scrolling along the strip
class RainbowTheme : public FrameTheme {
public:
    RainbowTheme() : FrameTheme("rainbow") {}

protected:
    void render(uint64_t frame) override;
};

// Random pixels flash white and fade out
class TwinkleTheme : public FrameTheme {
public:
    TwinkleTheme() : FrameTheme("twinkle") {}

protected:
    ThemeResult onInitialize() override;
    void render(uint64_t frame) override;

private:
    std::mt19937 rng_;
    std::vector<uint8_t> levels_;
};

// A short comet with a fading tail running end to end
class ChaseTheme : public FrameTheme {
public:
    ChaseTheme() : FrameTheme("chase") {}

protected:
    void render(uint64_t frame) override;
};

// Whole strip pulsing in one color
class BreatheTheme : public FrameTheme {
public:
    explicit BreatheTheme(Rgb color = Rgb(255, 80, 0)) : FrameTheme("breathe"), color_(color) {}

protected:
    void render(uint64_t frame) override;

private:
    Rgb color_;
};

// Overlapping blue-green waves
class OceanTheme : public FrameTheme {
public:
    OceanTheme() : FrameTheme("ocean") {}

protected:
    void render(uint64_t frame) override;
};

// Registers every built-in theme. Returns the number added.
size_t registerBuiltinThemes(ThemeRegistry& registry);

}  // namespace ledplayer

#endif  // LEDPLAYER_BUILTIN_THEMES_H
