// builtin_themes.cpp - Built-in LED animations

#include "builtin_themes.h"

#include <cmath>
#include <memory>

namespace ledplayer {

namespace {

constexpr double kTwoPi = 6.283185307179586;

uint8_t toByte(double v) {
    if (v <= 0.0) return 0;
    if (v >= 255.0) return 255;
    return static_cast<uint8_t>(v);
}

// 0..1 sine wave with the given period in frames
double wave(double frame, double periodFrames, double phase = 0.0) {
    return 0.5 + 0.5 * std::sin(kTwoPi * (frame / periodFrames) + phase);
}

}  // namespace

//==============================================================================
// FrameTheme
//==============================================================================

ThemeResult FrameTheme::initialize(const ThemeContext& context, PixelSink& sink,
                                   const InterruptSignal& interrupt) {
    if (context.ledCount == 0) {
        return ThemeResult::failure("strip has no LEDs");
    }
    context_ = context;
    sink_ = &sink;
    interrupt_ = &interrupt;
    frame_ = 0;
    return onInitialize();
}

StepOutcome FrameTheme::step() {
    render(frame_++);
    sink_->flush();
    return StepOutcome::Continue();
}

//==============================================================================
// Themes
//==============================================================================

void RainbowTheme::render(uint64_t frame) {
    const size_t n = context().ledCount;
    for (size_t i = 0; i < n; ++i) {
        const uint8_t pos = static_cast<uint8_t>((i * 256 / n + frame) & 0xFF);
        sink().setPixel(i, colorWheel(pos));
    }
}

ThemeResult TwinkleTheme::onInitialize() {
    rng_.seed(context().randomSeed);
    levels_.assign(context().ledCount, 0);
    return ThemeResult::success();
}

void TwinkleTheme::render(uint64_t) {
    const size_t n = levels_.size();
    std::uniform_int_distribution<size_t> pick(0, n - 1);

    // Roughly 2% of the strip lights up per frame
    const size_t sparks = n / 50 + 1;
    for (size_t s = 0; s < sparks; ++s) {
        levels_[pick(rng_)] = 255;
    }

    for (size_t i = 0; i < n; ++i) {
        if (interrupted()) return;
        sink().setPixel(i, scaleColor(kWhite, levels_[i]));
        levels_[i] = static_cast<uint8_t>(levels_[i] * 7 / 8);
    }
}

void ChaseTheme::render(uint64_t frame) {
    const size_t n = context().ledCount;
    const size_t head = static_cast<size_t>(frame % n);
    const size_t tail = 12;

    sink().fill(kBlack);
    for (size_t k = 0; k < tail && k < n; ++k) {
        const size_t index = (head + n - k) % n;
        const uint8_t level = static_cast<uint8_t>(255 - k * (255 / tail));
        sink().setPixel(index, scaleColor(Rgb(0, 160, 255), level));
    }
}

void BreatheTheme::render(uint64_t frame) {
    // One breath every 4 seconds at the target rate
    const double period = context().targetFps * 4.0;
    const double level = wave(static_cast<double>(frame), period, -kTwoPi / 4.0);
    sink().fill(scaleColor(color_, toByte(level * level * 255.0)));
}

void OceanTheme::render(uint64_t frame) {
    const size_t n = context().ledCount;
    const double t = static_cast<double>(frame);

    for (size_t i = 0; i < n; ++i) {
        const double x = static_cast<double>(i);
        const double a = wave(t + x * 3.0, 420.0);
        const double b = wave(t * 1.3 - x * 2.0, 310.0, 1.7);
        const double c = wave(t * 0.7 + x * 5.0, 600.0, 0.4);

        const double swell = (a + b + c) / 3.0;
        const uint8_t g = toByte(40.0 + 120.0 * swell * b);
        const uint8_t bl = toByte(80.0 + 175.0 * swell);
        const uint8_t r = toByte(swell > 0.85 ? (swell - 0.85) * 600.0 : 0.0);
        sink().setPixel(i, Rgb(r, g, bl));
    }
}

//==============================================================================
// Registration
//==============================================================================

size_t registerBuiltinThemes(ThemeRegistry& registry) {
    size_t added = 0;
    if (registry.addTheme(std::make_unique<RainbowTheme>())) added++;
    if (registry.addTheme(std::make_unique<TwinkleTheme>())) added++;
    if (registry.addTheme(std::make_unique<ChaseTheme>())) added++;
    if (registry.addTheme(std::make_unique<BreatheTheme>())) added++;
    if (registry.addTheme(std::make_unique<OceanTheme>())) added++;
    return added;
}

}  // namespace ledplayer
