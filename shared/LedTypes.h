// LedTypes.h - Shared type definitions for the LED Theme Player
// Plain value types used by the render worker, the sinks and the themes

#ifndef LEDPLAYER_TYPES_H
#define LEDPLAYER_TYPES_H

#include <cstddef>
#include <cstdint>

namespace ledplayer {

//==============================================================================
// Color
//==============================================================================

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    constexpr Rgb() = default;
    constexpr Rgb(uint8_t red, uint8_t green, uint8_t blue) : r(red), g(green), b(blue) {}

    constexpr bool operator==(const Rgb& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    constexpr bool operator!=(const Rgb& other) const { return !(*this == other); }

    // Packed 0x00RRGGBB (the layout most strip drivers accept)
    constexpr uint32_t packed() const {
        return (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8) | b;
    }
};

constexpr Rgb kBlack{0, 0, 0};
constexpr Rgb kWhite{255, 255, 255};

// Scale a color by an 8-bit factor (255 = unchanged)
inline Rgb scaleColor(Rgb c, uint8_t scale) {
    auto s = [scale](uint8_t v) {
        return static_cast<uint8_t>((static_cast<uint16_t>(v) * (static_cast<uint16_t>(scale) + 1)) >> 8);
    };
    return Rgb(s(c.r), s(c.g), s(c.b));
}

// Map a position on the 0-255 color wheel to a fully saturated color
inline Rgb colorWheel(uint8_t pos) {
    pos = static_cast<uint8_t>(255 - pos);
    if (pos < 85) {
        return Rgb(static_cast<uint8_t>(255 - pos * 3), 0, static_cast<uint8_t>(pos * 3));
    }
    if (pos < 170) {
        pos = static_cast<uint8_t>(pos - 85);
        return Rgb(0, static_cast<uint8_t>(pos * 3), static_cast<uint8_t>(255 - pos * 3));
    }
    pos = static_cast<uint8_t>(pos - 170);
    return Rgb(static_cast<uint8_t>(pos * 3), static_cast<uint8_t>(255 - pos * 3), 0);
}

//==============================================================================
// Strip configuration
//==============================================================================

struct StripConfig {
    size_t ledCount = 300;
    uint8_t brightness = 255;
};

//==============================================================================
// Render worker state
//==============================================================================

enum class RenderState {
    Idle,           // Current theme is null, worker polls at low rate
    Initializing,   // Running the theme's initialize step
    Running,        // Stepping the theme once per frame
    Switching,      // Episode ended, adopting the next theme
    ShuttingDown    // Terminal
};

inline const char* renderStateName(RenderState state) {
    switch (state) {
        case RenderState::Idle:
            return "Idle";
        case RenderState::Initializing:
            return "Initializing";
        case RenderState::Running:
            return "Running";
        case RenderState::Switching:
            return "Switching";
        case RenderState::ShuttingDown:
            return "ShuttingDown";
    }
    return "Unknown";
}

}  // namespace ledplayer

#endif  // LEDPLAYER_TYPES_H
