// PixelSink.h - Output interface for an addressable LED strip
// The render worker is the only writer; see RenderController.h

#ifndef LEDPLAYER_PIXEL_SINK_H
#define LEDPLAYER_PIXEL_SINK_H

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

#include "LedTypes.h"

namespace ledplayer {

// Fixed-length pixel buffer that is pushed to the strip on flush().
// index must be < length(); passing a bad index is a caller error.
class PixelSink {
public:
    virtual ~PixelSink() = default;

    virtual size_t length() const = 0;
    virtual void setPixel(size_t index, Rgb color) = 0;
    virtual void setBrightness(uint8_t brightness) = 0;
    virtual void flush() = 0;

    // Convenience: write the same color to every pixel (no flush)
    void fill(Rgb color) {
        const size_t n = length();
        for (size_t i = 0; i < n; ++i) {
            setPixel(i, color);
        }
    }
};

// In-memory sink used for headless runs and the benchmark.
// Keeps a staging buffer written by setPixel() and a latched copy updated on
// flush(), so other threads can take snapshots of what the strip would show.
class MemoryPixelSink : public PixelSink {
public:
    explicit MemoryPixelSink(size_t length, uint8_t brightness = 255);

    size_t length() const override { return length_; }
    void setPixel(size_t index, Rgb color) override;
    void setBrightness(uint8_t brightness) override;
    void flush() override;

    // Thread-safe accessors
    std::vector<Rgb> snapshot() const;  // Latched pixels (as of last flush)
    uint8_t brightness() const;
    uint64_t flushCount() const;
    uint64_t pixelWriteCount() const;

private:
    const size_t length_;
    std::vector<Rgb> staging_;

    mutable std::mutex latchMutex_;
    std::vector<Rgb> latched_;
    uint8_t brightness_;
    uint64_t flushCount_ = 0;
    uint64_t pixelWrites_ = 0;
};

}  // namespace ledplayer

#endif  // LEDPLAYER_PIXEL_SINK_H
