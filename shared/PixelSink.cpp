// PixelSink.cpp - In-memory pixel sink

#include "PixelSink.h"

namespace ledplayer {

MemoryPixelSink::MemoryPixelSink(size_t length, uint8_t brightness)
    : length_(length), staging_(length), latched_(length), brightness_(brightness) {}

void MemoryPixelSink::setPixel(size_t index, Rgb color) {
    if (index >= length_) return;
    staging_[index] = color;
    std::lock_guard<std::mutex> lock(latchMutex_);
    pixelWrites_++;
}

void MemoryPixelSink::setBrightness(uint8_t brightness) {
    std::lock_guard<std::mutex> lock(latchMutex_);
    brightness_ = brightness;
}

void MemoryPixelSink::flush() {
    std::lock_guard<std::mutex> lock(latchMutex_);
    latched_ = staging_;
    flushCount_++;
}

std::vector<Rgb> MemoryPixelSink::snapshot() const {
    std::lock_guard<std::mutex> lock(latchMutex_);
    return latched_;
}

uint8_t MemoryPixelSink::brightness() const {
    std::lock_guard<std::mutex> lock(latchMutex_);
    return brightness_;
}

uint64_t MemoryPixelSink::flushCount() const {
    std::lock_guard<std::mutex> lock(latchMutex_);
    return flushCount_;
}

uint64_t MemoryPixelSink::pixelWriteCount() const {
    std::lock_guard<std::mutex> lock(latchMutex_);
    return pixelWrites_;
}

}  // namespace ledplayer
