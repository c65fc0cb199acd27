// led_preview_window.cpp - SDL2 window showing the strip, drawn with Skia

#include "led_preview_window.h"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <vector>

#include "include/core/SkCanvas.h"
#include "include/core/SkColor.h"
#include "include/core/SkImageInfo.h"
#include "include/core/SkPaint.h"
#include "include/core/SkPixmap.h"

namespace ledplayer {

namespace {

constexpr int kCellSize = 16;    // Pixels per LED cell
constexpr float kLedRadius = 6.0f;
constexpr int kMargin = 8;

}  // namespace

LedPreviewWindow::LedPreviewWindow(const MemoryPixelSink& sink, int ledsPerRow)
    : sink_(sink), ledsPerRow_(std::max(1, ledsPerRow)) {}

LedPreviewWindow::~LedPreviewWindow() {
    close();
}

bool LedPreviewWindow::open(const std::string& title) {
    if (isOpen()) return true;

    const int ledCount = static_cast<int>(sink_.length());
    const int columns = std::min(ledCount, ledsPerRow_);
    const int rows = (ledCount + ledsPerRow_ - 1) / ledsPerRow_;
    width_ = std::max(1, columns) * kCellSize + 2 * kMargin;
    height_ = std::max(1, rows) * kCellSize + 2 * kMargin;

    window_ = SDL_CreateWindow(title.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, width_, height_,
                               SDL_WINDOW_SHOWN);
    if (!window_) {
        std::cerr << "[Preview] Window creation failed: " << SDL_GetError() << std::endl;
        return false;
    }

    renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer_) {
        std::cerr << "[Preview] Renderer creation failed: " << SDL_GetError() << std::endl;
        close();
        return false;
    }

    texture_ = SDL_CreateTexture(renderer_, SDL_PIXELFORMAT_ARGB8888, SDL_TEXTUREACCESS_STREAMING, width_, height_);
    if (!texture_) {
        std::cerr << "[Preview] Texture creation failed: " << SDL_GetError() << std::endl;
        close();
        return false;
    }

    surface_ = SkSurfaces::Raster(SkImageInfo::MakeN32Premul(width_, height_));
    if (!surface_) {
        std::cerr << "[Preview] Failed to create Skia raster surface " << width_ << "x" << height_ << std::endl;
        close();
        return false;
    }

    std::cout << "[Preview] " << ledCount << " LEDs in " << rows << " row(s), window " << width_ << "x" << height_
              << std::endl;
    return true;
}

void LedPreviewWindow::close() {
    surface_.reset();
    if (texture_) {
        SDL_DestroyTexture(texture_);
        texture_ = nullptr;
    }
    if (renderer_) {
        SDL_DestroyRenderer(renderer_);
        renderer_ = nullptr;
    }
    if (window_) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }
}

void LedPreviewWindow::setTitle(const std::string& title) {
    if (window_) SDL_SetWindowTitle(window_, title.c_str());
}

bool LedPreviewWindow::present() {
    if (!isOpen()) return false;

    const uint64_t flushCount = sink_.flushCount();
    const uint8_t brightness = sink_.brightness();
    if (flushCount == lastFlushCount_ && brightness == lastBrightness_) {
        return false;
    }
    lastFlushCount_ = flushCount;
    lastBrightness_ = brightness;

    if (!drawStrip() || !uploadToTexture()) {
        return false;
    }

    SDL_SetRenderDrawColor(renderer_, 0, 0, 0, 255);
    SDL_RenderClear(renderer_);
    SDL_RenderCopy(renderer_, texture_, nullptr, nullptr);
    SDL_RenderPresent(renderer_);
    return true;
}

bool LedPreviewWindow::drawStrip() {
    const std::vector<Rgb> pixels = sink_.snapshot();
    const uint8_t brightness = sink_.brightness();

    SkCanvas* canvas = surface_->getCanvas();
    canvas->clear(SK_ColorBLACK);

    SkPaint dimPaint;
    dimPaint.setAntiAlias(true);
    dimPaint.setColor(SkColorSetRGB(24, 24, 24));

    SkPaint ledPaint;
    ledPaint.setAntiAlias(true);

    for (size_t i = 0; i < pixels.size(); ++i) {
        const int column = static_cast<int>(i) % ledsPerRow_;
        const int row = static_cast<int>(i) / ledsPerRow_;
        const float cx = kMargin + column * kCellSize + kCellSize / 2.0f;
        const float cy = kMargin + row * kCellSize + kCellSize / 2.0f;

        // Unlit socket first so dark pixels stay visible
        canvas->drawCircle(cx, cy, kLedRadius, dimPaint);

        const Rgb shown = scaleColor(pixels[i], brightness);
        if (shown != kBlack) {
            ledPaint.setColor(SkColorSetRGB(shown.r, shown.g, shown.b));
            canvas->drawCircle(cx, cy, kLedRadius, ledPaint);
        }
    }
    return true;
}

bool LedPreviewWindow::uploadToTexture() {
    SkPixmap pixmap;
    if (!surface_->peekPixels(&pixmap)) {
        std::cerr << "[Preview] Skia surface pixels not accessible" << std::endl;
        return false;
    }

    void* pixels = nullptr;
    int pitch = 0;
    if (SDL_LockTexture(texture_, nullptr, &pixels, &pitch) != 0) {
        std::cerr << "[Preview] SDL_LockTexture failed: " << SDL_GetError() << std::endl;
        return false;
    }

    const uint8_t* src = static_cast<const uint8_t*>(pixmap.addr());
    uint8_t* dst = static_cast<uint8_t*>(pixels);
    const size_t rowBytes = static_cast<size_t>(width_) * 4;
    for (int row = 0; row < height_; row++) {
        memcpy(dst + row * pitch, src + row * pixmap.rowBytes(), rowBytes);
    }

    SDL_UnlockTexture(texture_);
    return true;
}

}  // namespace ledplayer
