// led_preview_window.h - On-screen preview of a MemoryPixelSink
//
// Draws the latched strip contents as a grid of LED dots with Skia into a
// raster surface and uploads it to a streaming SDL texture. All methods must
// be called from the thread that owns the SDL video subsystem (main thread);
// the render worker only ever touches the sink.

#ifndef LEDPLAYER_LED_PREVIEW_WINDOW_H
#define LEDPLAYER_LED_PREVIEW_WINDOW_H

#include <SDL.h>

#include <cstdint>
#include <string>

#include "include/core/SkRefCnt.h"
#include "include/core/SkSurface.h"

#include "../shared/PixelSink.h"

namespace ledplayer {

class LedPreviewWindow {
public:
    explicit LedPreviewWindow(const MemoryPixelSink& sink, int ledsPerRow = 60);
    ~LedPreviewWindow();

    LedPreviewWindow(const LedPreviewWindow&) = delete;
    LedPreviewWindow& operator=(const LedPreviewWindow&) = delete;

    // Creates the window, renderer, texture and Skia surface. On failure the
    // SDL error is logged and everything created so far is released.
    bool open(const std::string& title);
    void close();
    bool isOpen() const { return window_ != nullptr; }

    // Redraw if the sink flushed since the last call. Returns true if a new
    // frame was presented.
    bool present();

    void setTitle(const std::string& title);

private:
    bool drawStrip();
    bool uploadToTexture();

    const MemoryPixelSink& sink_;
    const int ledsPerRow_;
    int width_ = 0;
    int height_ = 0;

    SDL_Window* window_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    SDL_Texture* texture_ = nullptr;
    sk_sp<SkSurface> surface_;

    uint64_t lastFlushCount_ = UINT64_MAX;
    uint8_t lastBrightness_ = 0;
};

}  // namespace ledplayer

#endif  // LEDPLAYER_LED_PREVIEW_WINDOW_H
