#pragma once

// Compile-time control: enabled in debug builds by default
#ifndef LED_INSTRUMENTATION_ENABLED
    #if defined(DEBUG) || defined(_DEBUG) || !defined(NDEBUG)
        #define LED_INSTRUMENTATION_ENABLED 1
    #else
        #define LED_INSTRUMENTATION_ENABLED 0
    #endif
#endif

#if LED_INSTRUMENTATION_ENABLED

#include <cstdint>
#include <functional>
#include <string>

#include "LedTypes.h"

namespace ledplayer {
namespace instrumentation {

// ============================================================================
// Hook Function Types
// ============================================================================

// RenderController hooks, invoked on the render worker thread (the final
// change to ShuttingDown comes from the thread calling shutdown())
using StateChangeHook = std::function<void(RenderState from, RenderState to)>;
using EpisodeStartHook = std::function<void(const std::string& themeId)>;
using EpisodeEndHook = std::function<void(const std::string& themeId, const std::string& reason)>;
using FrameRenderedHook = std::function<void(const std::string& themeId, double frameTimeMs)>;
// Worker adopted a requested theme (after SwitchTo or a solid color fill)
using SwitchCompletedHook = std::function<void(const std::string& themeId, uint64_t sequence)>;

// ============================================================================
// Thread-Safe Hook Setters (for runtime hook installation)
// ============================================================================

void setStateChangeHook(StateChangeHook hook);
void setEpisodeStartHook(EpisodeStartHook hook);
void setEpisodeEndHook(EpisodeEndHook hook);
void setFrameRenderedHook(FrameRenderedHook hook);
void setSwitchCompletedHook(SwitchCompletedHook hook);

// ============================================================================
// Thread-Safe Hook Invocations (internal use by instrumented code)
// ============================================================================

void invokeStateChange(RenderState from, RenderState to);
void invokeEpisodeStart(const std::string& themeId);
void invokeEpisodeEnd(const std::string& themeId, const std::string& reason);
void invokeFrameRendered(const std::string& themeId, double frameTimeMs);
void invokeSwitchCompleted(const std::string& themeId, uint64_t sequence);

// ============================================================================
// RAII Hook Installer (restores the previous hooks on scope exit)
// ============================================================================

class HookInstaller {
public:
    HookInstaller();
    ~HookInstaller();

    HookInstaller& onStateChange(StateChangeHook hook);
    HookInstaller& onEpisodeStart(EpisodeStartHook hook);
    HookInstaller& onEpisodeEnd(EpisodeEndHook hook);
    HookInstaller& onFrameRendered(FrameRenderedHook hook);
    HookInstaller& onSwitchCompleted(SwitchCompletedHook hook);

    HookInstaller(const HookInstaller&) = delete;
    HookInstaller& operator=(const HookInstaller&) = delete;
    HookInstaller(HookInstaller&&) = delete;
    HookInstaller& operator=(HookInstaller&&) = delete;

private:
    uint32_t installedMask{0};

    StateChangeHook prevStateChange;
    EpisodeStartHook prevEpisodeStart;
    EpisodeEndHook prevEpisodeEnd;
    FrameRenderedHook prevFrameRendered;
    SwitchCompletedHook prevSwitchCompleted;
};

} // namespace instrumentation
} // namespace ledplayer

// ============================================================================
// Convenience Macros (zero-overhead when LED_INSTRUMENTATION_ENABLED=0)
// ============================================================================

#define LED_INSTRUMENT_STATE_CHANGE(from, to) \
    ledplayer::instrumentation::invokeStateChange(from, to)
#define LED_INSTRUMENT_EPISODE_START(themeId) \
    ledplayer::instrumentation::invokeEpisodeStart(themeId)
#define LED_INSTRUMENT_EPISODE_END(themeId, reason) \
    ledplayer::instrumentation::invokeEpisodeEnd(themeId, reason)
#define LED_INSTRUMENT_FRAME_RENDERED(themeId, frameTimeMs) \
    ledplayer::instrumentation::invokeFrameRendered(themeId, frameTimeMs)
#define LED_INSTRUMENT_SWITCH_COMPLETED(themeId, sequence) \
    ledplayer::instrumentation::invokeSwitchCompleted(themeId, sequence)

#else // LED_INSTRUMENTATION_ENABLED == 0

#define LED_INSTRUMENT_STATE_CHANGE(from, to) ((void)0)
#define LED_INSTRUMENT_EPISODE_START(themeId) ((void)0)
#define LED_INSTRUMENT_EPISODE_END(themeId, reason) ((void)0)
#define LED_INSTRUMENT_FRAME_RENDERED(themeId, frameTimeMs) ((void)0)
#define LED_INSTRUMENT_SWITCH_COMPLETED(themeId, sequence) ((void)0)

#endif // LED_INSTRUMENTATION_ENABLED
