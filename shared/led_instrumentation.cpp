// led_instrumentation.cpp - Implementation of instrumentation hooks
// SPDX-License-Identifier: MIT

#include "led_instrumentation.h"

#if LED_INSTRUMENTATION_ENABLED

#include <mutex>
#include <utility>

namespace ledplayer {
namespace instrumentation {

// ============================================================================
// Thread-Safe Hook Storage
// ============================================================================

namespace {

std::mutex g_hookMutex;

StateChangeHook g_stateChangeHook;
EpisodeStartHook g_episodeStartHook;
EpisodeEndHook g_episodeEndHook;
FrameRenderedHook g_frameRenderedHook;
SwitchCompletedHook g_switchCompletedHook;

enum HookBit : uint32_t {
    HOOK_STATE_CHANGE = 1u << 0,
    HOOK_EPISODE_START = 1u << 1,
    HOOK_EPISODE_END = 1u << 2,
    HOOK_FRAME_RENDERED = 1u << 3,
    HOOK_SWITCH_COMPLETED = 1u << 4,
};

// Copy under the lock, call outside it (hooks may take their own locks)
template<typename HookType, typename... Args>
void safeInvoke(const HookType& hook, Args&&... args) {
    HookType localCopy;
    {
        std::lock_guard<std::mutex> lock(g_hookMutex);
        localCopy = hook;
    }
    if (localCopy) {
        localCopy(std::forward<Args>(args)...);
    }
}

template<typename HookType>
HookType swapHook(HookType& storage, HookType newHook) {
    std::lock_guard<std::mutex> lock(g_hookMutex);
    HookType prev = std::move(storage);
    storage = std::move(newHook);
    return prev;
}

} // anonymous namespace

// ============================================================================
// Setters
// ============================================================================

void setStateChangeHook(StateChangeHook hook) {
    swapHook(g_stateChangeHook, std::move(hook));
}

void setEpisodeStartHook(EpisodeStartHook hook) {
    swapHook(g_episodeStartHook, std::move(hook));
}

void setEpisodeEndHook(EpisodeEndHook hook) {
    swapHook(g_episodeEndHook, std::move(hook));
}

void setFrameRenderedHook(FrameRenderedHook hook) {
    swapHook(g_frameRenderedHook, std::move(hook));
}

void setSwitchCompletedHook(SwitchCompletedHook hook) {
    swapHook(g_switchCompletedHook, std::move(hook));
}

// ============================================================================
// Invocations
// ============================================================================

void invokeStateChange(RenderState from, RenderState to) {
    safeInvoke(g_stateChangeHook, from, to);
}

void invokeEpisodeStart(const std::string& themeId) {
    safeInvoke(g_episodeStartHook, themeId);
}

void invokeEpisodeEnd(const std::string& themeId, const std::string& reason) {
    safeInvoke(g_episodeEndHook, themeId, reason);
}

void invokeFrameRendered(const std::string& themeId, double frameTimeMs) {
    safeInvoke(g_frameRenderedHook, themeId, frameTimeMs);
}

void invokeSwitchCompleted(const std::string& themeId, uint64_t sequence) {
    safeInvoke(g_switchCompletedHook, themeId, sequence);
}

// ============================================================================
// HookInstaller
// ============================================================================

HookInstaller::HookInstaller() = default;

HookInstaller::~HookInstaller() {
    if (installedMask & HOOK_STATE_CHANGE) {
        setStateChangeHook(std::move(prevStateChange));
    }
    if (installedMask & HOOK_EPISODE_START) {
        setEpisodeStartHook(std::move(prevEpisodeStart));
    }
    if (installedMask & HOOK_EPISODE_END) {
        setEpisodeEndHook(std::move(prevEpisodeEnd));
    }
    if (installedMask & HOOK_FRAME_RENDERED) {
        setFrameRenderedHook(std::move(prevFrameRendered));
    }
    if (installedMask & HOOK_SWITCH_COMPLETED) {
        setSwitchCompletedHook(std::move(prevSwitchCompleted));
    }
}

HookInstaller& HookInstaller::onStateChange(StateChangeHook hook) {
    StateChangeHook prev = swapHook(g_stateChangeHook, std::move(hook));
    // Only remember the first previous hook so nested calls restore correctly
    if (!(installedMask & HOOK_STATE_CHANGE)) prevStateChange = std::move(prev);
    installedMask |= HOOK_STATE_CHANGE;
    return *this;
}

HookInstaller& HookInstaller::onEpisodeStart(EpisodeStartHook hook) {
    EpisodeStartHook prev = swapHook(g_episodeStartHook, std::move(hook));
    if (!(installedMask & HOOK_EPISODE_START)) prevEpisodeStart = std::move(prev);
    installedMask |= HOOK_EPISODE_START;
    return *this;
}

HookInstaller& HookInstaller::onEpisodeEnd(EpisodeEndHook hook) {
    EpisodeEndHook prev = swapHook(g_episodeEndHook, std::move(hook));
    if (!(installedMask & HOOK_EPISODE_END)) prevEpisodeEnd = std::move(prev);
    installedMask |= HOOK_EPISODE_END;
    return *this;
}

HookInstaller& HookInstaller::onFrameRendered(FrameRenderedHook hook) {
    FrameRenderedHook prev = swapHook(g_frameRenderedHook, std::move(hook));
    if (!(installedMask & HOOK_FRAME_RENDERED)) prevFrameRendered = std::move(prev);
    installedMask |= HOOK_FRAME_RENDERED;
    return *this;
}

HookInstaller& HookInstaller::onSwitchCompleted(SwitchCompletedHook hook) {
    SwitchCompletedHook prev = swapHook(g_switchCompletedHook, std::move(hook));
    if (!(installedMask & HOOK_SWITCH_COMPLETED)) prevSwitchCompleted = std::move(prev);
    installedMask |= HOOK_SWITCH_COMPLETED;
    return *this;
}

} // namespace instrumentation
} // namespace ledplayer

#endif // LED_INSTRUMENTATION_ENABLED
