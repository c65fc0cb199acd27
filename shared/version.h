// version.h - Version and banner strings for the LED tools
//
// LED_PLAYER_VERSION comes from the CMake project version.

#ifndef LEDPLAYER_VERSION_H
#define LEDPLAYER_VERSION_H

#include <string>

#ifndef LED_PLAYER_VERSION
#define LED_PLAYER_VERSION "0.0.0-dev"
#endif

#define LED_PLAYER_NAME "LED Theme Player"

#ifdef NDEBUG
#define LED_PLAYER_BUILD_TYPE "Release"
#else
#define LED_PLAYER_BUILD_TYPE "Debug"
#endif

namespace LedPlayerVersion {

// "LED Theme Player v0.4.0"
inline std::string getStartupBanner() {
    return std::string(LED_PLAYER_NAME) + " v" + LED_PLAYER_VERSION;
}

// --version and --help header
inline std::string getVersionBanner() {
    return getStartupBanner() + " (" + LED_PLAYER_BUILD_TYPE + " build, " + __DATE__ + ")\n" +
           "Addressable LED strip themes on a paced render worker";
}

}  // namespace LedPlayerVersion

#endif  // LEDPLAYER_VERSION_H
