// ThemeRegistry.h - Table of the themes available to the render controller
//
// Built once at startup and kept alive for the lifetime of the controller.
// Theme pointers handed out by the registry stay valid until it is destroyed.

#ifndef LEDPLAYER_THEME_REGISTRY_H
#define LEDPLAYER_THEME_REGISTRY_H

#include <memory>
#include <string>
#include <vector>

#include "Theme.h"

namespace ledplayer {

class ThemeRegistry {
public:
    ThemeRegistry();

    ThemeRegistry(const ThemeRegistry&) = delete;
    ThemeRegistry& operator=(const ThemeRegistry&) = delete;

    // Register a theme. Rejects null pointers, empty ids, the reserved
    // "null" id and duplicates (returns false, theme is discarded).
    bool addTheme(std::unique_ptr<Theme> theme);

    // nullptr when no theme has this id. "null" resolves to the null theme.
    Theme* lookup(const std::string& id) const;

    Theme& null() const { return *nullTheme_; }

    static bool isNullId(const std::string& id) { return id.empty() || id == NullTheme::kId; }

    // Registered ids in registration order (the null theme is not listed)
    std::vector<std::string> themeIds() const;
    size_t size() const { return themes_.size(); }

private:
    std::unique_ptr<NullTheme> nullTheme_;
    std::vector<std::unique_ptr<Theme>> themes_;
};

}  // namespace ledplayer

#endif  // LEDPLAYER_THEME_REGISTRY_H
