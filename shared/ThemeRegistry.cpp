// ThemeRegistry.cpp - Theme table implementation

#include "ThemeRegistry.h"

#include <algorithm>
#include <iostream>

namespace ledplayer {

ThemeRegistry::ThemeRegistry() : nullTheme_(std::make_unique<NullTheme>()) {}

bool ThemeRegistry::addTheme(std::unique_ptr<Theme> theme) {
    if (!theme) return false;

    const std::string& id = theme->id();
    if (id.empty() || id == NullTheme::kId) {
        std::cerr << "[ThemeRegistry] Rejected theme with reserved id '" << id << "'" << std::endl;
        return false;
    }
    if (lookup(id) != nullptr) {
        std::cerr << "[ThemeRegistry] Duplicate theme id '" << id << "'" << std::endl;
        return false;
    }

    themes_.push_back(std::move(theme));
    return true;
}

Theme* ThemeRegistry::lookup(const std::string& id) const {
    if (id == NullTheme::kId) {
        return nullTheme_.get();
    }
    auto it = std::find_if(themes_.begin(), themes_.end(),
                           [&id](const std::unique_ptr<Theme>& t) { return t->id() == id; });
    return it != themes_.end() ? it->get() : nullptr;
}

std::vector<std::string> ThemeRegistry::themeIds() const {
    std::vector<std::string> ids;
    ids.reserve(themes_.size());
    for (const auto& t : themes_) {
        ids.push_back(t->id());
    }
    return ids;
}

}  // namespace ledplayer
