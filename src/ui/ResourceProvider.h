#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "ui/FontFace.h"

namespace gridimg::ui {

enum class FontWeight { Regular, Semibold };

// Process-wide font cache. Fonts are loaded lazily on first request and never
// reloaded; a failed lookup is cached as well so the fallback chain runs once.
class ResourceProvider {
public:
    struct FontResource {
        std::shared_ptr<FontFace> font;
        bool ready{false};
    };

    ResourceProvider();
    explicit ResourceProvider(std::string preferredFontPath);

    static ResourceProvider& shared();
    // Only honoured before the first font has been requested.
    static void configureShared(const std::string& preferredFontPath);

    FontResource getFontResource(FontWeight weight);

    // FreeType faces are not thread-safe; hold this while measuring or drawing text.
    std::mutex& glyphMutex() { return glyphMutex_; }

private:
    FontResource loadFontUnlocked(FontWeight weight);
    std::vector<std::filesystem::path> candidateFontPaths(FontWeight weight) const;

    std::unordered_map<int, FontResource> fonts;
    std::mutex fontMutex;
    std::mutex glyphMutex_;
    std::string preferredFontPath;
    std::filesystem::path projectRoot;
};

}  // namespace gridimg::ui
