#include "ui/ResourceProvider.h"

#include "domain/Errors.h"
#include "logging/Log.h"

#include <array>
#include <utility>
#include <system_error>

namespace gridimg::ui {

namespace {

std::mutex& sharedConfigMutex() {
    static std::mutex mutex;
    return mutex;
}

std::string& sharedPreferredPath() {
    static std::string path;
    return path;
}

const char* weightName(FontWeight weight) {
    switch (weight) {
    case FontWeight::Regular:
        return "regular";
    case FontWeight::Semibold:
        return "semibold";
    }
    return "regular";
}

bool fileExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

}  // namespace

ResourceProvider::ResourceProvider()
    : ResourceProvider(std::string{}) {}

ResourceProvider::ResourceProvider(std::string preferredFontPath)
    : preferredFontPath(std::move(preferredFontPath)),
      projectRoot(std::filesystem::current_path()) {}

ResourceProvider& ResourceProvider::shared() {
    static ResourceProvider instance([] {
        std::lock_guard<std::mutex> lock(sharedConfigMutex());
        return sharedPreferredPath();
    }());
    return instance;
}

void ResourceProvider::configureShared(const std::string& preferredFontPath) {
    std::lock_guard<std::mutex> lock(sharedConfigMutex());
    sharedPreferredPath() = preferredFontPath;
}

ResourceProvider::FontResource ResourceProvider::getFontResource(FontWeight weight) {
    std::lock_guard<std::mutex> lock(fontMutex);
    const int key = static_cast<int>(weight);
    if (auto it = fonts.find(key); it != fonts.end()) {
        return it->second;
    }
    auto loaded = loadFontUnlocked(weight);
    fonts.emplace(key, loaded);
    return loaded;
}

ResourceProvider::FontResource ResourceProvider::loadFontUnlocked(FontWeight weight) {
    FontResource resource;
    resource.font = std::make_shared<FontFace>();
    for (const auto& path : candidateFontPaths(weight)) {
        if (fileExists(path) && resource.font->loadFromFile(path.string())) {
            LOG_DEBUG(logging::LogCategory::FONT, "Loaded %s font from %s", weightName(weight), path.string().c_str());
            resource.ready = true;
            return resource;
        }
    }

    LOG_WARN(logging::LogCategory::FONT, "Preferred %s font unavailable, falling back to system font", weightName(weight));
    static const std::array<const char*, 6> systemCandidates{
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf"
    };

    for (const char* candidate : systemCandidates) {
        if (fileExists(candidate) && resource.font->loadFromFile(candidate)) {
            LOG_INFO(logging::LogCategory::FONT, "Loaded system font from %s", candidate);
            resource.ready = true;
            return resource;
        }
    }

    const auto code = domain::error_code(domain::ErrorKind::FontLoadFailure);
    LOG_ERROR(logging::LogCategory::FONT,
              "%.*s: unable to load any %s font. Text rendering will be skipped.",
              static_cast<int>(code.size()),
              code.data(),
              weightName(weight));
    return resource;
}

std::vector<std::filesystem::path> ResourceProvider::candidateFontPaths(FontWeight weight) const {
    std::vector<std::filesystem::path> paths;
    if (!preferredFontPath.empty()) {
        paths.emplace_back(preferredFontPath);
    }

    if (weight == FontWeight::Semibold) {
        paths.emplace_back("/System/Library/Fonts/Supplemental/SF-Pro-Text-Semibold.otf");
        paths.emplace_back("/System/Library/Fonts/Supplemental/SFProText-Semibold.otf");
        paths.emplace_back(projectRoot / "assets" / "SF-Pro-Text-Semibold.otf");
    }
    paths.emplace_back("/System/Library/Fonts/Supplemental/SF-Pro-Text-Regular.otf");
    paths.emplace_back("/System/Library/Fonts/Supplemental/SFProText-Regular.otf");
    paths.emplace_back(projectRoot / "assets" / "SF-Pro-Text-Regular.otf");
    paths.emplace_back("/System/Library/Fonts/Helvetica.ttc");
    paths.emplace_back("/Library/Fonts/Arial.ttf");

    if (weight == FontWeight::Semibold) {
        paths.emplace_back("/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf");
        paths.emplace_back("/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf");
    }
    return paths;
}

}  // namespace gridimg::ui
