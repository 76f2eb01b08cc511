#include "ui/ResourceProvider.h"

#include "logging/Log.h"

#include <array>
#include <system_error>
#include <utility>

namespace ui {

ResourceProvider::ResourceProvider(std::string configuredFont)
    : projectRoot(std::filesystem::current_path()), configuredFont_(std::move(configuredFont)) {}

ResourceProvider::FontResource ResourceProvider::getFontResource(const std::string& key) {
    std::lock_guard<std::mutex> lock(fontMutex);
    if (auto it = fonts.find(key); it != fonts.end()) {
        return it->second;
    }
    auto loaded = loadFontUnlocked(key);
    fonts.emplace(key, loaded);
    return loaded;
}

std::shared_ptr<sf::Font> ResourceProvider::getFont(const std::string& key) {
    auto resource = getFontResource(key);
    return resource.ready ? resource.font : nullptr;
}

ResourceProvider::FontResource ResourceProvider::loadFontUnlocked(const std::string& key) {
    FontResource resource;
    resource.font = std::make_shared<sf::Font>();
    std::error_code ec;
    for (const auto& path : candidateFontPaths(key)) {
        if (std::filesystem::exists(path, ec) && resource.font->loadFromFile(path.string())) {
            LOG_DEBUG(logging::LogCategory::UI, "Loaded font from %s", path.string().c_str());
            resource.ready = true;
            return resource;
        }
    }

    LOG_WARN(logging::LogCategory::UI, "Falling back to system font for key %s", key.c_str());
    static const std::array<const char*, 4> systemCandidates{
        "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf"
    };

    for (const char* candidate : systemCandidates) {
        if (std::filesystem::exists(candidate, ec) && resource.font->loadFromFile(candidate)) {
            LOG_INFO(logging::LogCategory::UI, "Loaded system font from %s", candidate);
            resource.ready = true;
            return resource;
        }
    }

    LOG_ERROR(logging::LogCategory::UI, "Unable to load font for key %s. Text rendering will be degraded.", key.c_str());
    return resource;
}

std::vector<std::filesystem::path> ResourceProvider::candidateFontPaths(const std::string& key) const {
    std::vector<std::filesystem::path> paths;
    if (!configuredFont_.empty()) {
        paths.emplace_back(configuredFont_);
    }
    if (key == "ui" || key == "default") {
        paths.emplace_back(projectRoot / "assets" / "station.ttf");
        paths.emplace_back(projectRoot / "resources" / "station.ttf");
    }
    else {
        paths.emplace_back(projectRoot / "assets" / key);
        paths.emplace_back(projectRoot / "resources" / key);
    }
    return paths;
}

}  // namespace ui
