#pragma once

#include <SFML/Graphics/Font.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ui {

class ResourceProvider {
public:
    struct FontResource {
        std::shared_ptr<sf::Font> font;
        bool ready{false};
    };

    // `configuredFont` is tried before the bundled and system locations.
    explicit ResourceProvider(std::string configuredFont = {});

    FontResource getFontResource(const std::string& key);
    // Null when no candidate could be loaded.
    std::shared_ptr<sf::Font> getFont(const std::string& key);

private:
    FontResource loadFontUnlocked(const std::string& key);
    std::vector<std::filesystem::path> candidateFontPaths(const std::string& key) const;

    std::unordered_map<std::string, FontResource> fonts;
    std::mutex fontMutex;
    std::filesystem::path projectRoot;
    std::string configuredFont_;
};

}  // namespace ui
