#pragma once

#include <SFML/Graphics/RenderTarget.hpp>

#include "core/ViewSnapshot.h"

namespace ui {

class ResourceProvider;

class HUD {
public:
    static constexpr float kBannerHeight = 44.f;
    static constexpr float kPad = 12.f;

    // Connection banner across the top. Without a font it is a plain colour bar.
    void drawStateOverlay(sf::RenderTarget& target,
                          const core::ViewSnapshot& snapshot,
                          ResourceProvider& resourceProvider);
    void drawFooter(sf::RenderTarget& target,
                    const core::ViewSnapshot& snapshot,
                    ResourceProvider& resourceProvider);

private:
    bool fontWarningLogged_{false};
};

} // namespace ui
