#pragma once

#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/Window/Event.hpp>

#include <cstdint>

#include "config/Config.h"
#include "ui/EntityTable.h"
#include "ui/HUD.h"
#include "ui/RenderManager.h"
#include "ui/ResourceProvider.h"

namespace app {
class Station;
}

namespace ui {

// Fixed-cadence render loop. Talks to the core only through the station's RenderBridge.
class StationWindow {
public:
    StationWindow(app::Station& station, const config::Config& config);

    // Returns when the window is closed or shutdown is requested elsewhere.
    void run();

private:
    void handleEvent_(const sf::Event& event);
    void draw_();

    app::Station& station_;
    const config::Config& config_;
    sf::RenderWindow window_;
    RenderManager renderManager_;
    ResourceProvider resources_;
    HUD hud_;
    EntityTable table_;
    std::uint64_t pingNonce_{0};
    bool resized_{true};
};

} // namespace ui
