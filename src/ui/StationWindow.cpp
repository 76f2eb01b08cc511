#include "ui/StationWindow.h"

#include <SFML/System/Sleep.hpp>
#include <SFML/System/Time.hpp>
#include <SFML/Window/VideoMode.hpp>

#include <algorithm>
#include <chrono>

#include "app/Station.h"
#include "logging/Log.h"

namespace ui {
namespace {
constexpr const char* kWindowTitle = "VizStation";
// countdown banners need a periodic refresh even without new snapshots
constexpr std::chrono::milliseconds kIdleRedraw{250};
}  // namespace

StationWindow::StationWindow(app::Station& station, const config::Config& config)
    : station_(station), config_(config), resources_(config.fontPath) {
    const sf::VideoMode mode = config_.windowFullscreen
        ? sf::VideoMode::getDesktopMode()
        : sf::VideoMode(static_cast<unsigned>(config_.windowWidth), static_cast<unsigned>(config_.windowHeight));
    window_.create(mode, kWindowTitle, config_.windowFullscreen ? sf::Style::Fullscreen : sf::Style::Default);
    window_.setFramerateLimit(static_cast<unsigned>(std::max(config_.frameRate, 1)));
    LOG_INFO(logging::LogCategory::UI,
             "StationWindow opened width=%u height=%u fps=%d",
             window_.getSize().x,
             window_.getSize().y,
             config_.frameRate);
}

void StationWindow::run() {
    using Clock = std::chrono::steady_clock;
    const sf::Time framePeriod = sf::milliseconds(1000 / std::max(config_.frameRate, 1));
    auto lastDraw = Clock::time_point::min();

    while (window_.isOpen()) {
        if (station_.shutdownRequested()) {
            window_.close();
            break;
        }

        sf::Event event;
        while (window_.pollEvent(event)) {
            handleEvent_(event);
        }
        if (!window_.isOpen()) {
            break;
        }

        const bool dirty = station_.bridge().consumeDirty();
        const auto now = Clock::now();
        if (dirty || resized_ || now - lastDraw >= kIdleRedraw) {
            draw_();
            resized_ = false;
            lastDraw = now;
        }
        else {
            sf::sleep(framePeriod);
        }
    }
    LOG_INFO(logging::LogCategory::UI, "StationWindow closed");
}

void StationWindow::handleEvent_(const sf::Event& event) {
    switch (event.type) {
    case sf::Event::Closed:
        LOG_INFO(logging::LogCategory::UI, "window closed by user");
        station_.requestShutdown();
        window_.close();
        break;
    case sf::Event::Resized:
        renderManager_.onResize(sf::Vector2u(event.size.width, event.size.height));
        resized_ = true;
        break;
    case sf::Event::KeyPressed:
        if (event.key.code == sf::Keyboard::R) {
            if (config_.subscriptions.empty()) {
                LOG_INFO(logging::LogCategory::UI, "no subscriptions configured to re-send");
            }
            else {
                station_.bridge().sendCommand(domain::Subscribe{config_.subscriptions});
            }
        }
        else if (event.key.code == sf::Keyboard::P) {
            station_.bridge().sendCommand(domain::Ping{++pingNonce_});
        }
        break;
    default:
        break;
    }
}

void StationWindow::draw_() {
    const auto snapshot = station_.bridge().latestSnapshot();

    renderManager_.addRenderCommand(10, [this, snapshot](sf::RenderTarget& target) {
        const float top = HUD::kPad * 2.f + HUD::kBannerHeight;
        const float bottom = static_cast<float>(target.getSize().y) - 32.f;
        table_.draw(target, *snapshot, resources_, top, bottom);
    });
    renderManager_.addRenderCommand(20, [this, snapshot](sf::RenderTarget& target) {
        hud_.drawStateOverlay(target, *snapshot, resources_);
    });
    renderManager_.addRenderCommand(30, [this, snapshot](sf::RenderTarget& target) {
        hud_.drawFooter(target, *snapshot, resources_);
    });
    renderManager_.render(window_);
}

} // namespace ui
