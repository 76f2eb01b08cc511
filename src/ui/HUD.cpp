#include "ui/HUD.h"

#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/RectangleShape.hpp>
#include <SFML/Graphics/Text.hpp>

#include <string>

#include "app/StatusSummary.h"
#include "logging/Log.h"
#include "ui/ResourceProvider.h"

namespace ui {
namespace {
constexpr float kFooterHeight = 28.f;

sf::Color toneColor(app::BannerTone tone) {
    switch (tone) {
    case app::BannerTone::Live:
        return sf::Color(46, 139, 87, 180);
    case app::BannerTone::Connecting:
        return sf::Color(70, 130, 180, 180);
    case app::BannerTone::Reconnecting:
        return sf::Color(218, 165, 32, 180);
    case app::BannerTone::Disconnected:
        return sf::Color(205, 92, 92, 180);
    case app::BannerTone::Closing:
        return sf::Color(128, 128, 128, 180);
    }
    return sf::Color(0, 0, 0, 160);
}
}  // namespace

void HUD::drawStateOverlay(sf::RenderTarget& target,
                           const core::ViewSnapshot& snapshot,
                           ResourceProvider& resourceProvider) {
    const sf::Vector2u windowSize = target.getSize();
    if (windowSize.x == 0 || windowSize.y == 0) {
        return;
    }

    const sf::Vector2f pos(kPad, kPad);
    const sf::Vector2f size(static_cast<float>(windowSize.x) - 2.f * kPad, kBannerHeight);

    const app::Banner banner = app::describeConnection(snapshot, domain::nowMs());

    sf::RectangleShape rect(size);
    rect.setPosition(pos);
    rect.setFillColor(toneColor(banner.tone));
    target.draw(rect);

    auto font = resourceProvider.getFont("ui");
    if (!font) {
        if (!fontWarningLogged_) {
            LOG_WARN(logging::LogCategory::UI, "HUD overlay: font not available.");
            fontWarningLogged_ = true;
        }
        return;
    }

    sf::Text text;
    text.setFont(*font);
    text.setCharacterSize(18);
    text.setString(banner.message.empty() ? std::string(" ") : banner.message);
    text.setFillColor(sf::Color::White);
    text.setPosition(pos.x + 12.f, pos.y + 10.f);
    target.draw(text);
}

void HUD::drawFooter(sf::RenderTarget& target,
                     const core::ViewSnapshot& snapshot,
                     ResourceProvider& resourceProvider) {
    const sf::Vector2u windowSize = target.getSize();
    if (windowSize.x == 0 || windowSize.y == 0) {
        return;
    }

    const float top = static_cast<float>(windowSize.y) - kFooterHeight;
    sf::RectangleShape rect(sf::Vector2f(static_cast<float>(windowSize.x), kFooterHeight));
    rect.setPosition(0.f, top);
    rect.setFillColor(sf::Color(30, 34, 44));
    target.draw(rect);

    auto font = resourceProvider.getFont("ui");
    if (!font) {
        return;
    }

    sf::Text text;
    text.setFont(*font);
    text.setCharacterSize(14);
    text.setString(app::footerText(snapshot));
    text.setFillColor(sf::Color(185, 190, 205));
    text.setPosition(kPad, top + 6.f);
    target.draw(text);
}

} // namespace ui
