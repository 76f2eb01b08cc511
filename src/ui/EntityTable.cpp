#include "ui/EntityTable.h"

#include <SFML/Graphics/RectangleShape.hpp>
#include <SFML/Graphics/Text.hpp>

#include <cstddef>
#include <string>

#include "app/StatusSummary.h"
#include "ui/ResourceProvider.h"

namespace ui {
namespace {
constexpr float kRowHeight = 22.f;
constexpr float kLeft = 12.f;
constexpr unsigned kCharSize = 15;

const sf::Color kHeaderColor(120, 130, 150);
const sf::Color kRowColor(210, 214, 228);
const sf::Color kStaleRowColor(140, 144, 156);
const sf::Color kFreshRowColor(255, 206, 86);
const sf::Color kStripeColor(30, 34, 44);
}  // namespace

void EntityTable::draw(sf::RenderTarget& target,
                       const core::ViewSnapshot& snapshot,
                       ResourceProvider& resourceProvider,
                       float top,
                       float bottom) const {
    auto font = resourceProvider.getFont("ui");
    if (!font || !snapshot.entities || bottom - top < 2.f * kRowHeight) {
        return;
    }

    const float width = static_cast<float>(target.getSize().x);
    sf::Text text;
    text.setFont(*font);
    text.setCharacterSize(kCharSize);

    text.setString("ENTITY  FIELDS");
    text.setFillColor(kHeaderColor);
    text.setPosition(kLeft, top);
    target.draw(text);

    const auto& entities = *snapshot.entities;
    if (entities.empty()) {
        text.setString(snapshot.stale ? "no data (waiting for connection)" : "no entities yet");
        text.setFillColor(kStaleRowColor);
        text.setPosition(kLeft, top + kRowHeight);
        target.draw(text);
        return;
    }

    const auto capacity = static_cast<std::size_t>((bottom - top) / kRowHeight) - 1;
    const bool truncated = entities.size() > capacity;
    const std::size_t shown = truncated ? capacity - 1 : entities.size();

    float y = top + kRowHeight;
    std::size_t index = 0;
    for (const auto& [id, entity] : entities) {
        if (index == shown) {
            break;
        }
        if (index % 2 == 1) {
            sf::RectangleShape stripe(sf::Vector2f(width, kRowHeight));
            stripe.setPosition(0.f, y);
            stripe.setFillColor(kStripeColor);
            target.draw(stripe);
        }

        sf::Color color = kRowColor;
        if (snapshot.stale) {
            color = kStaleRowColor;
        }
        else if (entity.sequence == snapshot.sequence) {
            color = kFreshRowColor;
        }
        text.setString(app::formatEntityRow(entity));
        text.setFillColor(color);
        text.setPosition(kLeft, y + 2.f);
        target.draw(text);

        y += kRowHeight;
        ++index;
    }

    if (truncated) {
        text.setString("... " + std::to_string(entities.size() - shown) + " more");
        text.setFillColor(kHeaderColor);
        text.setPosition(kLeft, y + 2.f);
        target.draw(text);
    }
}

} // namespace ui
