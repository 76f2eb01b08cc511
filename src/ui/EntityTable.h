#pragma once

#include <SFML/Graphics/RenderTarget.hpp>

#include "core/ViewSnapshot.h"

namespace ui {

class ResourceProvider;

// One row per entity, sorted by id, between `top` and `bottom`.
class EntityTable {
public:
    void draw(sf::RenderTarget& target,
              const core::ViewSnapshot& snapshot,
              ResourceProvider& resourceProvider,
              float top,
              float bottom) const;
};

} // namespace ui
