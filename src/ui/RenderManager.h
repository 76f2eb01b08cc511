#pragma once

#include <SFML/Graphics/RenderTarget.hpp>
#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/Graphics/View.hpp>

#include <functional>
#include <vector>

namespace ui {

struct RenderCommand {
    int zIndex{0};  // lower draws first
    std::function<void(sf::RenderTarget&)> drawFunc{};
};

class RenderManager {
public:
    RenderManager();

    void addRenderCommand(int z, std::function<void(sf::RenderTarget&)> func);

    // Clears the window and runs the queued commands in z order, then forgets them.
    void render(sf::RenderWindow& window);

    void onResize(sf::Vector2u size);

private:
    std::vector<RenderCommand> commands;
    sf::Vector2u canvasSize_;
    sf::View windowView_;
    bool viewDirty_{true};
};

} // namespace ui
