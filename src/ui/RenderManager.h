#pragma once

#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/Image.hpp>
#include <cstddef>
#include <functional>
#include <vector>

#include "core/RenderCommand.h"

namespace gridimg::ui {

class RenderManager {
public:
    RenderManager();
    ~RenderManager();

    // Queue a draw call on layer `z`; calls on the same layer keep insertion order.
    void addRenderCommand(int z, std::function<void(sf::Image&)> func);

    // Fills the target with `clearColor`, replays every queued command in z order, then empties the queue.
    void render(sf::Image& target, const sf::Color& clearColor);

    bool hasCommands() const;
    std::size_t commandCount() const;

private:
    std::vector<core::RenderCommand> commands;
};

}  // namespace gridimg::ui
