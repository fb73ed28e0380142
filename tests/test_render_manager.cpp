#include <iostream>
#include <string>
#include <vector>

#include <SFML/Graphics/Image.hpp>
#include <SFML/Graphics/Rect.hpp>

#include "core/RenderCommand.h"
#include "ui/PixelCanvas.h"
#include "ui/RenderManager.h"

using gridimg::ui::RenderManager;
namespace layer = gridimg::core::RenderLayer;
namespace pixels = gridimg::ui::pixels;

int main() {
    RenderManager manager;
    std::vector<std::string> order;

    manager.addRenderCommand(layer::kText, [&order](sf::Image&) { order.push_back("text"); });
    manager.addRenderCommand(layer::kSegments, [&order](sf::Image&) { order.push_back("segments-1"); });
    manager.addRenderCommand(layer::kDecoration, [&order](sf::Image&) { order.push_back("decoration"); });
    manager.addRenderCommand(layer::kSegments, [&order](sf::Image&) { order.push_back("segments-2"); });
    manager.addRenderCommand(layer::kMarker, [&order](sf::Image&) { order.push_back("marker"); });

    if (manager.commandCount() != 5) {
        std::cerr << "Expected 5 queued commands\n";
        return 1;
    }

    sf::Image surface;
    surface.create(8, 8, sf::Color::Black);
    manager.render(surface, sf::Color::White);

    const std::vector<std::string> expected{"decoration", "segments-1", "segments-2", "marker", "text"};
    if (order != expected) {
        std::cerr << "Commands replayed out of layer order\n";
        return 1;
    }
    if (manager.hasCommands()) {
        std::cerr << "Queue must be empty after render\n";
        return 1;
    }

    // Higher layers paint over lower ones regardless of queue order.
    const sf::IntRect whole(0, 0, 8, 8);
    manager.addRenderCommand(layer::kMarker, [whole](sf::Image& target) {
        pixels::fillRect(target, whole, sf::Color::Blue);
    });
    manager.addRenderCommand(layer::kSegments, [whole](sf::Image& target) {
        pixels::fillRect(target, whole, sf::Color::Red);
    });
    manager.render(surface, sf::Color::White);
    if (surface.getPixel(4, 4) != sf::Color::Blue) {
        std::cerr << "Marker layer must cover the segment layer\n";
        return 1;
    }

    // Clear color applies when nothing is queued.
    manager.render(surface, sf::Color::Green);
    if (surface.getPixel(0, 0) != sf::Color::Green || surface.getPixel(7, 7) != sf::Color::Green) {
        std::cerr << "Render must clear the target\n";
        return 1;
    }

    std::cout << "test_render_manager passed\n";
    return 0;
}
