#pragma once

#include <functional>
#include <utility>

namespace sf {
class Image;
}

namespace gridimg::core {

struct RenderCommand {
    int zIndex;  // lower draws first
    std::function<void(sf::Image&)> drawFunc;

    RenderCommand(int z, std::function<void(sf::Image&)> func)
        : zIndex(z), drawFunc(std::move(func)) {}
};

// Fixed composition order: anything on a higher layer is painted over lower layers.
namespace RenderLayer {
constexpr int kBackground = 0;
constexpr int kDecoration = 5;
constexpr int kSegments = 10;
constexpr int kMarker = 20;
constexpr int kText = 30;
}  // namespace RenderLayer

}  // namespace gridimg::core
