#pragma once

#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/Image.hpp>
#include <SFML/Graphics/Rect.hpp>

#include <cstdint>

namespace gridimg::ui::pixels {

// Software fills on an sf::Image. Everything is clipped to the image, so
// callers may pass spans that run past an edge.

void fill(sf::Image& image, const sf::Color& color);

void fillRect(sf::Image& image, const sf::IntRect& rect, const sf::Color& color);

// Source-over blend of `color` scaled by `coverage` (0..255). Destination alpha stays opaque.
void blendPixel(sf::Image& image, int x, int y, const sf::Color& color, std::uint8_t coverage);

// Downward-pointing isosceles triangle: base row at `top`, apex at (`tipX`, top + height).
void fillPointer(sf::Image& image, float tipX, int top, int height, float halfBase, const sf::Color& color);

}  // namespace gridimg::ui::pixels
