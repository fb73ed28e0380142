#include "ui/PixelCanvas.h"

#include <algorithm>
#include <cmath>

namespace gridimg::ui::pixels {

namespace {

bool inside(const sf::Image& image, int x, int y) {
    const sf::Vector2u size = image.getSize();
    return x >= 0 && y >= 0 && static_cast<unsigned>(x) < size.x && static_cast<unsigned>(y) < size.y;
}

}  // namespace

void fill(sf::Image& image, const sf::Color& color) {
    const sf::Vector2u size = image.getSize();
    fillRect(image, sf::IntRect(0, 0, static_cast<int>(size.x), static_cast<int>(size.y)), color);
}

void fillRect(sf::Image& image, const sf::IntRect& rect, const sf::Color& color) {
    const sf::Vector2u size = image.getSize();
    const int left = std::max(rect.left, 0);
    const int top = std::max(rect.top, 0);
    const int right = std::min(rect.left + rect.width, static_cast<int>(size.x));
    const int bottom = std::min(rect.top + rect.height, static_cast<int>(size.y));

    for (int y = top; y < bottom; ++y) {
        for (int x = left; x < right; ++x) {
            image.setPixel(static_cast<unsigned>(x), static_cast<unsigned>(y), color);
        }
    }
}

void blendPixel(sf::Image& image, int x, int y, const sf::Color& color, std::uint8_t coverage) {
    if (coverage == 0 || !inside(image, x, y)) {
        return;
    }

    const unsigned alpha = (static_cast<unsigned>(coverage) * color.a + 127U) / 255U;
    if (alpha >= 255U) {
        image.setPixel(static_cast<unsigned>(x), static_cast<unsigned>(y), sf::Color(color.r, color.g, color.b));
        return;
    }

    const sf::Color dst = image.getPixel(static_cast<unsigned>(x), static_cast<unsigned>(y));
    const auto mix = [alpha](sf::Uint8 src, sf::Uint8 under) {
        return static_cast<sf::Uint8>((src * alpha + under * (255U - alpha) + 127U) / 255U);
    };
    image.setPixel(static_cast<unsigned>(x),
                   static_cast<unsigned>(y),
                   sf::Color(mix(color.r, dst.r), mix(color.g, dst.g), mix(color.b, dst.b), 255));
}

void fillPointer(sf::Image& image, float tipX, int top, int height, float halfBase, const sf::Color& color) {
    if (height <= 0) {
        return;
    }
    for (int row = 0; row < height; ++row) {
        const float half = halfBase * (1.0f - (static_cast<float>(row) + 0.5f) / static_cast<float>(height));
        const int left = static_cast<int>(std::lround(tipX - half));
        const int right = std::max(static_cast<int>(std::lround(tipX + half)), left + 1);
        fillRect(image, sf::IntRect(left, top + row, right - left, 1), color);
    }
}

}  // namespace gridimg::ui::pixels
