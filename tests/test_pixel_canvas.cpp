#include <iostream>

#include <SFML/Graphics/Image.hpp>
#include <SFML/Graphics/Rect.hpp>

#include "ui/PixelCanvas.h"

namespace pixels = gridimg::ui::pixels;

namespace {

unsigned countColor(const sf::Image& image, const sf::Color& color) {
    unsigned count = 0;
    for (unsigned y = 0; y < image.getSize().y; ++y) {
        for (unsigned x = 0; x < image.getSize().x; ++x) {
            if (image.getPixel(x, y) == color) {
                ++count;
            }
        }
    }
    return count;
}

}  // namespace

int main() {
    sf::Image image;
    image.create(16, 10, sf::Color::White);

    // Spans hanging over every edge are clipped, never written out of bounds.
    {
        pixels::fillRect(image, sf::IntRect(-4, -4, 8, 8), sf::Color::Red);
        pixels::fillRect(image, sf::IntRect(12, 6, 100, 100), sf::Color::Red);
        if (countColor(image, sf::Color::Red) != 16 + 16) {
            std::cerr << "fillRect must clip to the image\n";
            return 1;
        }
        if (image.getPixel(3, 3) != sf::Color::Red || image.getPixel(4, 4) != sf::Color::White
            || image.getPixel(15, 9) != sf::Color::Red || image.getPixel(11, 9) != sf::Color::White) {
            std::cerr << "fillRect covered the wrong pixels\n";
            return 1;
        }
    }

    {
        pixels::fill(image, sf::Color::Green);
        if (countColor(image, sf::Color::Green) != 16 * 10) {
            std::cerr << "fill must cover the whole image\n";
            return 1;
        }
    }

    // Coverage blending: none keeps the pixel, full replaces it, half mixes.
    {
        image.create(4, 1, sf::Color::White);
        pixels::blendPixel(image, 0, 0, sf::Color::Black, 0);
        pixels::blendPixel(image, 1, 0, sf::Color::Black, 255);
        pixels::blendPixel(image, 2, 0, sf::Color::Black, 128);
        pixels::blendPixel(image, 99, 0, sf::Color::Black, 255);
        pixels::blendPixel(image, -1, 0, sf::Color::Black, 255);

        if (image.getPixel(0, 0) != sf::Color::White || image.getPixel(1, 0) != sf::Color::Black) {
            std::cerr << "Zero and full coverage blend incorrectly\n";
            return 1;
        }
        const sf::Color half = image.getPixel(2, 0);
        if (half.r < 120 || half.r > 135 || half.r != half.g || half.g != half.b || half.a != 255) {
            std::cerr << "Half coverage should give mid grey, got " << static_cast<int>(half.r) << "\n";
            return 1;
        }
    }

    // Pointer narrows from its base row to a single apex column.
    {
        image.create(20, 10, sf::Color::White);
        pixels::fillPointer(image, 10.0f, 2, 8, 5.0f, sf::Color::Blue);

        unsigned baseWidth = 0;
        unsigned apexWidth = 0;
        for (unsigned x = 0; x < 20; ++x) {
            baseWidth += image.getPixel(x, 2) == sf::Color::Blue ? 1U : 0U;
            apexWidth += image.getPixel(x, 9) == sf::Color::Blue ? 1U : 0U;
        }
        if (baseWidth < 8 || apexWidth != 1 || image.getPixel(10, 9) != sf::Color::Blue) {
            std::cerr << "Pointer shape is wrong (base " << baseWidth << ", apex " << apexWidth << ")\n";
            return 1;
        }
        if (image.getPixel(10, 1) != sf::Color::White || image.getPixel(10, 0) != sf::Color::White) {
            std::cerr << "Pointer drew above its base row\n";
            return 1;
        }
    }

    std::cout << "test_pixel_canvas passed\n";
    return 0;
}
