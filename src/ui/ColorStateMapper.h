#pragma once

#include <SFML/Graphics/Color.hpp>

#include "domain/Types.h"

namespace gridimg::ui {

// iOS system palette (light mode).
namespace palette {
const sf::Color kBackground(255, 255, 255);
const sf::Color kPrimaryText(0, 0, 0);
const sf::Color kSecondaryText(60, 60, 67);
const sf::Color kSeparator(198, 198, 200);
const sf::Color kTick(174, 174, 178);
const sf::Color kMarker(0, 122, 255);
}  // namespace palette

class ColorStateMapper {
public:
    static sf::Color colorFor(domain::StateSymbol symbol);
    static const char* legendLabel(domain::StateSymbol symbol);
};

}  // namespace gridimg::ui
