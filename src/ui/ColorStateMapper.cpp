#include "ui/ColorStateMapper.h"

namespace gridimg::ui {

sf::Color ColorStateMapper::colorFor(domain::StateSymbol symbol) {
    switch (symbol) {
    case domain::StateSymbol::Available:
        return sf::Color(52, 199, 89);
    case domain::StateSymbol::Unavailable:
        return sf::Color(255, 59, 48);
    case domain::StateSymbol::Partial:
        return sf::Color(255, 149, 0);
    case domain::StateSymbol::Unknown:
        return sf::Color(142, 142, 147);
    }
    return sf::Color(142, 142, 147);
}

const char* ColorStateMapper::legendLabel(domain::StateSymbol symbol) {
    switch (symbol) {
    case domain::StateSymbol::Available:
        return "Available";
    case domain::StateSymbol::Unavailable:
        return "Not Available";
    case domain::StateSymbol::Partial:
        return "Partial";
    case domain::StateSymbol::Unknown:
        return "Unknown";
    }
    return "Unknown";
}

}  // namespace gridimg::ui
