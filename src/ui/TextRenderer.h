#pragma once

#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/Image.hpp>

#include <string>
#include <vector>

#include "domain/Types.h"
#include "ui/ColorStateMapper.h"
#include "ui/LayoutEngine.h"
#include "ui/ResourceProvider.h"
#include "ui/TimeMarkerCalculator.h"

namespace gridimg::ui {

struct TextLabel {
    enum class Align { Left, Center, Right };

    std::string text;
    unsigned characterSize{13};
    FontWeight weight{FontWeight::Regular};
    sf::Color color{palette::kPrimaryText};
    float anchorX{0.0f};
    Band band{};  // glyph box is centred vertically inside this band
    Align align{Align::Left};
};

struct LegendEntry {
    domain::StateSymbol symbol{domain::StateSymbol::Unknown};
    float swatchLeft{0.0f};
    float swatchTop{0.0f};
};

class TextRenderer {
public:
    static constexpr unsigned kTitleSize = 22;
    static constexpr unsigned kDateSize = 15;
    static constexpr unsigned kHourLabelSize = 11;
    static constexpr unsigned kMarkerLabelSize = 11;
    static constexpr unsigned kLegendSize = 13;
    static constexpr float kSwatchWidth = 28.0f;
    static constexpr float kSwatchHeight = 6.0f;

    explicit TextRenderer(ResourceProvider& resources);

    float measureWidth(const std::string& text, unsigned characterSize, FontWeight weight);

    TextLabel titleLabel(const Geometry& geometry, const std::string& title) const;
    TextLabel dateLabel(const Geometry& geometry, const domain::CalendarDate& date) const;
    std::vector<TextLabel> hourLabels(const Geometry& geometry) const;
    TextLabel markerLabel(const Geometry& geometry, const TimeMarker& marker);

    // Appends the legend captions to `labels` and returns where each swatch goes.
    std::vector<LegendEntry> layoutLegend(const Geometry& geometry, std::vector<TextLabel>& labels);

    // Labels whose font could not be loaded are skipped.
    void draw(sf::Image& target, const std::vector<TextLabel>& labels);

private:
    float measureWidthUnlocked(const std::string& text, unsigned characterSize, FontWeight weight);

    ResourceProvider& resources_;
};

}  // namespace gridimg::ui
