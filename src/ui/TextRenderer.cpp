#include "ui/TextRenderer.h"

#include <cmath>
#include <cstdio>
#include <mutex>
#include <utility>

#include "domain/Calendar.h"
#include "logging/Log.h"

namespace gridimg::ui {

namespace {
constexpr float kMarkerLabelGap = 8.0f;
constexpr float kSwatchLabelGap = 10.0f;
constexpr float kLegendEntryGap = 32.0f;

// Rough advance used to keep layouts stable when no font is available.
constexpr float kFallbackAdvanceRatio = 0.55f;
}  // namespace

TextRenderer::TextRenderer(ResourceProvider& resources) : resources_(resources) {}

float TextRenderer::measureWidth(const std::string& text, unsigned characterSize, FontWeight weight) {
    std::lock_guard<std::mutex> lock(resources_.glyphMutex());
    return measureWidthUnlocked(text, characterSize, weight);
}

float TextRenderer::measureWidthUnlocked(const std::string& text, unsigned characterSize, FontWeight weight) {
    auto resource = resources_.getFontResource(weight);
    if (!resource.ready) {
        return static_cast<float>(text.size()) * static_cast<float>(characterSize) * kFallbackAdvanceRatio;
    }
    return resource.font->measure(text, characterSize).width;
}

TextLabel TextRenderer::titleLabel(const Geometry& geometry, const std::string& title) const {
    TextLabel label;
    label.text = title;
    label.characterSize = kTitleSize;
    label.weight = FontWeight::Semibold;
    label.color = palette::kPrimaryText;
    label.anchorX = static_cast<float>(domain::kCanvasWidth) / 2.0f;
    label.band = geometry.title;
    label.align = TextLabel::Align::Center;
    return label;
}

TextLabel TextRenderer::dateLabel(const Geometry& geometry, const domain::CalendarDate& date) const {
    TextLabel label;
    label.text = domain::format_date_human(date);
    label.characterSize = kDateSize;
    label.color = palette::kSecondaryText;
    label.anchorX = static_cast<float>(domain::kCanvasWidth) / 2.0f;
    label.band = geometry.date;
    label.align = TextLabel::Align::Center;
    return label;
}

std::vector<TextLabel> TextRenderer::hourLabels(const Geometry& geometry) const {
    std::vector<TextLabel> labels;
    labels.reserve(domain::kSlotCount);
    for (std::size_t hour = 0; hour < domain::kSlotCount; ++hour) {
        char text[4];
        std::snprintf(text, sizeof(text), "%02zu", hour);

        TextLabel label;
        label.text = text;
        label.characterSize = kHourLabelSize;
        label.color = palette::kSecondaryText;
        label.anchorX = geometry.hourLabelCenters[hour];
        label.band = geometry.hourLabels;
        label.align = TextLabel::Align::Center;
        labels.push_back(std::move(label));
    }
    return labels;
}

TextLabel TextRenderer::markerLabel(const Geometry& geometry, const TimeMarker& marker) {
    TextLabel label;
    label.text = "now";
    label.characterSize = kMarkerLabelSize;
    label.color = palette::kMarker;
    label.band = geometry.markerLabel;

    const float width = measureWidth(label.text, kMarkerLabelSize, FontWeight::Regular);
    const float rightLimit = static_cast<float>(geometry.contentRight) + static_cast<float>(geometry.contentLeft) / 2.0f;
    if (marker.x + kMarkerLabelGap + width > rightLimit) {
        label.anchorX = marker.x - kMarkerLabelGap;
        label.align = TextLabel::Align::Right;
    }
    else {
        label.anchorX = marker.x + kMarkerLabelGap;
        label.align = TextLabel::Align::Left;
    }
    return label;
}

std::vector<LegendEntry> TextRenderer::layoutLegend(const Geometry& geometry, std::vector<TextLabel>& labels) {
    std::vector<LegendEntry> entries;
    entries.reserve(domain::kAllSymbols.size());

    const float swatchTop = static_cast<float>(geometry.legend.top)
        + (static_cast<float>(geometry.legend.height()) - kSwatchHeight) / 2.0f;
    float x = static_cast<float>(geometry.contentLeft);
    for (const auto symbol : domain::kAllSymbols) {
        entries.push_back(LegendEntry{symbol, x, swatchTop});

        TextLabel label;
        label.text = ColorStateMapper::legendLabel(symbol);
        label.characterSize = kLegendSize;
        label.color = palette::kPrimaryText;
        label.anchorX = x + kSwatchWidth + kSwatchLabelGap;
        label.band = geometry.legend;
        label.align = TextLabel::Align::Left;

        const float width = measureWidth(label.text, kLegendSize, FontWeight::Regular);
        x = label.anchorX + width + kLegendEntryGap;
        labels.push_back(std::move(label));
    }
    return entries;
}

void TextRenderer::draw(sf::Image& target, const std::vector<TextLabel>& labels) {
    std::lock_guard<std::mutex> lock(resources_.glyphMutex());
    std::size_t skipped = 0;
    for (const auto& label : labels) {
        auto resource = resources_.getFontResource(label.weight);
        if (!resource.ready) {
            ++skipped;
            continue;
        }

        const TextBounds bounds = resource.font->measure(label.text, label.characterSize);
        float originX = bounds.left;
        if (label.align == TextLabel::Align::Center) {
            originX += bounds.width / 2.0f;
        }
        else if (label.align == TextLabel::Align::Right) {
            originX += bounds.width;
        }

        const float inkTop = static_cast<float>(label.band.top)
            + (static_cast<float>(label.band.height()) - bounds.height) / 2.0f;
        const int penX = static_cast<int>(std::lround(label.anchorX - originX));
        const int baselineY = static_cast<int>(std::lround(inkTop - bounds.top));
        resource.font->draw(target, label.text, label.characterSize, penX, baselineY, label.color);
    }

    if (skipped > 0) {
        LOG_DEBUG(logging::LogCategory::FONT, "Skipped %zu labels without a usable font", skipped);
    }
}

}  // namespace gridimg::ui
