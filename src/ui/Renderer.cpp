#include "ui/Renderer.h"

#include <SFML/Graphics/Rect.hpp>

#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>
#include <vector>

#include "core/RenderCommand.h"
#include "domain/Calendar.h"
#include "logging/Log.h"
#include "ui/ColorStateMapper.h"
#include "ui/PixelCanvas.h"
#include "ui/RenderManager.h"
#include "ui/TextRenderer.h"

namespace gridimg::ui {

namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::RENDER;
constexpr int kMarkerLineWidth = 2;
constexpr float kMarkerHalfBase = 5.0f;
constexpr int kMarkerPointerHeight = 8;
constexpr int kMarkerLineTop = 96;

void queueDecorations(RenderManager& manager, const Geometry& geometry) {
    const sf::IntRect separator(geometry.contentLeft,
                                geometry.separator.top,
                                geometry.contentRight - geometry.contentLeft,
                                geometry.separator.height());
    manager.addRenderCommand(core::RenderLayer::kDecoration, [separator](sf::Image& target) {
        pixels::fillRect(target, separator, palette::kSeparator);
    });

    std::vector<sf::IntRect> ticks;
    ticks.reserve(geometry.boundaries.size());
    const int lastColumn = static_cast<int>(domain::kCanvasWidth) - 1;
    for (const int boundary : geometry.boundaries) {
        ticks.emplace_back(std::min(boundary, lastColumn), geometry.ticks.top, 1, geometry.ticks.height());
    }
    manager.addRenderCommand(core::RenderLayer::kDecoration, [ticks](sf::Image& target) {
        for (const auto& tick : ticks) {
            pixels::fillRect(target, tick, palette::kTick);
        }
    });
}

void queueSegments(RenderManager& manager, const Geometry& geometry) {
    std::vector<std::pair<sf::IntRect, sf::Color>> bars;
    bars.reserve(geometry.segments.size());
    for (const auto& segment : geometry.segments) {
        bars.emplace_back(sf::IntRect(segment.left, geometry.bar.top, segment.width(), geometry.bar.height()),
                          ColorStateMapper::colorFor(segment.symbol));
    }
    manager.addRenderCommand(core::RenderLayer::kSegments, [bars](sf::Image& target) {
        for (const auto& [rect, color] : bars) {
            pixels::fillRect(target, rect, color);
        }
    });
}

// Two columns wide: round(x) - 1 and round(x), kept inside the canvas.
void queueMarker(RenderManager& manager, const Geometry& geometry, const TimeMarker& marker) {
    const int maxLeft = static_cast<int>(domain::kCanvasWidth) - kMarkerLineWidth;
    const int lineLeft = std::clamp(static_cast<int>(std::lround(marker.x)) - kMarkerLineWidth / 2, 0, maxLeft);
    const sf::IntRect line(lineLeft, kMarkerLineTop, kMarkerLineWidth, geometry.ticks.bottom - kMarkerLineTop);
    const float tip = static_cast<float>(lineLeft + kMarkerLineWidth / 2);

    manager.addRenderCommand(core::RenderLayer::kMarker, [line, tip](sf::Image& target) {
        pixels::fillPointer(target,
                            tip,
                            kMarkerLineTop - kMarkerPointerHeight,
                            kMarkerPointerHeight,
                            kMarkerHalfBase,
                            palette::kMarker);
        pixels::fillRect(target, line, palette::kMarker);
    });
}

void queueLegendSwatches(RenderManager& manager, const std::vector<LegendEntry>& entries) {
    std::vector<std::pair<sf::IntRect, sf::Color>> swatches;
    swatches.reserve(entries.size());
    for (const auto& entry : entries) {
        swatches.emplace_back(sf::IntRect(static_cast<int>(std::lround(entry.swatchLeft)),
                                          static_cast<int>(std::lround(entry.swatchTop)),
                                          static_cast<int>(TextRenderer::kSwatchWidth),
                                          static_cast<int>(TextRenderer::kSwatchHeight)),
                              ColorStateMapper::colorFor(entry.symbol));
    }
    manager.addRenderCommand(core::RenderLayer::kDecoration, [swatches](sf::Image& target) {
        for (const auto& [rect, color] : swatches) {
            pixels::fillRect(target, rect, color);
        }
    });
}

}  // namespace

Renderer::Renderer(ResourceProvider& resources, RenderOptions options)
    : resources_(resources), options_(std::move(options)) {}

sf::Image Renderer::render(const domain::StateModel& model, const domain::LocalDateTime& now) const {
    const Geometry geometry = layoutEngine_.compute(model);
    const std::optional<TimeMarker> marker = markerCalculator_.compute(model.date, now);

    RenderManager manager;
    TextRenderer textRenderer(resources_);

    queueDecorations(manager, geometry);
    queueSegments(manager, geometry);
    if (marker) {
        queueMarker(manager, geometry, *marker);
    }

    std::vector<TextLabel> labels;
    labels.push_back(textRenderer.titleLabel(geometry, options_.title));
    labels.push_back(textRenderer.dateLabel(geometry, model.date));
    if (options_.hourLabels) {
        auto hours = textRenderer.hourLabels(geometry);
        labels.insert(labels.end(), hours.begin(), hours.end());
    }
    if (marker) {
        labels.push_back(textRenderer.markerLabel(geometry, *marker));
    }
    if (options_.legend) {
        queueLegendSwatches(manager, textRenderer.layoutLegend(geometry, labels));
    }
    manager.addRenderCommand(core::RenderLayer::kText, [&textRenderer, &labels](sf::Image& target) {
        textRenderer.draw(target, labels);
    });

    sf::Image image;
    image.create(domain::kCanvasWidth, domain::kCanvasHeight, palette::kBackground);
    manager.render(image, palette::kBackground);

    LOG_DEBUG(kLogCategory,
              "Rendered %s (%s marker) %ux%u",
              domain::format_date(model.date).c_str(),
              marker ? "with" : "no",
              image.getSize().x,
              image.getSize().y);
    return image;
}

}  // namespace gridimg::ui
