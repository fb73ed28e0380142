#include "ui/LayoutEngine.h"

#include <cmath>

#include "logging/Log.h"

namespace gridimg::ui {

namespace {
constexpr int kContentMargin = 16;

constexpr Band kTitleBand{10, 38};
constexpr Band kDateBand{40, 62};
constexpr Band kSeparatorBand{70, 71};
constexpr Band kMarkerLabelBand{78, 100};
constexpr Band kBarBand{104, 136};
constexpr Band kTickBand{136, 142};
constexpr Band kHourLabelBand{144, 160};
constexpr Band kLegendBand{196, 222};
}  // namespace

int LayoutEngine::boundary(std::size_t index) {
    if (index >= domain::kSlotCount) {
        return static_cast<int>(domain::kCanvasWidth);
    }
    const double exact = static_cast<double>(index) * domain::kCanvasWidth / domain::kSlotCount;
    return static_cast<int>(std::lround(exact));
}

Geometry LayoutEngine::compute(const domain::StateModel& model) const {
    Geometry geometry;

    for (std::size_t i = 0; i <= domain::kSlotCount; ++i) {
        geometry.boundaries[i] = boundary(i);
    }

    for (std::size_t hour = 0; hour < domain::kSlotCount; ++hour) {
        auto& segment = geometry.segments[hour];
        segment.left = geometry.boundaries[hour];
        segment.right = geometry.boundaries[hour + 1];
        segment.symbol = model.hours[hour];
        geometry.hourLabelCenters[hour] = static_cast<float>(segment.left + segment.right) / 2.0f;
    }

    geometry.title = kTitleBand;
    geometry.date = kDateBand;
    geometry.separator = kSeparatorBand;
    geometry.markerLabel = kMarkerLabelBand;
    geometry.bar = kBarBand;
    geometry.ticks = kTickBand;
    geometry.hourLabels = kHourLabelBand;
    geometry.legend = kLegendBand;

    geometry.contentLeft = kContentMargin;
    geometry.contentRight = static_cast<int>(domain::kCanvasWidth) - kContentMargin;

    LOG_TRACE(logging::LogCategory::LAYOUT,
              "Layout bar=[%d,%d) first=%d last=%d",
              geometry.bar.top,
              geometry.bar.bottom,
              geometry.segments.front().width(),
              geometry.segments.back().width());
    return geometry;
}

}  // namespace gridimg::ui
