#pragma once

#include <array>
#include <cstddef>

#include "domain/Types.h"

namespace gridimg::ui {

// Vertical pixel band, top inclusive, bottom exclusive.
struct Band {
    int top{0};
    int bottom{0};

    int height() const noexcept { return bottom - top; }
    bool overlaps(const Band& other) const noexcept { return top < other.bottom && other.top < bottom; }
};

struct Segment {
    int left{0};
    int right{0};
    domain::StateSymbol symbol{domain::StateSymbol::Unknown};

    int width() const noexcept { return right - left; }
};

struct Geometry {
    std::array<int, domain::kSlotCount + 1> boundaries{};
    std::array<Segment, domain::kSlotCount> segments{};
    std::array<float, domain::kSlotCount> hourLabelCenters{};

    Band title;
    Band date;
    Band separator;
    Band markerLabel;
    Band bar;
    Band ticks;
    Band hourLabels;
    Band legend;

    int contentLeft{0};
    int contentRight{0};
};

class LayoutEngine {
public:
    static constexpr float kSlotWidth =
        static_cast<float>(domain::kCanvasWidth) / static_cast<float>(domain::kSlotCount);

    // Cumulative rounding: boundary(0) == 0 and boundary(24) == canvas width exactly.
    static int boundary(std::size_t index);

    Geometry compute(const domain::StateModel& model) const;
};

}  // namespace gridimg::ui
