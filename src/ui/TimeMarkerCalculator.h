#pragma once

#include <optional>

#include "domain/Types.h"

namespace gridimg::ui {

struct TimeMarker {
    float x{0.0f};
    float hourOfDay{0.0f};  // hour + minute / 60
};

class TimeMarkerCalculator {
public:
    // A marker exists only when `date` is the current local calendar date.
    std::optional<TimeMarker> compute(const domain::CalendarDate& date, const domain::LocalDateTime& now) const;

    static float positionFor(int hour, int minute);
};

}  // namespace gridimg::ui
