#include "ui/TimeMarkerCalculator.h"

#include "core/TimeUtils.h"
#include "logging/Log.h"
#include "ui/LayoutEngine.h"

namespace gridimg::ui {

float TimeMarkerCalculator::positionFor(int hour, int minute) {
    const float hourOfDay = static_cast<float>(hour)
        + static_cast<float>(minute) / static_cast<float>(core::TimeUtils::kMinutesPerHour);
    return static_cast<float>(LayoutEngine::boundary(0)) + hourOfDay * LayoutEngine::kSlotWidth;
}

std::optional<TimeMarker> TimeMarkerCalculator::compute(const domain::CalendarDate& date,
                                                        const domain::LocalDateTime& now) const {
    if (date != now.date) {
        return std::nullopt;
    }

    if (now.hour < 0 || now.hour >= core::TimeUtils::kHoursPerDay || now.minute < 0
        || now.minute >= core::TimeUtils::kMinutesPerHour) {
        LOG_WARN(logging::LogCategory::LAYOUT,
                 "Ignoring out-of-range clock reading %02d:%02d",
                 now.hour,
                 now.minute);
        return std::nullopt;
    }

    TimeMarker marker;
    marker.hourOfDay = static_cast<float>(now.hour)
        + static_cast<float>(now.minute) / static_cast<float>(core::TimeUtils::kMinutesPerHour);
    marker.x = positionFor(now.hour, now.minute);
    LOG_DEBUG(logging::LogCategory::LAYOUT, "Now marker at %02d:%02d x=%.2f", now.hour, now.minute, marker.x);
    return marker;
}

}  // namespace gridimg::ui
