#pragma once

#include <cstdint>

namespace gridimg::core {

namespace TimeUtils {
constexpr int kHoursPerDay = 24;
constexpr int kMinutesPerHour = 60;
constexpr int kMonthsPerYear = 12;
constexpr std::int64_t kDaysPerEra = 146097;
}  // namespace TimeUtils

}  // namespace gridimg::core
