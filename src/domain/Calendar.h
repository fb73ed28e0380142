#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "domain/Types.h"

namespace gridimg::domain {

bool is_leap_year(int year) noexcept;
int days_in_month(int year, int month) noexcept;
bool is_valid_date(const CalendarDate& date) noexcept;

// Strict DD-MM-YYYY; rejects out-of-range days such as 31-02-2025.
std::optional<CalendarDate> parse_date(std::string_view text);

// 0 = Sunday ... 6 = Saturday.
int weekday(const CalendarDate& date) noexcept;

std::string format_date(const CalendarDate& date);        // "20-11-2025"
std::string format_date_human(const CalendarDate& date);  // "Thursday, 20 November 2025"
std::string format_date_stem(const CalendarDate& date);   // "20_11_2025"

LocalDateTime local_now();

}  // namespace gridimg::domain
