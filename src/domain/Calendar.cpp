#include "domain/Calendar.h"

#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace gridimg::domain {

namespace {

constexpr std::array<const char*, 12> kMonthNames{
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December"};

constexpr std::array<const char*, 7> kWeekdayNames{
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};

std::tm safeLocaltime(std::time_t time) {
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    return tm;
}

bool parseDigits(std::string_view text, std::size_t offset, std::size_t count, int& out) {
    int value = 0;
    for (std::size_t i = offset; i < offset + count; ++i) {
        const auto ch = static_cast<unsigned char>(text[i]);
        if (std::isdigit(ch) == 0) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

// Days since 1970-01-01 in the proleptic Gregorian calendar.
std::int64_t daysFromCivil(int year, int month, int day) noexcept {
    const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t mp = (month + 9) % 12;
    const std::int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * core::TimeUtils::kDaysPerEra + doe - 719468;
}

}  // namespace

bool is_leap_year(int year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) noexcept {
    switch (month) {
    case 2:
        return is_leap_year(year) ? 29 : 28;
    case 4:
    case 6:
    case 9:
    case 11:
        return 30;
    default:
        break;
    }
    return (month >= 1 && month <= core::TimeUtils::kMonthsPerYear) ? 31 : 0;
}

bool is_valid_date(const CalendarDate& date) noexcept {
    if (date.year < 1 || date.month < 1 || date.month > core::TimeUtils::kMonthsPerYear) {
        return false;
    }
    return date.day >= 1 && date.day <= days_in_month(date.year, date.month);
}

std::optional<CalendarDate> parse_date(std::string_view text) {
    if (text.size() != 10 || text[2] != '-' || text[5] != '-') {
        return std::nullopt;
    }

    CalendarDate date;
    if (!parseDigits(text, 0, 2, date.day) || !parseDigits(text, 3, 2, date.month)
        || !parseDigits(text, 6, 4, date.year)) {
        return std::nullopt;
    }
    if (!is_valid_date(date)) {
        return std::nullopt;
    }
    return date;
}

int weekday(const CalendarDate& date) noexcept {
    const auto days = daysFromCivil(date.year, date.month, date.day);
    // 1970-01-01 was a Thursday.
    return static_cast<int>(((days + 4) % 7 + 7) % 7);
}

std::string format_date(const CalendarDate& date) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d-%02d-%04d", date.day, date.month, date.year);
    return buffer;
}

std::string format_date_human(const CalendarDate& date) {
    if (!is_valid_date(date)) {
        return format_date(date);
    }
    std::string text = kWeekdayNames[static_cast<std::size_t>(weekday(date))];
    text += ", ";
    text += std::to_string(date.day);
    text += ' ';
    text += kMonthNames[static_cast<std::size_t>(date.month - 1)];
    text += ' ';
    text += std::to_string(date.year);
    return text;
}

std::string format_date_stem(const CalendarDate& date) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d_%02d_%04d", date.day, date.month, date.year);
    return buffer;
}

LocalDateTime local_now() {
    const std::tm tm = safeLocaltime(std::time(nullptr));
    LocalDateTime now;
    now.date.day = tm.tm_mday;
    now.date.month = tm.tm_mon + 1;
    now.date.year = tm.tm_year + 1900;
    now.hour = tm.tm_hour;
    now.minute = tm.tm_min;
    return now;
}

}  // namespace gridimg::domain
