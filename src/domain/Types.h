#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/TimeUtils.h"

namespace gridimg::domain {

constexpr unsigned kCanvasWidth = 1024;
constexpr unsigned kCanvasHeight = 250;
constexpr std::size_t kSlotCount = core::TimeUtils::kHoursPerDay;

enum class StateSymbol { Available, Unavailable, Partial, Unknown };

constexpr std::array<StateSymbol, 4> kAllSymbols{
    StateSymbol::Available, StateSymbol::Unavailable, StateSymbol::Partial, StateSymbol::Unknown};

// Wire glyph for each symbol, as produced by the upstream schedule scraper.
inline std::string_view symbol_glyph(StateSymbol symbol) {
    switch (symbol) {
    case StateSymbol::Available:
        return "\xE2\x97\x8F";  // U+25CF BLACK CIRCLE
    case StateSymbol::Unavailable:
        return "\xE2\x9C\x95";  // U+2715 MULTIPLICATION X
    case StateSymbol::Partial:
        return "%";
    case StateSymbol::Unknown:
        return "-";
    }
    return "-";
}

inline const char* symbol_name(StateSymbol symbol) {
    switch (symbol) {
    case StateSymbol::Available:
        return "Available";
    case StateSymbol::Unavailable:
        return "Unavailable";
    case StateSymbol::Partial:
        return "Partial";
    case StateSymbol::Unknown:
        return "Unknown";
    }
    return "Unknown";
}

struct CalendarDate {
    int day{1};
    int month{1};
    int year{1970};

    friend bool operator==(const CalendarDate& a, const CalendarDate& b) noexcept {
        return a.day == b.day && a.month == b.month && a.year == b.year;
    }
    friend bool operator!=(const CalendarDate& a, const CalendarDate& b) noexcept { return !(a == b); }
};

struct LocalDateTime {
    CalendarDate date{};
    int hour{0};
    int minute{0};
};

struct StateModel {
    CalendarDate date{};
    std::array<StateSymbol, kSlotCount> hours{};

    StateModel() { hours.fill(StateSymbol::Unknown); }
};

struct RenderedImage {
    std::vector<std::uint8_t> bytes;
    unsigned width{kCanvasWidth};
    unsigned height{kCanvasHeight};

    bool empty() const noexcept { return bytes.empty(); }
    std::size_t size() const noexcept { return bytes.size(); }
};

}  // namespace gridimg::domain
