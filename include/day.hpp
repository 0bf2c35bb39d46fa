#pragma once
#include <array>
#include <string>
#include <fmt/format.h>
#include "config.hpp"
#include "errors.hpp"

enum class Day : unsigned {
    MONDAY,
    TUESDAY,
    WEDNESDAY,
    THURSDAY,
    FRIDAY,
};

static const std::array<std::string, WEEKDAYS> day_names = {
    "MONDAY",
    "TUESDAY",
    "WEDNESDAY",
    "THURSDAY",
    "FRIDAY",
};

// abbreviations as stored by the desktop front end
static const std::array<std::string, WEEKDAYS> day_short_names = {
    "Mo",
    "Di",
    "Mi",
    "Do",
    "Fr",
};

inline Day parse_day(const std::string& str) {
    for (unsigned i{}; i < day_names.size(); ++i)
        if (str == day_names[i] || str == day_short_names[i])
            return Day(i);
    throw validation_error(fmt::format("invalid day '{}'", str));
}

template <>
struct fmt::formatter<Day> : formatter<string_view> {
    template <typename FormatContext>
    auto format(Day d, FormatContext& ctx) const {
        return formatter<string_view>::format(day_names.at(unsigned(d)), ctx);
    }
};
