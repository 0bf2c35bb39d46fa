#pragma once
#include <compare>
#include <fmt/format.h>
#include "config.hpp"
#include "day.hpp"
#include "errors.hpp"

// a raster position of the week; sessions start on one and cover SESSION_CHUNKS of them
class TimeSlot {
    public:
        TimeSlot(Day day, unsigned hour, unsigned minute) : TimeSlot(((unsigned(day) * 24 + hour) * 60 + minute) / MIN_ALIGNMENT) {
            if (unsigned(day) >= WEEKDAYS)
                throw validation_error(fmt::format("day needs to be in range MONDAY-FRIDAY, but is {}", unsigned(day)));
            if (hour >= 24)
                throw validation_error(fmt::format("hour needs to be in range 0-23, but is {}", hour));
            if (minute >= 60)
                throw validation_error(fmt::format("minute needs to be in range 0-59, but is {}", minute));
            if (minute % MIN_ALIGNMENT)
                throw validation_error(fmt::format("{:02d}:{:02d} is not aligned to the {}-minute raster", hour, minute, MIN_ALIGNMENT));
        }
        explicit TimeSlot(unsigned chunk_of_week) : chunk_of_week{chunk_of_week} {}

        unsigned get_chunk_of_week() const { return chunk_of_week; }

        unsigned get_chunk_of_day() const { return chunk_of_week % chunks_per_day; }

        Day get_day() const { return Day(chunk_of_week / chunks_per_day); }

        unsigned get_hour() const { return get_chunk_of_day() * MIN_ALIGNMENT / 60; }

        unsigned get_minute() const { return get_chunk_of_day() * MIN_ALIGNMENT % 60; }

        unsigned get_minute_of_day() const { return get_chunk_of_day() * MIN_ALIGNMENT; }

        // first raster position after a session starting here
        TimeSlot session_end() const { return TimeSlot(chunk_of_week + SESSION_CHUNKS); }

        bool same_day(const TimeSlot& other) const { return get_day() == other.get_day(); }

        void operator+=(unsigned chunk_increment) { chunk_of_week += chunk_increment; }
        TimeSlot operator+(unsigned chunk_increment) const { return TimeSlot(chunk_of_week + chunk_increment); }
        TimeSlot operator-(unsigned chunk_decrement) const { return TimeSlot(chunk_of_week - chunk_decrement); }
        friend auto operator<=>(const TimeSlot&, const TimeSlot&) = default;

    protected:
        unsigned chunk_of_week;
};

template <>
struct fmt::formatter<TimeSlot> {
    enum presentation : char {
        time = 't',
        day = 'd',
        string = 's',
    };
    presentation p = presentation::string;
    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
        // "t" prints only the time of day, "d" only the day
        auto it = ctx.begin(), end = ctx.end();

        if (it != end) {
            const char c = *it;
            if (c == 't' || c == 'd' || c == 's') {
                p = presentation(c);
                it++;
            }
        }

        if (it != end && *it != '}') throw format_error("invalid format");

        return it;
    }

    template <typename FormatContext>
    auto format(const TimeSlot& t, FormatContext& ctx) const -> decltype(ctx.out()) {
        switch (p) {
        case presentation::time: return format_to(ctx.out(), "{:02d}:{:02d}", t.get_hour(), t.get_minute());
        case presentation::day: return format_to(ctx.out(), "{}", t.get_day());
        case presentation::string: return format_to(ctx.out(), "{} {:02d}:{:02d}", t.get_day(), t.get_hour(), t.get_minute());
        }
        throw format_error("invalid format");
    }
};
