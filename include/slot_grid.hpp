#pragma once
#include <optional>
#include <vector>
#include <fmt/format.h>
#include "config.hpp"
#include "day.hpp"
#include "errors.hpp"
#include "time_slot.hpp"

// the ordered raster positions of the operating window, Monday to Friday
class SlotGrid {
    public:
        SlotGrid(unsigned from_hour, unsigned from_minute, unsigned to_hour, unsigned to_minute) :
            window_from{minute_of_day(from_hour, from_minute)},
            window_to{minute_of_day(to_hour, to_minute)} {
            if (window_from % MIN_ALIGNMENT || window_to % MIN_ALIGNMENT)
                throw validation_error(fmt::format("operating window {:02d}:{:02d}-{:02d}:{:02d} is not aligned to the {}-minute raster",
                    from_hour, from_minute, to_hour, to_minute, MIN_ALIGNMENT));
            if (window_to > 24 * 60 || window_from >= window_to)
                throw validation_error(fmt::format("operating window {:02d}:{:02d}-{:02d}:{:02d} is empty or exceeds the day",
                    from_hour, from_minute, to_hour, to_minute));

            for (unsigned day{}; day < WEEKDAYS; ++day)
                for (unsigned minute{window_from}; minute < window_to; minute += MIN_ALIGNMENT)
                    slots.emplace_back(Day(day), minute / 60, minute % 60);
        }

        explicit SlotGrid(const struct solve_config& cfg) :
            SlotGrid(cfg.window_from_hour, cfg.window_from_minute, cfg.window_to_hour, cfg.window_to_minute) {}

        size_t size() const { return slots.size(); }
        unsigned positions_per_day() const { return (window_to - window_from) / MIN_ALIGNMENT; }
        const std::vector<TimeSlot>& get_slots() const { return slots; }
        const TimeSlot& at(size_t index) const { return AT(slots, index); }

        auto begin() const { return slots.begin(); }
        auto end() const { return slots.end(); }

        bool contains(const TimeSlot& t) const {
            if (unsigned(t.get_day()) >= WEEKDAYS)
                return false;
            const unsigned minute = t.get_minute_of_day();
            return minute >= window_from && minute < window_to;
        }

        std::optional<size_t> index_of(const TimeSlot& t) const {
            if (!contains(t))
                return std::nullopt;
            return size_t(unsigned(t.get_day())) * positions_per_day() + position_of_day(t);
        }

        // raster offset from the opening of the window on the slot's day
        unsigned position_of_day(const TimeSlot& t) const {
            return (t.get_minute_of_day() - window_from) / MIN_ALIGNMENT;
        }

        // whether a session starting at t ends inside the window of the same day
        bool fits_session(const TimeSlot& t) const {
            return contains(t) && position_of_day(t) + SESSION_CHUNKS <= positions_per_day();
        }

        // last position of a day at which a whole session still fits
        unsigned last_session_start() const {
            return positions_per_day() >= SESSION_CHUNKS ? positions_per_day() - SESSION_CHUNKS : 0;
        }

        std::vector<TimeSlot> session_starts() const {
            std::vector<TimeSlot> starts;
            for (const auto& t : slots)
                if (fits_session(t))
                    starts.push_back(t);
            return starts;
        }

    private:
        static unsigned minute_of_day(unsigned hour, unsigned minute) { return hour * 60 + minute; }

        unsigned window_from;
        unsigned window_to;
        std::vector<TimeSlot> slots;
};
