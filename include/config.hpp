#pragma once
#include <cstddef>
#include <cstdint>

#ifdef DEBUG
#define AT(vec, entry) vec.at(entry)
#else
#define AT(vec, entry) vec[entry]
#endif

constexpr unsigned MIN_ALIGNMENT = 15;
constexpr unsigned SESSION_MINUTES = 45;
constexpr unsigned SESSION_CHUNKS = SESSION_MINUTES / MIN_ALIGNMENT;
constexpr unsigned WEEKDAYS = 5;
constexpr unsigned chunks_per_day = 24 * 60 / MIN_ALIGNMENT;
constexpr size_t slots_per_week = WEEKDAYS * chunks_per_day;

// solver units of the largest single score term
constexpr int64_t SCORE_RESOLUTION = 1'000'000;
constexpr int64_t MIN_SCORE_RESOLUTION = 1'000;
// CP-SAT reports objective values as doubles, exact up to 2^53
constexpr int64_t MAX_OBJECTIVE_MAGNITUDE = int64_t(1) << 53;

constexpr unsigned default_window_from_hour = 7;
constexpr unsigned default_window_to_hour = 20;
constexpr double default_time_limit_seconds = 30.0;
constexpr unsigned default_num_workers = 8;
constexpr unsigned default_tandem_priority = 5;
constexpr unsigned min_tandem_priority = 1;
constexpr unsigned max_tandem_priority = 10;

struct solve_config {
    unsigned window_from_hour;
    unsigned window_from_minute;
    unsigned window_to_hour;
    unsigned window_to_minute;
    double time_limit_seconds;
    unsigned num_workers;
    unsigned random_seed;
    bool log_search_progress;
    bool print_stats;
    bool verbose;
};

inline solve_config default_solve_config() {
    return {
        .window_from_hour = default_window_from_hour,
        .window_from_minute = 0,
        .window_to_hour = default_window_to_hour,
        .window_to_minute = 0,
        .time_limit_seconds = default_time_limit_seconds,
        .num_workers = default_num_workers,
        .random_seed = 0,
        .log_search_progress = false,
        .print_stats = false,
        .verbose = false,
    };
}
