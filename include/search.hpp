#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <vector>
#include <fmt/format.h>
#include "config.hpp"
#include "constraint_encoder.hpp"
#include "objective.hpp"

enum class search_state {
    OPTIMAL,
    FEASIBLE_TIME_LIMITED,
    INFEASIBLE,
};

template <>
struct fmt::formatter<search_state> : formatter<string_view> {
    template <typename FormatContext>
    auto format(search_state s, FormatContext& ctx) const {
        string_view name = "unknown";
        switch (s) {
        case search_state::OPTIMAL: name = "optimal"; break;
        case search_state::FEASIBLE_TIME_LIMITED: name = "feasible (time limited)"; break;
        case search_state::INFEASIBLE: name = "infeasible"; break;
        }
        return formatter<string_view>::format(name, ctx);
    }
};

struct search_progress {
    double elapsed_seconds;
    unsigned assigned;
    double score;
};

struct search_limits {
    double time_limit_seconds;
    unsigned num_workers;
    unsigned random_seed;
    bool log_search_progress;
    bool print_stats;
    // set by the caller to stop the search; the best assignment so far is kept
    std::atomic<bool>* cancel;
    // called from solver threads, must be thread safe
    std::function<void(const search_progress&)> on_progress;
};

inline search_limits default_search_limits(const struct solve_config& cfg) {
    return {
        .time_limit_seconds = cfg.time_limit_seconds,
        .num_workers = cfg.num_workers,
        .random_seed = cfg.random_seed,
        .log_search_progress = cfg.log_search_progress,
        .print_stats = cfg.print_stats,
        .cancel = nullptr,
        .on_progress = {},
    };
}

struct search_result {
    // indices into FeasibleSpace::get_sessions()
    std::vector<size_t> chosen;
    search_state state;
    std::chrono::milliseconds wall_time;
};

// a strategy exploring a FeasibleSpace for its best selection of sessions
class SearchBackend {
    public:
        virtual ~SearchBackend() = default;

        virtual search_result find_best(const FeasibleSpace& space,
                                        const Objective& objective,
                                        const search_limits& limits,
                                        const std::vector<size_t>& hint) const = 0;
};
