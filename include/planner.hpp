#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <fmt/format.h>
#include "config.hpp"
#include "constraint_encoder.hpp"
#include "cp_sat_search.hpp"
#include "entities.hpp"
#include "objective.hpp"
#include "plan.hpp"
#include "plan_diff.hpp"
#include "search.hpp"
#include "slot_grid.hpp"
#include "validation.hpp"
#include "violations.hpp"

// caller-owned controls of a running solve
struct solve_hooks {
    std::atomic<bool>* cancel = nullptr;
    std::function<void(const search_progress&)> on_progress;
};

class Planner {
    public:
        explicit Planner(const struct solve_config& cfg = default_solve_config(),
                         std::shared_ptr<const SearchBackend> backend = std::make_shared<CpSatSearch>()) :
            cfg{cfg},
            grid{cfg},
            backend{std::move(backend)} {
        }

        const struct solve_config& get_config() const { return cfg; }
        const SlotGrid& get_grid() const { return grid; }

        // throws validation_error before searching; otherwise always returns a plan
        Plan solve(const std::vector<Child>& children,
                   const std::vector<Teacher>& teachers,
                   const std::vector<Tandem>& tandems,
                   const weight_config& weights,
                   const std::optional<PreviousPlan>& previous = std::nullopt,
                   std::optional<double> time_limit_seconds = std::nullopt,
                   const solve_hooks& hooks = {}) const {
            const auto start_time = std::chrono::steady_clock::now();

            const auto warnings = Validator(grid).validate(children, teachers, tandems, weights);
            if (cfg.verbose)
                for (const auto& warning : warnings)
                    fmt::print(stderr, "warning: {}\n", warning);

            const PreviousPlan* previous_plan = previous ? &*previous : nullptr;
            const FeasibleSpace space = ConstraintEncoder(grid).encode(children, teachers, tandems);
            const ObjectiveBuilder builder(weights, grid);
            const Objective objective = builder.build(space, previous_plan);

            if (cfg.verbose)
                fmt::print(stderr, "{} children, {} teachers, {} tandems: {} legal sessions, {} teacher windows, {} pause terms, {:g} units per point\n",
                    space.get_children().size(), space.get_teachers().size(), space.get_tandems().size(),
                    space.get_sessions().size(), space.get_teacher_windows().size(), objective.pauses.size(), objective.scale);

            search_limits limits = default_search_limits(cfg);
            if (time_limit_seconds)
                limits.time_limit_seconds = *time_limit_seconds;
            limits.cancel = hooks.cancel;
            limits.on_progress = hooks.on_progress;

            std::vector<size_t> hint;
            if (previous_plan)
                hint = ConstraintEncoder::previous_sessions(space, *previous_plan);

            const search_result found = backend->find_best(space, objective, limits, hint);
            if (cfg.verbose)
                fmt::print(stderr, "search finished {} after {} ms\n", found.state, found.wall_time.count());

            Plan plan = ResultAssembler(space, builder).assemble(found, previous_plan);
            plan.warnings = warnings;
            plan.runtime = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time);

            if (cfg.verbose)
                fmt::print(stderr, "{}: {} of {} children assigned, score {:.3f}\n",
                    plan.status, plan.assignments.size(), children.size(), plan.score.total());

            return plan;
        }

        // runs solve() on its own thread; the inputs are copied, the planner has to outlive the future
        std::future<Plan> solve_async(std::vector<Child> children,
                                      std::vector<Teacher> teachers,
                                      std::vector<Tandem> tandems,
                                      weight_config weights,
                                      std::optional<PreviousPlan> previous = std::nullopt,
                                      std::optional<double> time_limit_seconds = std::nullopt,
                                      solve_hooks hooks = {}) const {
            return std::async(std::launch::async,
                [this, children = std::move(children), teachers = std::move(teachers), tandems = std::move(tandems),
                 weights, previous = std::move(previous), time_limit_seconds, hooks = std::move(hooks)]() {
                    return solve(children, teachers, tandems, weights, previous, time_limit_seconds, hooks);
                });
        }

        std::vector<violation> explain(const Plan& plan,
                                       const std::vector<Child>& children,
                                       const std::vector<Teacher>& teachers,
                                       const std::vector<Tandem>& tandems) const {
            const ObjectiveBuilder builder(default_weights(), grid);
            return ViolationAnalyzer(builder).explain(plan.assignments, children, teachers, tandems);
        }

        static std::vector<diff_entry> diff(const Plan& plan, const PreviousPlan& previous) {
            return PlanDiffer::diff(plan.assignments, previous);
        }

    private:
        solve_config cfg;
        SlotGrid grid;
        std::shared_ptr<const SearchBackend> backend;
};
