#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <functional>
#include <map>
#include <string>
#include <tuple>
#include <vector>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include "ortools/sat/cp_model.h"
#include "ortools/sat/cp_model_solver.h"
#include "ortools/sat/model.h"
#include "ortools/sat/sat_parameters.pb.h"
#include "ortools/util/time_limit.h"
#include "config.hpp"
#include "constraint_encoder.hpp"
#include "errors.hpp"
#include "objective.hpp"
#include "search.hpp"

using operations_research::TimeLimit;
using operations_research::sat::BoolVar;
using operations_research::sat::CpModelBuilder;
using operations_research::sat::CpSolverResponse;
using operations_research::sat::CpSolverStatus;
using operations_research::sat::LinearExpr;
using operations_research::sat::Model;
using operations_research::sat::NewFeasibleSolutionObserver;
using operations_research::sat::NewSatParameters;
using operations_research::sat::SatParameters;

// CP-SAT backend: one tiered objective (coverage over score), then per child the smallest (teacher, slot)
class CpSatSearch : public SearchBackend {
    public:
        search_result find_best(const FeasibleSpace& space,
                                const Objective& objective,
                                const search_limits& limits,
                                const std::vector<size_t>& hint) const override {
            const auto start_time = std::chrono::steady_clock::now();
            auto elapsed = [&]() { return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count(); };
            auto finish = [&](std::vector<size_t> chosen, search_state state) {
                return search_result{
                    .chosen = std::move(chosen),
                    .state = state,
                    .wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time),
                };
            };

            // nothing to decide: the empty assignment is the only one
            if (space.empty())
                return finish({}, space.get_children().empty() ? search_state::OPTIMAL : search_state::INFEASIBLE);

            CpModelBuilder cp_model;
            const auto& sessions = space.get_sessions();

            std::vector<BoolVar> chosen_var;
            chosen_var.reserve(sessions.size());
            for (const auto& s : sessions)
                chosen_var.push_back(cp_model.NewBoolVar().WithName(session_name(space, s)));

            // every child at most once
            for (unsigned c{}; c < space.get_children().size(); ++c) {
                const auto& options = space.get_child_sessions(c);
                if (options.size() > 1)
                    cp_model.AddAtMostOne(select(chosen_var, options));
            }

            // every teacher occupied by at most one session per raster position
            for (const auto& window : space.get_teacher_windows())
                cp_model.AddAtMostOne(select(chosen_var, window));

            std::vector<BoolVar> objective_var;
            std::vector<int64_t> objective_prio;
            for (size_t index{}; index < sessions.size(); ++index) {
                objective_var.push_back(AT(chosen_var, index));
                objective_prio.push_back(objective.tiered_gain(index));
            }

            // taught = busy on that day at all
            for (const auto& day : objective.teaching_days) {
                const auto taught = cp_model.NewBoolVar();
                for (size_t index : day)
                    cp_model.AddImplication(AT(chosen_var, index), taught);
                objective_var.push_back(taught);
                objective_prio.push_back(-objective.day_penalty);
            }

            // pause = busy(first) & busy(second); busy is a sum since at most one session of a teacher starts per position
            for (const auto& term : objective.pauses) {
                const auto pause = cp_model.NewBoolVar();
                std::vector<BoolVar> vars;
                std::vector<int64_t> coeffs;
                for (size_t index : term.first) {
                    vars.push_back(AT(chosen_var, index));
                    coeffs.push_back(1);
                }
                for (size_t index : term.second) {
                    vars.push_back(AT(chosen_var, index));
                    coeffs.push_back(1);
                }
                vars.push_back(pause);
                coeffs.push_back(-1);
                cp_model.AddLessOrEqual(LinearExpr::WeightedSum(vars, coeffs), 1);

                objective_var.push_back(pause);
                objective_prio.push_back(-objective.pause_penalty);
            }

            LinearExpr tiered = LinearExpr::WeightedSum(objective_var, objective_prio);
            tiered += objective.offset;
            cp_model.Maximize(tiered);

            for (size_t index : hint)
                cp_model.AddHint(AT(chosen_var, index), true);

            const auto response = run(cp_model, limits, limits.time_limit_seconds - elapsed(), [&](const CpSolverResponse& r) {
                if (!limits.on_progress)
                    return;
                const auto value = std::llround(r.objective_value());
                limits.on_progress({
                    .elapsed_seconds = elapsed(),
                    .assigned = objective.decode_assigned(value),
                    .score = objective.decode_score(value),
                });
            });

            switch (response.status()) {
            case CpSolverStatus::OPTIMAL:
                break;
            case CpSolverStatus::FEASIBLE:
                return finish(extract(response, chosen_var), search_state::FEASIBLE_TIME_LIMITED);
            case CpSolverStatus::UNKNOWN:
                // stopped before any solution, the empty assignment is all there is
                return finish({}, search_state::FEASIBLE_TIME_LIMITED);
            default:
                throw solver_fault(fmt::format("CP-SAT rejected the session model with status {}",
                    operations_research::sat::CpSolverStatus_Name(response.status())));
            }

            // lexicographic refinement under the fixed optimum
            std::vector<bool> current = values(response, chosen_var);
            cp_model.AddEquality(tiered, std::llround(response.objective_value()));

            for (unsigned c{}; c < space.get_children().size(); ++c) {
                const auto& options = space.get_child_sessions(c);
                if (options.empty())
                    continue;

                const auto rank = option_ranks(space, options);
                const int64_t unassigned = *std::max_element(rank.begin(), rank.end()) + 1;
                std::vector<BoolVar> vars;
                std::vector<int64_t> coeffs;
                int64_t current_rank = unassigned;
                for (size_t i{}; i < options.size(); ++i) {
                    vars.push_back(AT(chosen_var, options[i]));
                    coeffs.push_back(AT(rank, i) - unassigned);
                    if (AT(current, options[i]))
                        current_rank = AT(rank, i);
                }
                LinearExpr rank_expr = LinearExpr::WeightedSum(vars, coeffs);
                rank_expr += unassigned;

                if (current_rank > 0) {
                    if (stopped(limits) || limits.time_limit_seconds - elapsed() <= 0)
                        return finish(chosen(current), search_state::FEASIBLE_TIME_LIMITED);

                    cp_model.ClearHints();
                    for (size_t index{}; index < sessions.size(); ++index)
                        cp_model.AddHint(AT(chosen_var, index), AT(current, index));
                    cp_model.Minimize(rank_expr);

                    const auto refined = run(cp_model, limits, limits.time_limit_seconds - elapsed(), {});
                    if (refined.status() == CpSolverStatus::OPTIMAL || refined.status() == CpSolverStatus::FEASIBLE) {
                        const auto refined_rank = std::llround(refined.objective_value());
                        if (refined_rank < current_rank) {
                            current = values(refined, chosen_var);
                            current_rank = refined_rank;
                        }
                    } else if (refined.status() != CpSolverStatus::UNKNOWN) {
                        throw solver_fault(fmt::format("CP-SAT failed to refine the choice of child '{}' with status {}",
                            AT(space.get_children(), c).get_id(), operations_research::sat::CpSolverStatus_Name(refined.status())));
                    }
                    if (refined.status() != CpSolverStatus::OPTIMAL)
                        return finish(chosen(current), search_state::FEASIBLE_TIME_LIMITED);
                }

                cp_model.AddEquality(rank_expr, current_rank);
            }

#ifdef DEBUG
            for (size_t index{}; index < sessions.size(); ++index)
                if (AT(current, index))
                    fmt::print("chosen: {}\n", session_name(space, AT(sessions, index)));
#endif

            return finish(chosen(current), search_state::OPTIMAL);
        }

    private:
        static CpSolverResponse run(const CpModelBuilder& cp_model,
                                    const search_limits& limits,
                                    double seconds,
                                    const std::function<void(const CpSolverResponse&)>& observer) {
            Model model;
            SatParameters parameters;
            parameters.set_max_time_in_seconds(std::max(seconds, 0.0));
            parameters.set_num_workers(limits.num_workers);
            parameters.set_random_seed(limits.random_seed);
            parameters.set_log_search_progress(limits.log_search_progress);
            model.Add(NewSatParameters(parameters));
            if (observer)
                model.Add(NewFeasibleSolutionObserver(observer));
            if (limits.cancel)
                model.GetOrCreate<TimeLimit>()->RegisterExternalBooleanAsLimit(limits.cancel);

            const CpSolverResponse response = SolveCpModel(cp_model.Build(), &model);

            if (limits.print_stats)
                fmt::print(stderr, "{}", CpSolverResponseStats(response));

            return response;
        }

        static bool stopped(const search_limits& limits) { return limits.cancel && limits.cancel->load(); }

        static std::vector<BoolVar> select(const std::vector<BoolVar>& vars, const std::vector<size_t>& indices) {
            std::vector<BoolVar> selected;
            selected.reserve(indices.size());
            for (size_t index : indices)
                selected.push_back(AT(vars, index));
            return selected;
        }

        static std::vector<bool> values(const CpSolverResponse& response, const std::vector<BoolVar>& vars) {
            std::vector<bool> result;
            result.reserve(vars.size());
            for (const auto& var : vars)
                result.push_back(SolutionBooleanValue(response, var));
            return result;
        }

        static std::vector<size_t> chosen(const std::vector<bool>& current) {
            std::vector<size_t> result;
            for (size_t index{}; index < current.size(); ++index)
                if (current[index])
                    result.push_back(index);
            return result;
        }

        static std::vector<size_t> extract(const CpSolverResponse& response, const std::vector<BoolVar>& vars) {
            return chosen(values(response, vars));
        }

        // dense rank of each option by (teacher, slot); equal pairs share a rank
        static std::vector<int64_t> option_ranks(const FeasibleSpace& space, const std::vector<size_t>& options) {
            std::map<std::tuple<unsigned, size_t>, int64_t> keys;
            for (size_t index : options) {
                const auto& s = space.get_session(index);
                keys.emplace(std::make_tuple(s.teacher, s.slot_index), 0);
            }
            int64_t next{};
            for (auto& [key, rank] : keys)
                rank = next++;

            std::vector<int64_t> ranks;
            ranks.reserve(options.size());
            for (size_t index : options) {
                const auto& s = space.get_session(index);
                ranks.push_back(keys.at(std::make_tuple(s.teacher, s.slot_index)));
            }
            return ranks;
        }

        static std::string session_name(const FeasibleSpace& space, const session& s) {
            std::vector<std::string> names;
            for (unsigned child : s.children())
                names.push_back(AT(space.get_children(), child).get_id());
            return fmt::format("{} with {} at {}", fmt::join(names, "+"), AT(space.get_teachers(), s.teacher).get_id(), s.start);
        }
};
