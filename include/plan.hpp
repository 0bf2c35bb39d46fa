#pragma once

#include <algorithm>
#include <chrono>
#include <map>
#include <string>
#include <vector>
#include "fmt/format.h"
#include "config.hpp"
#include "constraint_encoder.hpp"
#include "entities.hpp"
#include "errors.hpp"
#include "objective.hpp"
#include "plan_diff.hpp"
#include "search.hpp"
#include "violations.hpp"

enum class solve_status {
    OPTIMAL,
    FEASIBLE,
    NO_SOLUTION,
};

template <>
struct fmt::formatter<solve_status> : formatter<string_view> {
    template <typename FormatContext>
    auto format(solve_status s, FormatContext& ctx) const {
        string_view name = "NO_SOLUTION";
        if (s == solve_status::OPTIMAL)
            name = "OPTIMAL";
        else if (s == solve_status::FEASIBLE)
            name = "FEASIBLE";
        return formatter<string_view>::format(name, ctx);
    }
};

// the outcome of one solve
struct Plan {
    assignment_map assignments;
    solve_status status;
    std::chrono::milliseconds runtime;
    score_breakdown score;
    std::vector<violation> violations;
    std::vector<diff_entry> changes;
    std::vector<std::string> warnings;

    bool is_assigned(const std::string& child_id) const { return assignments.contains(child_id); }
};

class ResultAssembler {
    public:
        ResultAssembler(const FeasibleSpace& space, const ObjectiveBuilder& objective) :
            space{space},
            objective{objective} {
        }

        Plan assemble(const search_result& found, const PreviousPlan* previous) const {
            Plan plan{};
            for (size_t index : found.chosen) {
                const auto& s = space.get_session(index);
                const auto& teacher_id = AT(space.get_teachers(), s.teacher).get_id();
                for (unsigned child : s.children()) {
                    const auto& child_id = AT(space.get_children(), child).get_id();
                    if (!plan.assignments.emplace(child_id, assignment{teacher_id, s.start}).second)
                        throw solver_fault(fmt::format("child '{}' was assigned more than once", child_id));
                }
            }
            verify(plan.assignments, space.get_children(), space.get_teachers(), space.get_tandems());

            if (plan.assignments.empty() && !space.get_children().empty())
                plan.status = solve_status::NO_SOLUTION;
            else if (found.state == search_state::OPTIMAL)
                plan.status = solve_status::OPTIMAL;
            else if (found.state == search_state::FEASIBLE_TIME_LIMITED)
                plan.status = solve_status::FEASIBLE;
            else
                plan.status = solve_status::NO_SOLUTION;

            plan.runtime = found.wall_time;
            plan.score = objective.evaluate(plan.assignments, space.get_children(), space.get_tandems(), previous);
            plan.violations = ViolationAnalyzer(objective).explain(plan.assignments, space.get_children(), space.get_teachers(), space.get_tandems());
            if (previous)
                plan.changes = PlanDiffer::diff(plan.assignments, *previous);
            return plan;
        }

        // availability and capacity rules every returned plan holds; a breach is an engine defect
        static void verify(const assignment_map& assignments,
                           const std::vector<Child>& children,
                           const std::vector<Teacher>& teachers,
                           const std::vector<Tandem>& tandems) {
            std::map<std::string, const Child*> child_by_id;
            for (const auto& child : children)
                child_by_id.emplace(child.get_id(), &child);
            std::map<std::string, const Teacher*> teacher_by_id;
            for (const auto& teacher : teachers)
                teacher_by_id.emplace(teacher.get_id(), &teacher);

            // teacher -> start -> occupants
            std::map<std::string, std::map<TimeSlot, std::vector<std::string>>> occupancy;
            for (const auto& [child_id, a] : assignments) {
                const auto child = child_by_id.find(child_id);
                const auto teacher = teacher_by_id.find(a.teacher_id);
                if (child == child_by_id.end() || teacher == teacher_by_id.end())
                    throw solver_fault(fmt::format("assignment of '{}' to '{}' references an unknown entity", child_id, a.teacher_id));
                if (!child->second->can_start_session(a.start))
                    throw solver_fault(fmt::format("child '{}' is not available for the whole session at {}", child_id, a.start));
                if (!teacher->second->can_start_session(a.start))
                    throw solver_fault(fmt::format("teacher '{}' is not available for the whole session at {}", a.teacher_id, a.start));
                occupancy[a.teacher_id][a.start].push_back(child_id);
            }

            for (const auto& [teacher_id, sessions] : occupancy) {
                const TimeSlot* previous_start = nullptr;
                for (const auto& [start, occupants] : sessions) {
                    if (previous_start && start < previous_start->session_end())
                        throw solver_fault(fmt::format("sessions of teacher '{}' at {} and {} overlap", teacher_id, *previous_start, start));
                    previous_start = &start;

                    if (occupants.size() > 2)
                        throw solver_fault(fmt::format("teacher '{}' has {} children at {}", teacher_id, occupants.size(), start));
                    if (occupants.size() == 2) {
                        const bool paired = std::any_of(tandems.begin(), tandems.end(), [&](const Tandem& tandem) {
                            return tandem.contains(occupants[0]) && tandem.contains(occupants[1]);
                        });
                        if (!paired)
                            throw solver_fault(fmt::format("children '{}' and '{}' share a session at {} without forming a tandem",
                                occupants[0], occupants[1], start));
                    }
                }
            }
        }

    private:
        const FeasibleSpace& space;
        const ObjectiveBuilder& objective;
};
