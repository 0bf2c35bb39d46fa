#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <fmt/format.h>
#include "config.hpp"
#include "constraint_encoder.hpp"
#include "entities.hpp"
#include "errors.hpp"
#include "slot_grid.hpp"
#include "time_slot.hpp"

struct score_breakdown {
    double preferred_teacher;
    double priority_early_slot;
    double tandem_fulfilled;
    // paused pairs minus back-to-back pairs, may be negative
    double teacher_pause;
    double preserve_existing_plan;

    double total() const {
        return preferred_teacher + priority_early_slot + tandem_fulfilled + teacher_pause + preserve_existing_plan;
    }
};

// sessions of one teacher starting directly one after another
struct back_to_back {
    std::string teacher_id;
    TimeSlot first;
    TimeSlot second;
};

// distinct session starts per teacher, ascending
inline std::map<std::string, std::vector<TimeSlot>> session_starts_by_teacher(const assignment_map& assignments) {
    std::map<std::string, std::vector<TimeSlot>> starts;
    for (const auto& [child_id, a] : assignments)
        starts[a.teacher_id].push_back(a.start);
    for (auto& [teacher_id, list] : starts) {
        std::sort(list.begin(), list.end());
        list.erase(std::unique(list.begin(), list.end()), list.end());
    }
    return starts;
}

inline std::vector<back_to_back> find_back_to_back(const assignment_map& assignments) {
    std::vector<back_to_back> pairs;
    for (const auto& [teacher_id, starts] : session_starts_by_teacher(assignments))
        for (size_t i{1}; i < starts.size(); ++i)
            if (starts[i] == starts[i - 1].session_end() && starts[i].same_day(starts[i - 1]))
                pairs.push_back({teacher_id, starts[i - 1], starts[i]});
    return pairs;
}

// consecutive same-day sessions of each teacher, split by whether a pause lies between them
struct pause_count {
    unsigned respected;
    unsigned violated;
};

inline pause_count count_pauses(const assignment_map& assignments) {
    pause_count count{};
    for (const auto& [teacher_id, starts] : session_starts_by_teacher(assignments))
        for (size_t i{1}; i < starts.size(); ++i) {
            if (!starts[i].same_day(starts[i - 1]))
                continue;
            if (starts[i] == starts[i - 1].session_end())
                ++count.violated;
            else
                ++count.respected;
        }
    return count;
}

// a teacher busy at `first` and at `second`; busy is the sum of the listed sessions
struct pause_term {
    std::vector<size_t> first;
    std::vector<size_t> second;
};

// the integer objective handed to a search backend
// n sessions of a teacher on a day form n - 1 consecutive pairs: every session carries day_penalty in its
// gain and every day taught costs it once; a back-to-back pair costs pause_penalty on top
struct Objective {
    // scaled score of choosing a session, per session
    std::vector<int64_t> gain;
    // number of children a session assigns, per session
    std::vector<int64_t> coverage;
    // sessions of one teacher on one day
    std::vector<std::vector<size_t>> teaching_days;
    int64_t day_penalty;
    std::vector<pause_term> pauses;
    int64_t pause_penalty;

    // coverage is worth tier_weight, larger than any attainable score span
    int64_t tier_weight;
    // added so the score part of a tiered value is never negative
    int64_t offset;
    // solver units per score point
    double scale;

    int64_t tiered_gain(size_t session) const { return AT(coverage, session) * tier_weight + AT(gain, session); }

    unsigned decode_assigned(int64_t value) const { return unsigned(value / tier_weight); }

    double decode_score(int64_t value) const { return double(value % tier_weight - offset) / scale; }
};

class ObjectiveBuilder {
    public:
        ObjectiveBuilder(const weight_config& weights, const SlotGrid& grid) :
            weights{weights},
            grid{grid} {
        }

        const weight_config& get_weights() const { return weights; }

        // 1 at the first start of the day, falling linearly to 0 at the last one
        double earliness(const TimeSlot& t) const { return earliness_at(grid.position_of_day(t)); }

        // earliest position of day at which the child could start with any teacher, other children ignored
        std::optional<unsigned> earliest_reachable(const Child& child, const std::vector<Teacher>& teachers) const {
            std::optional<unsigned> earliest;
            for (const auto& t : grid.session_starts()) {
                if (earliest && grid.position_of_day(t) >= *earliest)
                    continue;
                if (!child.can_start_session(t))
                    continue;
                for (const auto& teacher : teachers)
                    if (teacher.can_start_session(t)) {
                        earliest = grid.position_of_day(t);
                        break;
                    }
            }
            return earliest;
        }

        // a start of higher earliness was reachable; without any reachable start only the first one of the day is full credit
        bool misses_early_start(const Child& child, const TimeSlot& start, const std::vector<Teacher>& teachers) const {
            return earliness(start) < earliness_at(earliest_reachable(child, teachers).value_or(0));
        }

        // the largest single term maps to SCORE_RESOLUTION solver units, less if the tiers would not stay exact
        Objective build(const FeasibleSpace& space, const PreviousPlan* previous) const {
            const auto& sessions = space.get_sessions();
            std::vector<double> exact(sessions.size());
            double largest = 2 * weights.teacher_pause_respected;

            for (size_t index{}; index < sessions.size(); ++index) {
                const auto& s = sessions[index];
                const auto& teacher_id = AT(space.get_teachers(), s.teacher).get_id();
                double value{};
                for (unsigned child : s.children())
                    value += child_gain(AT(space.get_children(), child), teacher_id, s.start, previous);
                if (const auto* pair = std::get_if<TandemOccupant>(&s.occupants))
                    value += tandem_gain(AT(space.get_tandems(), pair->tandem), teacher_id);
                exact[index] = value;
                largest = std::max(largest, value + weights.teacher_pause_respected);
            }

            for (int64_t resolution{SCORE_RESOLUTION}; resolution >= MIN_SCORE_RESOLUTION; resolution /= 10)
                if (auto objective = scaled(space, exact, largest > 0 ? double(resolution) / largest : 1.0))
                    return std::move(*objective);
            throw solver_fault(fmt::format("{} sessions of {} children exceed the solver's exact integer range",
                sessions.size(), space.get_children().size()));
        }

        // exact score of a finished assignment
        score_breakdown evaluate(const assignment_map& assignments,
                                 const std::vector<Child>& children,
                                 const std::vector<Tandem>& tandems,
                                 const PreviousPlan* previous) const {
            score_breakdown score{};
            for (const auto& child : children) {
                const auto it = assignments.find(child.get_id());
                if (it == assignments.end())
                    continue;
                const auto& a = it->second;
                if (child.prefers_first(a.teacher_id))
                    score.preferred_teacher += weights.preferred_teacher;
                if (child.is_early_preferred())
                    score.priority_early_slot += weights.priority_early_slot * earliness(a.start);
                if (previous) {
                    const auto* old = previous->find(child.get_id());
                    if (old && *old == a)
                        score.preserve_existing_plan += weights.preserve_existing_plan;
                }
            }
            for (const auto& tandem : tandems) {
                const auto first = assignments.find(tandem.get_first());
                const auto second = assignments.find(tandem.get_second());
                if (first == assignments.end() || second == assignments.end() || !(first->second == second->second))
                    continue;
                score.tandem_fulfilled += weights.tandem_fulfilled * tandem.get_priority();
                if (tandem.get_preferred_teacher() == first->second.teacher_id)
                    score.preferred_teacher += weights.preferred_teacher;
            }
            const auto pauses = count_pauses(assignments);
            score.teacher_pause = weights.teacher_pause_respected * (double(pauses.respected) - double(pauses.violated));
            return score;
        }

    private:
        double earliness_at(unsigned position) const {
            const unsigned last = grid.last_session_start();
            if (last == 0)
                return 1.0;
            return 1.0 - double(std::min(position, last)) / last;
        }

        std::optional<Objective> scaled(const FeasibleSpace& space, const std::vector<double>& exact, double factor) const {
            Objective objective{};
            objective.scale = factor;
            objective.day_penalty = std::llround(weights.teacher_pause_respected * factor);
            objective.pause_penalty = 2 * objective.day_penalty;
            if (objective.day_penalty > 0) {
                objective.teaching_days = teaching_days(space);
                objective.pauses = pause_terms(space);
            }
            for (size_t index{}; index < exact.size(); ++index) {
                objective.gain.push_back(std::llround(exact[index] * factor) + objective.day_penalty);
                objective.coverage.push_back(int64_t(space.get_session(index).children().size()));
            }
            objective.offset = objective.day_penalty * int64_t(objective.teaching_days.size())
                             + objective.pause_penalty * int64_t(objective.pauses.size());

            // per child the best it can contribute; the sum bounds every attainable score
            int64_t span = objective.offset;
            for (unsigned c{}; c < space.get_children().size(); ++c) {
                int64_t best{};
                for (size_t index : space.get_child_sessions(c))
                    best = std::max(best, AT(objective.gain, index));
                span += best;
            }
            objective.tier_weight = span + 1;

            int64_t magnitude;
            if (__builtin_mul_overflow(objective.tier_weight, int64_t(space.get_children().size()) + 1, &magnitude)
                || magnitude > MAX_OBJECTIVE_MAGNITUDE)
                return std::nullopt;
            return objective;
        }

        double child_gain(const Child& child, const std::string& teacher_id, const TimeSlot& start, const PreviousPlan* previous) const {
            double value{};
            if (child.prefers_first(teacher_id))
                value += weights.preferred_teacher;
            if (child.is_early_preferred())
                value += weights.priority_early_slot * earliness(start);
            if (previous) {
                const auto* old = previous->find(child.get_id());
                if (old && old->teacher_id == teacher_id && old->start == start)
                    value += weights.preserve_existing_plan;
            }
            return value;
        }

        double tandem_gain(const Tandem& tandem, const std::string& teacher_id) const {
            double value = weights.tandem_fulfilled * tandem.get_priority();
            if (tandem.get_preferred_teacher() == teacher_id)
                value += weights.preferred_teacher;
            return value;
        }

        static std::vector<std::vector<size_t>> teaching_days(const FeasibleSpace& space) {
            std::map<std::pair<unsigned, Day>, std::vector<size_t>> days;
            const auto& sessions = space.get_sessions();
            for (size_t index{}; index < sessions.size(); ++index)
                days[{sessions[index].teacher, sessions[index].start.get_day()}].push_back(index);

            std::vector<std::vector<size_t>> result;
            result.reserve(days.size());
            for (auto& [key, indices] : days)
                result.push_back(std::move(indices));
            return result;
        }

        // one term per teacher and pair of starts where the second begins as the first ends
        static std::vector<pause_term> pause_terms(const FeasibleSpace& space) {
            std::vector<pause_term> terms;
            // teacher -> start chunk -> sessions
            std::vector<std::map<unsigned, std::vector<size_t>>> starting(space.get_teachers().size());
            const auto& sessions = space.get_sessions();
            for (size_t index{}; index < sessions.size(); ++index)
                AT(starting, sessions[index].teacher)[sessions[index].start.get_chunk_of_week()].push_back(index);

            for (const auto& by_chunk : starting)
                for (const auto& [chunk, first] : by_chunk) {
                    const TimeSlot start(chunk);
                    if (!start.same_day(start.session_end()))
                        continue;
                    const auto next = by_chunk.find(start.session_end().get_chunk_of_week());
                    if (next != by_chunk.end())
                        terms.push_back({first, next->second});
                }
            return terms;
        }

        weight_config weights;
        const SlotGrid& grid;
};
