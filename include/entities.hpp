#pragma once
#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <fmt/format.h>
#include "config.hpp"
#include "errors.hpp"
#include "time_slot.hpp"

// common part of teachers and children: identity and the raster positions they are free at
class Participant {
    public:
        Participant(const std::string& id, const std::string& name) : id{id}, name{name} {}

        const std::string& get_id() const { return id; }
        const std::string& get_name() const { return name; }
        const std::set<TimeSlot>& get_availability() const { return availability; }
        bool has_availability() const { return !availability.empty(); }

        // half-open range [start, end) of one day
        void add_availability(TimeSlot start, TimeSlot end) {
            if (end < start || (end != start && !start.same_day(end - 1)))
                throw validation_error(fmt::format("availability {} - {:t} of '{}' does not describe a range within one day", start, end, id));
            for (TimeSlot t = start; t < end; t += 1)
                availability.insert(t);
        }

        bool is_available(TimeSlot t) const { return availability.contains(t); }

        // free at every raster position a session starting at t covers
        bool can_start_session(TimeSlot t) const {
            for (unsigned i{}; i < SESSION_CHUNKS; ++i) {
                const TimeSlot covered = t + i;
                if (!covered.same_day(t) || !is_available(covered))
                    return false;
            }
            return true;
        }

    protected:
        std::string id;
        std::string name;
        std::set<TimeSlot> availability;
};

class Teacher : public Participant {
    public:
        using Participant::Participant;
};

class Child : public Participant {
    public:
        Child(const std::string& id, const std::string& name,
              const std::vector<std::string>& preferred_teachers = {}, bool early_preferred = false) :
            Participant(id, name),
            preferred_teachers{preferred_teachers},
            early_preferred{early_preferred} {
        }

        const std::vector<std::string>& get_preferred_teachers() const { return preferred_teachers; }
        bool is_early_preferred() const { return early_preferred; }

        // only the first-listed preference earns credit
        std::optional<std::string> get_top_preference() const {
            if (preferred_teachers.empty())
                return std::nullopt;
            return preferred_teachers.front();
        }

        bool prefers_first(const std::string& teacher_id) const {
            return !preferred_teachers.empty() && preferred_teachers.front() == teacher_id;
        }

    protected:
        std::vector<std::string> preferred_teachers;
        bool early_preferred;
};

// two children that may share one session; stored in ascending id order
class Tandem {
    public:
        Tandem(const std::string& child_a, const std::string& child_b,
               std::optional<std::string> preferred_teacher = std::nullopt,
               unsigned priority = default_tandem_priority) :
            first{std::min(child_a, child_b)},
            second{std::max(child_a, child_b)},
            preferred_teacher{std::move(preferred_teacher)},
            priority{priority} {
        }

        const std::string& get_first() const { return first; }
        const std::string& get_second() const { return second; }
        const std::optional<std::string>& get_preferred_teacher() const { return preferred_teacher; }
        unsigned get_priority() const { return priority; }
        std::string get_name() const { return fmt::format("{}+{}", first, second); }

        bool contains(const std::string& child_id) const { return child_id == first || child_id == second; }

        const std::string& partner_of(const std::string& child_id) const { return child_id == first ? second : first; }

    protected:
        std::string first;
        std::string second;
        std::optional<std::string> preferred_teacher;
        unsigned priority;
};

// priorities arriving from JSON or Python are range checked before narrowing
inline unsigned checked_tandem_priority(long long priority, const std::string& first, const std::string& second) {
    if (priority < min_tandem_priority || priority > max_tandem_priority)
        throw validation_error(fmt::format("tandem '{}+{}' has priority {}, expected {}-{}",
            std::min(first, second), std::max(first, second), priority, min_tandem_priority, max_tandem_priority));
    return unsigned(priority);
}

struct weight_config {
    double preferred_teacher;
    double priority_early_slot;
    double tandem_fulfilled;
    double teacher_pause_respected;
    double preserve_existing_plan;
};

inline weight_config default_weights() {
    return {
        .preferred_teacher = 5,
        .priority_early_slot = 3,
        .tandem_fulfilled = 4,
        .teacher_pause_respected = 1,
        .preserve_existing_plan = 10,
    };
}

struct assignment {
    std::string teacher_id;
    TimeSlot start;

    friend bool operator==(const assignment&, const assignment&) = default;
};

// child id -> assignment, ordered by child id
using assignment_map = std::map<std::string, assignment>;

class PreviousPlan {
    public:
        PreviousPlan() = default;
        explicit PreviousPlan(assignment_map assignments) : assignments{std::move(assignments)} {}

        void add(const std::string& child_id, const std::string& teacher_id, TimeSlot start) {
            assignments.insert_or_assign(child_id, assignment{teacher_id, start});
        }

        const assignment* find(const std::string& child_id) const {
            const auto it = assignments.find(child_id);
            return it == assignments.end() ? nullptr : &it->second;
        }

        const assignment_map& get_assignments() const { return assignments; }
        bool empty() const { return assignments.empty(); }

    protected:
        assignment_map assignments;
};
