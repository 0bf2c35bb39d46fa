#pragma once
#include <algorithm>
#include <array>
#include <map>
#include <string>
#include <tuple>
#include <vector>
#include <fmt/format.h>
#include "entities.hpp"
#include "objective.hpp"
#include "time_slot.hpp"

// declaration order is the reporting order
enum class violation_kind {
    UNASSIGNED_CHILD,
    PREFERRED_TEACHER_UNMET,
    EARLY_PREFERENCE_UNMET,
    TANDEM_UNFULFILLED,
    TEACHER_PAUSE_VIOLATED,
};

static const std::array<std::string, 5> violation_kind_names = {
    "unassigned_child",
    "preferred_teacher_unmet",
    "early_preference_unmet",
    "tandem_unfulfilled",
    "teacher_pause_violated",
};

template <>
struct fmt::formatter<violation_kind> : formatter<string_view> {
    template <typename FormatContext>
    auto format(violation_kind k, FormatContext& ctx) const {
        return formatter<string_view>::format(violation_kind_names.at(unsigned(k)), ctx);
    }
};

struct violation {
    violation_kind kind;
    std::vector<std::string> subjects;
    std::string detail;
};

// lists every soft goal a finished assignment leaves unmet
class ViolationAnalyzer {
    public:
        explicit ViolationAnalyzer(const ObjectiveBuilder& objective) : objective{objective} {}

        std::vector<violation> explain(const assignment_map& assignments,
                                       const std::vector<Child>& children,
                                       const std::vector<Teacher>& teachers,
                                       const std::vector<Tandem>& tandems) const {
            std::map<std::string, std::string> teacher_names;
            for (const auto& teacher : teachers)
                teacher_names.emplace(teacher.get_id(), teacher.get_name());
            auto teacher_name = [&](const std::string& id) {
                const auto it = teacher_names.find(id);
                return it == teacher_names.end() ? id : it->second;
            };

            std::vector<violation> result;
            for (const auto& child : children) {
                const auto it = assignments.find(child.get_id());
                if (it == assignments.end()) {
                    result.push_back({violation_kind::UNASSIGNED_CHILD, {child.get_id()},
                        child.has_availability()
                            ? fmt::format("{} could not be placed in any session", child.get_name())
                            : fmt::format("{} has no availability", child.get_name())});
                    continue;
                }
                const auto& a = it->second;
                const auto top = child.get_top_preference();
                if (top && *top != a.teacher_id)
                    result.push_back({violation_kind::PREFERRED_TEACHER_UNMET, {child.get_id(), a.teacher_id},
                        fmt::format("{} is taught by {} instead of {}", child.get_name(), teacher_name(a.teacher_id), teacher_name(*top))});
                // the earliness credit is below what the child's and the teachers' availability allowed
                if (child.is_early_preferred() && objective.misses_early_start(child, a.start, teachers))
                    result.push_back({violation_kind::EARLY_PREFERENCE_UNMET, {child.get_id()},
                        fmt::format("{} prefers an early session but starts {}, earliness {:.2f}",
                            child.get_name(), a.start, objective.earliness(a.start))});
            }

            for (const auto& tandem : tandems) {
                const auto first = assignments.find(tandem.get_first());
                const auto second = assignments.find(tandem.get_second());
                const bool has_first = first != assignments.end();
                const bool has_second = second != assignments.end();
                std::string detail;
                if (!has_first && !has_second)
                    detail = "neither child is assigned";
                else if (!has_first)
                    detail = fmt::format("'{}' is unassigned", tandem.get_first());
                else if (!has_second)
                    detail = fmt::format("'{}' is unassigned", tandem.get_second());
                else if (!(first->second == second->second))
                    detail = fmt::format("'{}' is at {} with {}, '{}' at {} with {}",
                        tandem.get_first(), first->second.start, teacher_name(first->second.teacher_id),
                        tandem.get_second(), second->second.start, teacher_name(second->second.teacher_id));
                else
                    continue;
                result.push_back({violation_kind::TANDEM_UNFULFILLED, {tandem.get_first(), tandem.get_second()},
                    fmt::format("tandem {} is not taught jointly: {}", tandem.get_name(), detail)});
            }

            for (const auto& pair : find_back_to_back(assignments))
                result.push_back({violation_kind::TEACHER_PAUSE_VIOLATED, {pair.teacher_id},
                    fmt::format("{} teaches at {} and directly afterwards at {:t}",
                        teacher_name(pair.teacher_id), pair.first, pair.second)});

            std::stable_sort(result.begin(), result.end(), [](const violation& a, const violation& b) {
                return std::tie(a.kind, a.subjects) < std::tie(b.kind, b.subjects);
            });
            return result;
        }

    private:
        const ObjectiveBuilder& objective;
};
