#pragma once
#include <cmath>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <fmt/format.h>
#include "config.hpp"
#include "entities.hpp"
#include "errors.hpp"
#include "slot_grid.hpp"

// structural checks on one solve's input; every problem is collected before throwing
class Validator {
    public:
        explicit Validator(const SlotGrid& grid) : grid{grid} {}

        // throws validation_error listing all problems, returns the non-fatal warnings
        std::vector<std::string> validate(const std::vector<Child>& children,
                                          const std::vector<Teacher>& teachers,
                                          const std::vector<Tandem>& tandems,
                                          const weight_config& weights) const {
            std::vector<std::string> problems;
            std::vector<std::string> warnings;

            check_ids(teachers, "teacher", problems);
            check_ids(children, "child", problems);
            for (const auto& teacher : teachers)
                check_availability(teacher, "teacher", problems);
            for (const auto& child : children)
                check_availability(child, "child", problems);

            std::set<std::string> teacher_ids;
            for (const auto& teacher : teachers)
                teacher_ids.insert(teacher.get_id());
            std::set<std::string> child_ids;
            for (const auto& child : children)
                child_ids.insert(child.get_id());

            for (const auto& child : children)
                for (const auto& preferred : child.get_preferred_teachers())
                    if (!teacher_ids.contains(preferred))
                        warnings.push_back(fmt::format("child '{}' prefers unknown teacher '{}'", child.get_id(), preferred));

            check_tandems(tandems, child_ids, teacher_ids, problems);
            check_weights(weights, problems, warnings);

            if (!problems.empty())
                throw validation_error(problems);
            return warnings;
        }

    private:
        template <typename Entity>
        static void check_ids(const std::vector<Entity>& entities, const char* kind, std::vector<std::string>& problems) {
            std::set<std::string> seen;
            for (const auto& entity : entities) {
                if (entity.get_id().empty())
                    problems.push_back(fmt::format("{} '{}' has an empty id", kind, entity.get_name()));
                else if (!seen.insert(entity.get_id()).second)
                    problems.push_back(fmt::format("duplicate {} id '{}'", kind, entity.get_id()));
            }
        }

        void check_availability(const Participant& entity, const char* kind, std::vector<std::string>& problems) const {
            for (const auto& t : entity.get_availability())
                if (!grid.contains(t))
                    problems.push_back(fmt::format("{} '{}' is available at {}, outside the operating window", kind, entity.get_id(), t));
        }

        static void check_tandems(const std::vector<Tandem>& tandems,
                                  const std::set<std::string>& child_ids,
                                  const std::set<std::string>& teacher_ids,
                                  std::vector<std::string>& problems) {
            std::map<std::string, std::string> paired;
            for (const auto& tandem : tandems) {
                const auto name = tandem.get_name();
                if (tandem.get_first() == tandem.get_second()) {
                    problems.push_back(fmt::format("tandem '{}' contains the same child twice", name));
                    continue;
                }
                for (const auto& member : {tandem.get_first(), tandem.get_second()}) {
                    if (!child_ids.contains(member)) {
                        problems.push_back(fmt::format("tandem '{}' references unknown child '{}'", name, member));
                        continue;
                    }
                    const auto [it, inserted] = paired.emplace(member, name);
                    if (!inserted)
                        problems.push_back(fmt::format("child '{}' of tandem '{}' is already paired in tandem '{}'", member, name, it->second));
                }
                const auto& preferred = tandem.get_preferred_teacher();
                if (preferred && !teacher_ids.contains(*preferred))
                    problems.push_back(fmt::format("tandem '{}' prefers unknown teacher '{}'", name, *preferred));
                if (tandem.get_priority() < min_tandem_priority || tandem.get_priority() > max_tandem_priority)
                    problems.push_back(fmt::format("tandem '{}' has priority {}, expected {}-{}",
                        name, tandem.get_priority(), min_tandem_priority, max_tandem_priority));
            }
        }

        static void check_weights(const weight_config& weights, std::vector<std::string>& problems, std::vector<std::string>& warnings) {
            const std::pair<const char*, double> named[] = {
                {"preferred_teacher", weights.preferred_teacher},
                {"priority_early_slot", weights.priority_early_slot},
                {"tandem_fulfilled", weights.tandem_fulfilled},
                {"teacher_pause_respected", weights.teacher_pause_respected},
                {"preserve_existing_plan", weights.preserve_existing_plan},
            };
            double total{};
            bool all_valid{true};
            for (const auto& [name, value] : named) {
                if (!std::isfinite(value)) {
                    problems.push_back(fmt::format("weight '{}' is not a finite number", name));
                    all_valid = false;
                } else if (value < 0) {
                    problems.push_back(fmt::format("weight '{}' must not be negative, got {}", name, value));
                    all_valid = false;
                } else {
                    total += value;
                }
            }
            if (all_valid && total == 0)
                warnings.push_back("all optimization weights are zero, only the number of assigned children is optimized");
        }

        const SlotGrid& grid;
};
