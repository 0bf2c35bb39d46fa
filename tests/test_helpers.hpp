#pragma once
#include <string>
#include <vector>
#include "config.hpp"
#include "day.hpp"
#include "entities.hpp"
#include "time_slot.hpp"

inline solve_config test_config() {
    auto cfg = default_solve_config();
    cfg.num_workers = 1;
    cfg.time_limit_seconds = 20.0;
    return cfg;
}

template <typename Entity>
Entity& free_at(Entity& entity, Day day, unsigned from_hour, unsigned from_minute, unsigned to_hour, unsigned to_minute) {
    entity.add_availability(TimeSlot(day, from_hour, from_minute), TimeSlot(day, to_hour, to_minute));
    return entity;
}

inline Teacher make_teacher(const std::string& id, Day day, unsigned from_hour, unsigned from_minute, unsigned to_hour, unsigned to_minute) {
    Teacher teacher(id, "Teacher " + id);
    free_at(teacher, day, from_hour, from_minute, to_hour, to_minute);
    return teacher;
}

inline Child make_child(const std::string& id, Day day, unsigned from_hour, unsigned from_minute, unsigned to_hour, unsigned to_minute,
                        const std::vector<std::string>& preferred_teachers = {}, bool early_preferred = false) {
    Child child(id, "Child " + id, preferred_teachers, early_preferred);
    free_at(child, day, from_hour, from_minute, to_hour, to_minute);
    return child;
}

inline weight_config zero_weights() {
    return {
        .preferred_teacher = 0,
        .priority_early_slot = 0,
        .tandem_fulfilled = 0,
        .teacher_pause_respected = 0,
        .preserve_existing_plan = 0,
    };
}
