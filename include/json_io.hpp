#pragma once
#include <fstream>
#include <optional>
#include <string>
#include <vector>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include "day.hpp"
#include "entities.hpp"
#include "errors.hpp"
#include "plan.hpp"
#include "time_slot.hpp"

// one solve's input as read from a JSON document
struct problem_instance {
    std::vector<Teacher> teachers;
    std::vector<Child> children;
    std::vector<Tandem> tandems;
    weight_config weights;
    std::optional<PreviousPlan> previous;
};

// implementation note: at() throws nlohmann::json::out_of_range and get<>() nlohmann::json::type_error on malformed documents

inline void read_availabilities(Participant& participant, const nlohmann::json& config) {
    for (const auto& availability : config.value("availabilities", nlohmann::json::array())) {
        const auto day         = parse_day(availability.at("day").get<std::string>());
        const auto from_hour   = availability.at("from_hour").get<unsigned>();
        const auto from_minute = availability.at("from_minute").get<unsigned>();
        const auto to_hour     = availability.at("to_hour").get<unsigned>();
        const auto to_minute   = availability.at("to_minute").get<unsigned>();
        participant.add_availability(TimeSlot(day, from_hour, from_minute), TimeSlot(day, to_hour, to_minute));
    }
}

inline std::vector<Teacher> read_teachers(const nlohmann::json& config) {
    std::vector<Teacher> teachers;
    for (const auto& teacher_config : config) {
        const auto id = teacher_config.at("id").get<std::string>();
        Teacher teacher(id, teacher_config.value("name", id));
        read_availabilities(teacher, teacher_config);
        teachers.push_back(teacher);
    }
    return teachers;
}

inline std::vector<Child> read_children(const nlohmann::json& config) {
    std::vector<Child> children;
    for (const auto& child_config : config) {
        const auto id = child_config.at("id").get<std::string>();
        Child child(id,
                    child_config.value("name", id),
                    child_config.value("preferred_teachers", std::vector<std::string>{}),
                    child_config.value("early_preferred", false));
        read_availabilities(child, child_config);
        children.push_back(child);
    }
    return children;
}

inline std::vector<Tandem> read_tandems(const nlohmann::json& config) {
    std::vector<Tandem> tandems;
    for (const auto& tandem_config : config) {
        const auto members = tandem_config.at("children").get<std::vector<std::string>>();
        if (members.size() != 2)
            throw validation_error(fmt::format("a tandem needs exactly two children, got {}", members.size()));
        std::optional<std::string> preferred_teacher;
        if (tandem_config.contains("preferred_teacher") && !tandem_config.at("preferred_teacher").is_null())
            preferred_teacher = tandem_config.at("preferred_teacher").get<std::string>();
        const auto priority = tandem_config.value("priority", (long long) default_tandem_priority);
        tandems.emplace_back(members[0], members[1], preferred_teacher, checked_tandem_priority(priority, members[0], members[1]));
    }
    return tandems;
}

inline weight_config read_weights(const nlohmann::json& config) {
    auto weights = default_weights();
    weights.preferred_teacher       = config.value("preferred_teacher", weights.preferred_teacher);
    weights.priority_early_slot     = config.value("priority_early_slot", weights.priority_early_slot);
    weights.tandem_fulfilled        = config.value("tandem_fulfilled", weights.tandem_fulfilled);
    weights.teacher_pause_respected = config.value("teacher_pause_respected", weights.teacher_pause_respected);
    weights.preserve_existing_plan  = config.value("preserve_existing_plan", weights.preserve_existing_plan);
    return weights;
}

// accepts a bare list of entries or a whole exported plan
inline PreviousPlan read_previous_plan(const nlohmann::json& config) {
    const auto& entries = config.is_object() ? config.at("schedule") : config;
    PreviousPlan previous;
    for (const auto& entry : entries) {
        const auto day = parse_day(entry.at("day").get<std::string>());
        previous.add(entry.at("child_id").get<std::string>(),
                     entry.at("teacher_id").get<std::string>(),
                     TimeSlot(day, entry.at("from_hour").get<unsigned>(), entry.at("from_minute").get<unsigned>()));
    }
    return previous;
}

inline problem_instance read_instance(const nlohmann::json& config) {
    problem_instance instance{
        .teachers = read_teachers(config.value("teachers", nlohmann::json::array())),
        .children = read_children(config.value("children", nlohmann::json::array())),
        .tandems = read_tandems(config.value("tandems", nlohmann::json::array())),
        .weights = read_weights(config.value("weights", nlohmann::json::object())),
        .previous = std::nullopt,
    };
    if (config.contains("previous_plan") && !config.at("previous_plan").is_null())
        instance.previous = read_previous_plan(config.at("previous_plan"));
    return instance;
}

inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream i(path);
    if (!i)
        throw io_error(fmt::format("cannot open `{}'", path));
    nlohmann::json j;
    i >> j;
    return j;
}

inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream o(path);
    if (!o)
        throw io_error(fmt::format("cannot open `{}' for writing", path));
    o << j.dump(4) << std::endl;
    if (!o)
        throw io_error(fmt::format("writing `{}' failed", path));
}

inline nlohmann::json export_assignment(const std::string& child_id, const assignment& a) {
    const auto end = a.start.session_end();
    return nlohmann::json::object({
        {"child_id", child_id},
        {"teacher_id", a.teacher_id},
        {"day", fmt::format("{:d}", a.start)},
        {"from_hour", a.start.get_hour()},
        {"from_minute", a.start.get_minute()},
        {"to_hour", end.get_hour()},
        {"to_minute", end.get_minute()},
    });
}

inline nlohmann::json export_violations(const std::vector<violation>& violations) {
    nlohmann::json violation_array = nlohmann::json::array();
    for (const auto& v : violations)
        violation_array.emplace_back(nlohmann::json::object({
            {"kind", fmt::format("{}", v.kind)},
            {"subjects", v.subjects},
            {"detail", v.detail},
        }));
    return violation_array;
}

inline nlohmann::json export_diff(const std::vector<diff_entry>& changes) {
    nlohmann::json diff_array = nlohmann::json::array();
    for (const auto& entry : changes) {
        nlohmann::json item = nlohmann::json::object({
            {"child_id", entry.child_id},
            {"kind", fmt::format("{}", entry.kind)},
        });
        item["old"] = nullptr;
        item["new"] = nullptr;
        if (entry.old_assignment)
            item["old"] = export_assignment(entry.child_id, *entry.old_assignment);
        if (entry.new_assignment)
            item["new"] = export_assignment(entry.child_id, *entry.new_assignment);
        diff_array.push_back(item);
    }
    return diff_array;
}

inline nlohmann::json export_plan(const Plan& plan, const std::vector<Child>& children) {
    nlohmann::json schedule_array = nlohmann::json::array();
    for (const auto& [child_id, a] : plan.assignments)
        schedule_array.push_back(export_assignment(child_id, a));

    nlohmann::json unassigned_array = nlohmann::json::array();
    for (const auto& child : children)
        if (!plan.is_assigned(child.get_id()))
            unassigned_array.push_back(child.get_id());

    return nlohmann::json::object({
        {"schedule", schedule_array},
        {"unassigned", unassigned_array},
        {"status", fmt::format("{}", plan.status)},
        {"runtime_ms", plan.runtime.count()},
        {"score", {
            {"total", plan.score.total()},
            {"preferred_teacher", plan.score.preferred_teacher},
            {"priority_early_slot", plan.score.priority_early_slot},
            {"tandem_fulfilled", plan.score.tandem_fulfilled},
            {"teacher_pause", plan.score.teacher_pause},
            {"preserve_existing_plan", plan.score.preserve_existing_plan},
        }},
        {"violations", export_violations(plan.violations)},
        {"diff", export_diff(plan.changes)},
        {"warnings", plan.warnings},
    });
}
