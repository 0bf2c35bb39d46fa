#pragma once
#include <array>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <fmt/format.h>
#include "entities.hpp"

enum class change_kind {
    UNCHANGED,
    CHANGED,
    ADDED,
    REMOVED,
};

static const std::array<std::string, 4> change_kind_names = {
    "unchanged",
    "changed",
    "added",
    "removed",
};

template <>
struct fmt::formatter<change_kind> : formatter<string_view> {
    template <typename FormatContext>
    auto format(change_kind k, FormatContext& ctx) const {
        return formatter<string_view>::format(change_kind_names.at(unsigned(k)), ctx);
    }
};

struct diff_entry {
    std::string child_id;
    change_kind kind;
    std::optional<assignment> old_assignment;
    std::optional<assignment> new_assignment;
};

class PlanDiffer {
    public:
        // one entry per child of either plan, ascending child id
        static std::vector<diff_entry> diff(const assignment_map& current, const PreviousPlan& previous) {
            std::set<std::string> child_ids;
            for (const auto& [child_id, a] : current)
                child_ids.insert(child_id);
            for (const auto& [child_id, a] : previous.get_assignments())
                child_ids.insert(child_id);

            std::vector<diff_entry> entries;
            entries.reserve(child_ids.size());
            for (const auto& child_id : child_ids) {
                diff_entry entry{child_id, change_kind::UNCHANGED, std::nullopt, std::nullopt};
                if (const auto* old = previous.find(child_id))
                    entry.old_assignment = *old;
                if (const auto it = current.find(child_id); it != current.end())
                    entry.new_assignment = it->second;

                if (!entry.old_assignment)
                    entry.kind = change_kind::ADDED;
                else if (!entry.new_assignment)
                    entry.kind = change_kind::REMOVED;
                else if (!(*entry.old_assignment == *entry.new_assignment))
                    entry.kind = change_kind::CHANGED;
                entries.push_back(std::move(entry));
            }
            return entries;
        }

        static unsigned count(const std::vector<diff_entry>& entries, change_kind kind) {
            unsigned n{};
            for (const auto& entry : entries)
                if (entry.kind == kind)
                    ++n;
            return n;
        }
};
