#pragma once
#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>
#include "config.hpp"
#include "entities.hpp"
#include "slot_grid.hpp"
#include "time_slot.hpp"

struct SingleOccupant {
    unsigned child;
};

struct TandemOccupant {
    unsigned tandem;
    unsigned first;
    unsigned second;
};

// one legal (occupants, teacher, start) decision; indices refer to the id-sorted entities of a FeasibleSpace
struct session {
    std::variant<SingleOccupant, TandemOccupant> occupants;
    unsigned teacher;
    TimeSlot start;
    size_t slot_index;

    std::vector<unsigned> children() const {
        if (const auto* single = std::get_if<SingleOccupant>(&occupants))
            return {single->child};
        const auto& pair = std::get<TandemOccupant>(occupants);
        return {pair.first, pair.second};
    }

    bool is_tandem() const { return std::holds_alternative<TandemOccupant>(occupants); }
};

// the decision space of one solve: legal sessions plus the groups among which at most one may be chosen
class FeasibleSpace {
    public:
        FeasibleSpace(const SlotGrid& grid,
                      std::vector<Child> children,
                      std::vector<Teacher> teachers,
                      std::vector<Tandem> tandems) :
            grid{grid},
            children{std::move(children)},
            teachers{std::move(teachers)},
            tandems{std::move(tandems)} {
            auto by_id = [](const auto& a, const auto& b) { return a.get_id() < b.get_id(); };
            std::sort(this->children.begin(), this->children.end(), by_id);
            std::sort(this->teachers.begin(), this->teachers.end(), by_id);
            std::sort(this->tandems.begin(), this->tandems.end(), [](const Tandem& a, const Tandem& b) {
                return std::tie(a.get_first(), a.get_second()) < std::tie(b.get_first(), b.get_second());
            });

            for (unsigned i{}; i < this->children.size(); ++i)
                child_lookup.emplace(AT(this->children, i).get_id(), i);
            for (unsigned i{}; i < this->teachers.size(); ++i)
                teacher_lookup.emplace(AT(this->teachers, i).get_id(), i);
            tandem_of.assign(this->children.size(), std::nullopt);
            for (unsigned i{}; i < this->tandems.size(); ++i) {
                const auto& tandem = AT(this->tandems, i);
                for (const auto& member : {tandem.get_first(), tandem.get_second()})
                    if (const auto c = child_index(member))
                        AT(tandem_of, *c) = i;
            }
            child_sessions.resize(this->children.size());
        }

        const SlotGrid& get_grid() const { return grid; }
        const std::vector<Child>& get_children() const { return children; }
        const std::vector<Teacher>& get_teachers() const { return teachers; }
        const std::vector<Tandem>& get_tandems() const { return tandems; }
        const std::vector<session>& get_sessions() const { return sessions; }
        const session& get_session(size_t index) const { return AT(sessions, index); }

        // sessions a child takes part in, alone or as tandem member
        const std::vector<size_t>& get_child_sessions(unsigned child) const { return AT(child_sessions, child); }

        // groups of sessions of one teacher sharing an occupied raster position
        const std::vector<std::vector<size_t>>& get_teacher_windows() const { return teacher_windows; }

        std::optional<unsigned> child_index(const std::string& id) const {
            const auto it = child_lookup.find(id);
            return it == child_lookup.end() ? std::nullopt : std::optional<unsigned>(it->second);
        }

        std::optional<unsigned> teacher_index(const std::string& id) const {
            const auto it = teacher_lookup.find(id);
            return it == teacher_lookup.end() ? std::nullopt : std::optional<unsigned>(it->second);
        }

        std::optional<unsigned> tandem_of_child(unsigned child) const { return AT(tandem_of, child); }

        bool empty() const { return sessions.empty(); }

    protected:
        friend class ConstraintEncoder;

        size_t add_session(session s) {
            const size_t index = sessions.size();
            for (unsigned child : s.children())
                AT(child_sessions, child).push_back(index);
            sessions.push_back(std::move(s));
            return index;
        }

        const SlotGrid& grid;
        std::vector<Child> children;
        std::vector<Teacher> teachers;
        std::vector<Tandem> tandems;
        std::map<std::string, unsigned> child_lookup;
        std::map<std::string, unsigned> teacher_lookup;
        std::vector<std::optional<unsigned>> tandem_of;

        std::vector<session> sessions;
        std::vector<std::vector<size_t>> child_sessions;
        std::vector<std::vector<size_t>> teacher_windows;
};

class ConstraintEncoder {
    public:
        explicit ConstraintEncoder(const SlotGrid& grid) : grid{grid} {}

        FeasibleSpace encode(const std::vector<Child>& children,
                             const std::vector<Teacher>& teachers,
                             const std::vector<Tandem>& tandems) const {
            FeasibleSpace space(grid, children, teachers, tandems);
            const auto starts = grid.session_starts();

            for (unsigned t{}; t < space.teachers.size(); ++t) {
                const auto& teacher = AT(space.teachers, t);
                // chunk of week -> sessions of this teacher covering it
                std::map<unsigned, std::vector<size_t>> covering;

                for (const auto& start : starts) {
                    if (!teacher.can_start_session(start))
                        continue;
                    const size_t slot_index = *grid.index_of(start);

                    std::vector<size_t> added;
                    for (unsigned c{}; c < space.children.size(); ++c)
                        if (AT(space.children, c).can_start_session(start))
                            added.push_back(space.add_session({SingleOccupant{c}, t, start, slot_index}));

                    for (unsigned k{}; k < space.tandems.size(); ++k) {
                        const auto& tandem = AT(space.tandems, k);
                        const auto first = space.child_index(tandem.get_first());
                        const auto second = space.child_index(tandem.get_second());
                        if (!first || !second)
                            continue;
                        if (AT(space.children, *first).can_start_session(start) && AT(space.children, *second).can_start_session(start))
                            added.push_back(space.add_session({TandemOccupant{k, *first, *second}, t, start, slot_index}));
                    }

                    for (size_t index : added)
                        for (unsigned i{}; i < SESSION_CHUNKS; ++i)
                            covering[start.get_chunk_of_week() + i].push_back(index);
                }

                for (auto& [chunk, group] : covering)
                    if (group.size() > 1)
                        space.teacher_windows.push_back(std::move(group));
            }

            return space;
        }

        // sessions reproducing the previous plan, used to warm-start the search
        static std::vector<size_t> previous_sessions(const FeasibleSpace& space, const PreviousPlan& previous) {
            std::vector<size_t> hint;
            const auto& sessions = space.get_sessions();
            for (size_t index{}; index < sessions.size(); ++index) {
                const auto& s = sessions[index];
                const auto& teacher_id = AT(space.get_teachers(), s.teacher).get_id();
                auto kept = [&](unsigned child) {
                    const auto* old = previous.find(AT(space.get_children(), child).get_id());
                    return old && old->teacher_id == teacher_id && old->start == s.start;
                };
                const auto members = s.children();
                if (!std::all_of(members.begin(), members.end(), kept))
                    continue;
                // a previously shared session is hinted as the tandem session only
                if (!s.is_tandem()) {
                    const auto k = space.tandem_of_child(members.front());
                    if (k) {
                        const auto& tandem = AT(space.get_tandems(), *k);
                        const auto partner = space.child_index(tandem.partner_of(AT(space.get_children(), members.front()).get_id()));
                        if (partner && kept(*partner))
                            continue;
                    }
                }
                hint.push_back(index);
            }
            return hint;
        }

    private:
        const SlotGrid& grid;
};
