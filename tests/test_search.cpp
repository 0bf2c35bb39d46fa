#include <algorithm>
#include <atomic>
#include <memory>
#include <gtest/gtest.h>
#include "planner.hpp"
#include "test_helpers.hpp"

static bool has_violation(const Plan& plan, violation_kind kind, const std::string& subject) {
    for (const auto& v : plan.violations)
        if (v.kind == kind && std::find(v.subjects.begin(), v.subjects.end(), subject) != v.subjects.end())
            return true;
    return false;
}

static unsigned count_violations(const Plan& plan, violation_kind kind) {
    unsigned n{};
    for (const auto& v : plan.violations)
        if (v.kind == kind)
            ++n;
    return n;
}

class PlannerTest : public ::testing::Test {
    protected:
        const Planner planner{test_config()};
};

TEST_F(PlannerTest, SingleMatchingWindow) {
    const std::vector<Teacher> teachers{make_teacher("T", Day::MONDAY, 8, 0, 8, 45)};
    const std::vector<Child> children{make_child("C", Day::MONDAY, 8, 0, 8, 45)};

    const auto plan = planner.solve(children, teachers, {}, default_weights());
    EXPECT_EQ(plan.status, solve_status::OPTIMAL);
    ASSERT_EQ(plan.assignments.size(), 1u);
    EXPECT_EQ(plan.assignments.at("C"), (assignment{"T", TimeSlot(Day::MONDAY, 8, 0)}));
    EXPECT_TRUE(plan.violations.empty());
}

TEST_F(PlannerTest, TandemSharesTheOnlySession) {
    const std::vector<Teacher> teachers{make_teacher("T", Day::TUESDAY, 9, 0, 9, 45)};
    const std::vector<Child> children{
        make_child("a", Day::TUESDAY, 9, 0, 9, 45),
        make_child("b", Day::TUESDAY, 9, 0, 9, 45),
    };
    const std::vector<Tandem> tandems{Tandem("a", "b")};

    const auto plan = planner.solve(children, teachers, tandems, default_weights());
    EXPECT_EQ(plan.status, solve_status::OPTIMAL);
    const assignment expected{"T", TimeSlot(Day::TUESDAY, 9, 0)};
    EXPECT_EQ(plan.assignments.at("a"), expected);
    EXPECT_EQ(plan.assignments.at("b"), expected);
    EXPECT_DOUBLE_EQ(plan.score.tandem_fulfilled, 4.0 * default_tandem_priority);
    EXPECT_EQ(count_violations(plan, violation_kind::TANDEM_UNFULFILLED), 0u);
}

TEST_F(PlannerTest, ChildWithoutAvailabilityStaysUnassigned) {
    const std::vector<Teacher> teachers{make_teacher("T", Day::MONDAY, 8, 0, 9, 0)};
    const std::vector<Child> children{
        make_child("placed", Day::MONDAY, 8, 0, 9, 0),
        Child("idle", "Idle"),
    };

    const auto plan = planner.solve(children, teachers, {}, default_weights());
    EXPECT_EQ(plan.status, solve_status::OPTIMAL);
    EXPECT_TRUE(plan.is_assigned("placed"));
    EXPECT_FALSE(plan.is_assigned("idle"));
    EXPECT_TRUE(has_violation(plan, violation_kind::UNASSIGNED_CHILD, "idle"));
}

TEST_F(PlannerTest, PreviousPlanIsKeptAmongEqualAlternatives) {
    const std::vector<Teacher> teachers{make_teacher("A", Day::MONDAY, 7, 0, 9, 0)};
    const std::vector<Child> children{make_child("X", Day::MONDAY, 7, 0, 9, 0)};
    PreviousPlan previous;
    previous.add("X", "A", TimeSlot(Day::MONDAY, 8, 0));

    const auto kept = planner.solve(children, teachers, {}, default_weights(), previous);
    EXPECT_EQ(kept.assignments.at("X"), (assignment{"A", TimeSlot(Day::MONDAY, 8, 0)}));
    ASSERT_EQ(kept.changes.size(), 1u);
    EXPECT_EQ(kept.changes[0].kind, change_kind::UNCHANGED);

    // without the stability goal the earliest start wins the tie
    auto weights = default_weights();
    weights.preserve_existing_plan = 0;
    const auto moved = planner.solve(children, teachers, {}, weights, previous);
    EXPECT_EQ(moved.assignments.at("X"), (assignment{"A", TimeSlot(Day::MONDAY, 7, 0)}));
    ASSERT_EQ(moved.changes.size(), 1u);
    EXPECT_EQ(moved.changes[0].kind, change_kind::CHANGED);
}

TEST_F(PlannerTest, NoTeachersMeansNoSolution) {
    const std::vector<Child> children{make_child("C", Day::MONDAY, 8, 0, 9, 0)};

    const auto plan = planner.solve(children, {}, {}, default_weights());
    EXPECT_EQ(plan.status, solve_status::NO_SOLUTION);
    EXPECT_TRUE(plan.assignments.empty());
    EXPECT_TRUE(has_violation(plan, violation_kind::UNASSIGNED_CHILD, "C"));
}

TEST_F(PlannerTest, NothingToPlanIsOptimal) {
    const auto plan = planner.solve({}, {make_teacher("T", Day::MONDAY, 8, 0, 9, 0)}, {}, default_weights());
    EXPECT_EQ(plan.status, solve_status::OPTIMAL);
    EXPECT_TRUE(plan.assignments.empty());
}

TEST_F(PlannerTest, TiesGoToTheSmallestTeacherAndSlot) {
    const std::vector<Teacher> teachers{
        make_teacher("b", Day::MONDAY, 8, 0, 9, 0),
        make_teacher("a", Day::MONDAY, 8, 0, 9, 0),
    };
    const std::vector<Child> children{make_child("x", Day::MONDAY, 8, 0, 9, 0)};

    const auto plan = planner.solve(children, teachers, {}, zero_weights());
    EXPECT_EQ(plan.status, solve_status::OPTIMAL);
    EXPECT_EQ(plan.assignments.at("x"), (assignment{"a", TimeSlot(Day::MONDAY, 8, 0)}));
}

TEST_F(PlannerTest, CoverageIsNeverTradedForScore) {
    const std::vector<Teacher> teachers{
        make_teacher("T", Day::MONDAY, 8, 0, 8, 45),
        make_teacher("U", Day::MONDAY, 10, 0, 10, 45),
    };
    Child picky = make_child("p", Day::MONDAY, 8, 0, 8, 45, {"T"});
    free_at(picky, Day::MONDAY, 10, 0, 10, 45);
    const std::vector<Child> children{picky, make_child("q", Day::MONDAY, 8, 0, 8, 45)};
    auto weights = default_weights();
    weights.preferred_teacher = 100;

    const auto plan = planner.solve(children, teachers, {}, weights);
    EXPECT_EQ(plan.assignments.size(), 2u);
    EXPECT_EQ(plan.assignments.at("p").teacher_id, "U");
    EXPECT_EQ(plan.assignments.at("q").teacher_id, "T");
    EXPECT_TRUE(has_violation(plan, violation_kind::PREFERRED_TEACHER_UNMET, "p"));
}

TEST_F(PlannerTest, BackToBackSessionsAreAvoided) {
    const std::vector<Teacher> teachers{make_teacher("T", Day::MONDAY, 8, 0, 10, 15)};
    const std::vector<Child> children{
        make_child("c1", Day::MONDAY, 8, 0, 10, 15),
        make_child("c2", Day::MONDAY, 8, 0, 10, 15),
    };

    const auto plan = planner.solve(children, teachers, {}, default_weights());
    EXPECT_EQ(plan.assignments.at("c1").start, TimeSlot(Day::MONDAY, 8, 0));
    EXPECT_EQ(plan.assignments.at("c2").start, TimeSlot(Day::MONDAY, 9, 0));
    EXPECT_EQ(count_violations(plan, violation_kind::TEACHER_PAUSE_VIOLATED), 0u);

    auto weights = default_weights();
    weights.teacher_pause_respected = 0;
    const auto packed = planner.solve(children, teachers, {}, weights);
    EXPECT_EQ(packed.assignments.at("c2").start, TimeSlot(Day::MONDAY, 8, 45));
    EXPECT_EQ(count_violations(packed, violation_kind::TEACHER_PAUSE_VIOLATED), 1u);
}

TEST_F(PlannerTest, PausedPairOnOneDayBeatsASplitWeek) {
    Teacher teacher = make_teacher("T", Day::MONDAY, 7, 0, 7, 45);
    free_at(teacher, Day::TUESDAY, 8, 0, 8, 45);
    free_at(teacher, Day::TUESDAY, 10, 0, 10, 45);
    Child flexible = make_child("b", Day::MONDAY, 7, 0, 7, 45);
    free_at(flexible, Day::TUESDAY, 10, 0, 10, 45);
    const std::vector<Teacher> teachers{teacher};
    const std::vector<Child> children{make_child("a", Day::TUESDAY, 8, 0, 8, 45), flexible};

    const auto plan = planner.solve(children, teachers, {}, default_weights());
    EXPECT_EQ(plan.status, solve_status::OPTIMAL);
    EXPECT_EQ(plan.assignments.at("b").start, TimeSlot(Day::TUESDAY, 10, 0));
    EXPECT_DOUBLE_EQ(plan.score.teacher_pause, default_weights().teacher_pause_respected);

    const auto split = planner.solve(children, teachers, {}, zero_weights());
    EXPECT_EQ(split.assignments.at("b").start, TimeSlot(Day::MONDAY, 7, 0));
    EXPECT_DOUBLE_EQ(split.score.teacher_pause, 0.0);
}

TEST_F(PlannerTest, HugeWeightsStillAssignEveryone) {
    const std::vector<Teacher> teachers{make_teacher("T", Day::MONDAY, 8, 0, 12, 0)};
    std::vector<Child> children;
    for (const char* id : {"a", "b", "c", "d"})
        children.push_back(make_child(id, Day::MONDAY, 8, 0, 12, 0, {"T"}));
    auto weights = default_weights();
    weights.preferred_teacher = 1e16;

    Plan plan;
    ASSERT_NO_THROW(plan = planner.solve(children, teachers, {}, weights));
    EXPECT_EQ(plan.status, solve_status::OPTIMAL);
    EXPECT_EQ(plan.assignments.size(), children.size());
    EXPECT_DOUBLE_EQ(plan.score.preferred_teacher, 4e16);
}

TEST_F(PlannerTest, TinyWeightsStillDecide) {
    const std::vector<Teacher> teachers{
        make_teacher("a", Day::MONDAY, 8, 0, 9, 0),
        make_teacher("b", Day::MONDAY, 8, 0, 9, 0),
    };
    const std::vector<Child> children{make_child("x", Day::MONDAY, 8, 0, 9, 0, {"b"})};
    auto weights = zero_weights();
    weights.preferred_teacher = 1e-4;

    const auto plan = planner.solve(children, teachers, {}, weights);
    EXPECT_EQ(plan.status, solve_status::OPTIMAL);
    EXPECT_EQ(plan.assignments.at("x").teacher_id, "b");
    EXPECT_DOUBLE_EQ(plan.score.preferred_teacher, 1e-4);
}

TEST_F(PlannerTest, EarlyPreferenceWinsTheEarlierSlot) {
    const std::vector<Teacher> teachers{
        make_teacher("T", Day::MONDAY, 8, 0, 8, 45),
        make_teacher("U", Day::MONDAY, 15, 0, 15, 45),
    };
    const std::vector<Child> children{
        make_child("late", Day::MONDAY, 8, 0, 16, 0),
        make_child("early", Day::MONDAY, 8, 0, 16, 0, {}, true),
    };

    const auto plan = planner.solve(children, teachers, {}, default_weights());
    EXPECT_EQ(plan.assignments.at("early").teacher_id, "T");
    EXPECT_EQ(plan.assignments.at("late").teacher_id, "U");
}

TEST_F(PlannerTest, PreferredTeacherWeightIsMonotonic) {
    const std::vector<Teacher> teachers{
        make_teacher("E", Day::MONDAY, 7, 0, 7, 45),
        make_teacher("L", Day::MONDAY, 15, 0, 15, 45),
    };
    Child child = make_child("c", Day::MONDAY, 7, 0, 7, 45, {"L"}, true);
    free_at(child, Day::MONDAY, 15, 0, 15, 45);
    const std::vector<Child> children{child};

    unsigned previous_count{};
    for (double weight : {0.0, 1.0, 10.0, 100.0}) {
        auto weights = default_weights();
        weights.preferred_teacher = weight;
        const auto plan = planner.solve(children, teachers, {}, weights);
        const unsigned count = plan.assignments.at("c").teacher_id == "L" ? 1 : 0;
        EXPECT_GE(count, previous_count) << "preferred_teacher weight " << weight;
        previous_count = count;
    }
    EXPECT_EQ(previous_count, 1u);
}

TEST_F(PlannerTest, TandemWithPreferredTeacher) {
    const std::vector<Teacher> teachers{
        make_teacher("A", Day::WEDNESDAY, 10, 0, 10, 45),
        make_teacher("B", Day::WEDNESDAY, 10, 0, 10, 45),
    };
    const std::vector<Child> children{
        make_child("k1", Day::WEDNESDAY, 10, 0, 10, 45),
        make_child("k2", Day::WEDNESDAY, 10, 0, 10, 45),
    };
    const std::vector<Tandem> tandems{Tandem("k1", "k2", "B", 1)};

    const auto plan = planner.solve(children, teachers, tandems, default_weights());
    EXPECT_EQ(plan.assignments.at("k1").teacher_id, "B");
    EXPECT_EQ(plan.assignments.at("k2").teacher_id, "B");
    EXPECT_DOUBLE_EQ(plan.score.preferred_teacher, 5.0);
}

TEST_F(PlannerTest, TandemMembersStayIndependentWhenApart) {
    const std::vector<Teacher> teachers{make_teacher("T", Day::MONDAY, 8, 0, 12, 0)};
    const std::vector<Child> children{
        make_child("a", Day::MONDAY, 8, 0, 8, 45),
        make_child("b", Day::MONDAY, 11, 0, 11, 45),
    };

    const auto plan = planner.solve(children, teachers, {Tandem("a", "b")}, default_weights());
    EXPECT_EQ(plan.assignments.size(), 2u);
    EXPECT_TRUE(has_violation(plan, violation_kind::TANDEM_UNFULFILLED, "a"));
}

TEST_F(PlannerTest, MoreTeachersNeverAssignFewerChildren) {
    std::vector<Teacher> teachers{make_teacher("T1", Day::THURSDAY, 8, 0, 9, 30)};
    std::vector<Child> children;
    for (const char* id : {"c1", "c2", "c3", "c4"})
        children.push_back(make_child(id, Day::THURSDAY, 8, 0, 9, 30));

    const auto fewer = planner.solve(children, teachers, {}, default_weights());
    teachers.push_back(make_teacher("T2", Day::THURSDAY, 8, 0, 9, 30));
    const auto more = planner.solve(children, teachers, {}, default_weights());
    EXPECT_EQ(fewer.assignments.size(), 2u);
    EXPECT_EQ(more.assignments.size(), 4u);
}

TEST_F(PlannerTest, ReturnedPlansHoldTheHardConstraints) {
    std::vector<Teacher> teachers{
        make_teacher("T1", Day::MONDAY, 8, 0, 12, 0),
        make_teacher("T2", Day::MONDAY, 9, 0, 13, 0),
    };
    free_at(teachers[0], Day::TUESDAY, 14, 0, 16, 0);
    std::vector<Child> children;
    for (unsigned i{}; i < 10; ++i) {
        auto child = make_child(fmt::format("c{}", i), Day::MONDAY, 8 + i % 3, 0, 12, 0, {i % 2 ? "T1" : "T2"}, i % 3 == 0);
        free_at(child, Day::TUESDAY, 14, 0, 15, 30);
        children.push_back(child);
    }
    const std::vector<Tandem> tandems{Tandem("c0", "c1"), Tandem("c4", "c7", "T2", 8)};

    const auto plan = planner.solve(children, teachers, tandems, default_weights());
    EXPECT_NO_THROW(ResultAssembler::verify(plan.assignments, children, teachers, tandems));
    EXPECT_EQ(plan.status, solve_status::OPTIMAL);
}

TEST_F(PlannerTest, IdenticalInputsGiveIdenticalPlans) {
    std::vector<Teacher> teachers{
        make_teacher("T1", Day::FRIDAY, 8, 0, 11, 0),
        make_teacher("T2", Day::FRIDAY, 8, 0, 11, 0),
    };
    std::vector<Child> children;
    for (unsigned i{}; i < 6; ++i)
        children.push_back(make_child(fmt::format("c{}", i), Day::FRIDAY, 8, 0, 11, 0, {}, i % 2 == 0));

    auto parallel_cfg = test_config();
    parallel_cfg.num_workers = 4;
    const Planner parallel(parallel_cfg);

    const auto first = planner.solve(children, teachers, {Tandem("c1", "c2")}, default_weights());
    const auto second = planner.solve(children, teachers, {Tandem("c1", "c2")}, default_weights());
    const auto third = parallel.solve(children, teachers, {Tandem("c1", "c2")}, default_weights());
    EXPECT_EQ(first.status, solve_status::OPTIMAL);
    EXPECT_EQ(first.assignments, second.assignments);
    EXPECT_EQ(first.assignments, third.assignments);
    EXPECT_DOUBLE_EQ(first.score.total(), third.score.total());
}

TEST_F(PlannerTest, InvalidInputIsRejectedBeforeSearching) {
    const std::vector<Child> children{make_child("C", Day::MONDAY, 8, 0, 9, 0)};
    EXPECT_THROW(planner.solve(children, {}, {Tandem("C", "ghost")}, default_weights()), validation_error);
}

TEST_F(PlannerTest, SolvesAsynchronously) {
    const std::vector<Teacher> teachers{make_teacher("T", Day::MONDAY, 8, 0, 8, 45)};
    const std::vector<Child> children{make_child("C", Day::MONDAY, 8, 0, 8, 45)};

    auto future = planner.solve_async(children, teachers, {}, default_weights());
    const auto plan = future.get();
    EXPECT_EQ(plan.status, solve_status::OPTIMAL);
    EXPECT_TRUE(plan.is_assigned("C"));
}

TEST_F(PlannerTest, CancelledSolveStillReturnsAValidPlan) {
    const std::vector<Teacher> teachers{make_teacher("T", Day::MONDAY, 8, 0, 12, 0)};
    std::vector<Child> children;
    for (unsigned i{}; i < 5; ++i)
        children.push_back(make_child(fmt::format("c{}", i), Day::MONDAY, 8, 0, 12, 0));

    std::atomic<bool> cancel{true};
    const auto plan = planner.solve(children, teachers, {}, default_weights(), std::nullopt, std::nullopt, {.cancel = &cancel});
    EXPECT_NO_THROW(ResultAssembler::verify(plan.assignments, children, teachers, {}));
    if (plan.assignments.empty())
        EXPECT_EQ(plan.status, solve_status::NO_SOLUTION);
}

TEST_F(PlannerTest, ReportsProgress) {
    const std::vector<Teacher> teachers{make_teacher("T", Day::MONDAY, 8, 0, 10, 0)};
    const std::vector<Child> children{
        make_child("a", Day::MONDAY, 8, 0, 10, 0),
        make_child("b", Day::MONDAY, 8, 0, 10, 0),
    };

    std::atomic<unsigned> best_assigned{0};
    const solve_hooks hooks{
        .cancel = nullptr,
        .on_progress = [&](const search_progress& p) {
            unsigned current = best_assigned.load();
            while (p.assigned > current && !best_assigned.compare_exchange_weak(current, p.assigned)) {}
        },
    };
    const auto plan = planner.solve(children, teachers, {}, default_weights(), std::nullopt, std::nullopt, hooks);
    EXPECT_EQ(plan.assignments.size(), 2u);
    EXPECT_LE(best_assigned.load(), 2u);
}

// picks every session at once, which no correct search may do
class OverbookingSearch : public SearchBackend {
    public:
        search_result find_best(const FeasibleSpace& space, const Objective&, const search_limits&, const std::vector<size_t>&) const override {
            search_result result{.chosen = {}, .state = search_state::OPTIMAL, .wall_time = {}};
            for (size_t index{}; index < space.get_sessions().size(); ++index)
                result.chosen.push_back(index);
            return result;
        }
};

TEST(ResultAssembler, BrokenSearchIsAFault) {
    const Planner broken(test_config(), std::make_shared<OverbookingSearch>());
    const std::vector<Teacher> teachers{make_teacher("T", Day::MONDAY, 8, 0, 9, 0)};
    const std::vector<Child> children{
        make_child("a", Day::MONDAY, 8, 0, 9, 0),
        make_child("b", Day::MONDAY, 8, 0, 9, 0),
    };
    EXPECT_THROW(broken.solve(children, teachers, {}, default_weights()), solver_fault);
}

TEST(ResultAssembler, DetectsOverlapAndUnpairedSharing) {
    const std::vector<Teacher> teachers{make_teacher("T", Day::MONDAY, 8, 0, 10, 0)};
    const std::vector<Child> children{
        make_child("a", Day::MONDAY, 8, 0, 10, 0),
        make_child("b", Day::MONDAY, 8, 0, 10, 0),
    };
    const assignment_map overlapping{
        {"a", {"T", TimeSlot(Day::MONDAY, 8, 0)}},
        {"b", {"T", TimeSlot(Day::MONDAY, 8, 30)}},
    };
    EXPECT_THROW(ResultAssembler::verify(overlapping, children, teachers, {}), solver_fault);

    const assignment_map shared{
        {"a", {"T", TimeSlot(Day::MONDAY, 8, 0)}},
        {"b", {"T", TimeSlot(Day::MONDAY, 8, 0)}},
    };
    EXPECT_THROW(ResultAssembler::verify(shared, children, teachers, {}), solver_fault);
    EXPECT_NO_THROW(ResultAssembler::verify(shared, children, teachers, {Tandem("a", "b")}));

    const assignment_map outside{{"a", {"T", TimeSlot(Day::MONDAY, 9, 30)}}};
    EXPECT_THROW(ResultAssembler::verify(outside, children, teachers, {}), solver_fault);
}

// stops after the first session found, as a search cut short by its time limit does
class TimeLimitedSearch : public SearchBackend {
    public:
        search_result find_best(const FeasibleSpace& space, const Objective&, const search_limits&, const std::vector<size_t>&) const override {
            search_result result{.chosen = {}, .state = search_state::FEASIBLE_TIME_LIMITED, .wall_time = {}};
            if (!space.get_sessions().empty())
                result.chosen.push_back(0);
            return result;
        }
};

TEST(ResultAssembler, TimeLimitedSearchKeepsItsAssignments) {
    const Planner limited(test_config(), std::make_shared<TimeLimitedSearch>());
    const std::vector<Teacher> teachers{make_teacher("T", Day::MONDAY, 8, 0, 10, 0)};
    const std::vector<Child> children{
        make_child("a", Day::MONDAY, 8, 0, 10, 0),
        make_child("b", Day::MONDAY, 8, 0, 10, 0),
    };

    const auto plan = limited.solve(children, teachers, {}, default_weights());
    EXPECT_EQ(plan.status, solve_status::FEASIBLE);
    ASSERT_EQ(plan.assignments.size(), 1u);
    EXPECT_EQ(plan.assignments.at("a"), (assignment{"T", TimeSlot(Day::MONDAY, 8, 0)}));
    EXPECT_TRUE(has_violation(plan, violation_kind::UNASSIGNED_CHILD, "b"));
}

TEST(SearchState, Formats) {
    EXPECT_EQ(fmt::format("{}", search_state::OPTIMAL), "optimal");
    EXPECT_EQ(fmt::format("{}", search_state::FEASIBLE_TIME_LIMITED), "feasible (time limited)");
    EXPECT_EQ(fmt::format("{}", search_state::INFEASIBLE), "infeasible");
}
