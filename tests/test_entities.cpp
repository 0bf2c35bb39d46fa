#include <gtest/gtest.h>
#include "entities.hpp"
#include "test_helpers.hpp"

TEST(Participant, RangeExpandsToRasterPositions) {
    Child child("c", "C");
    free_at(child, Day::MONDAY, 8, 0, 8, 45);
    EXPECT_EQ(child.get_availability().size(), 3u);
    EXPECT_TRUE(child.can_start_session(TimeSlot(Day::MONDAY, 8, 0)));
    EXPECT_FALSE(child.can_start_session(TimeSlot(Day::MONDAY, 8, 15)));
    EXPECT_FALSE(child.is_available(TimeSlot(Day::MONDAY, 8, 45)));
}

TEST(Participant, RangesMustStayWithinOneDay) {
    Teacher teacher("t", "T");
    EXPECT_THROW(teacher.add_availability(TimeSlot(Day::MONDAY, 9, 0), TimeSlot(Day::MONDAY, 8, 0)), validation_error);
    EXPECT_THROW(teacher.add_availability(TimeSlot(Day::MONDAY, 19, 0), TimeSlot(Day::TUESDAY, 8, 0)), validation_error);
}

TEST(Participant, EmptyRangeAddsNothing) {
    Teacher teacher("t", "T");
    teacher.add_availability(TimeSlot(Day::MONDAY, 9, 0), TimeSlot(Day::MONDAY, 9, 0));
    EXPECT_FALSE(teacher.has_availability());
}

TEST(Child, OnlyTheFirstPreferenceCounts) {
    const Child child("c", "C", {"a", "b"});
    EXPECT_TRUE(child.prefers_first("a"));
    EXPECT_FALSE(child.prefers_first("b"));
    EXPECT_EQ(child.get_top_preference(), "a");
    EXPECT_FALSE(Child("d", "D").get_top_preference());
}

TEST(Tandem, IsUnordered) {
    const Tandem tandem("zoe", "adam", "t1", 7);
    EXPECT_EQ(tandem.get_first(), "adam");
    EXPECT_EQ(tandem.get_second(), "zoe");
    EXPECT_EQ(tandem.get_name(), "adam+zoe");
    EXPECT_EQ(tandem.partner_of("zoe"), "adam");
    EXPECT_TRUE(tandem.contains("adam"));
    EXPECT_EQ(tandem.get_priority(), 7u);
    EXPECT_EQ(Tandem("a", "b").get_priority(), default_tandem_priority);
}

TEST(Tandem, PriorityIsRangeChecked) {
    EXPECT_EQ(checked_tandem_priority(max_tandem_priority, "x", "y"), max_tandem_priority);
    EXPECT_THROW(checked_tandem_priority(4294967296LL + min_tandem_priority, "x", "y"), validation_error);
    try {
        checked_tandem_priority(-3, "y", "x");
        FAIL() << "negative priority accepted";
    } catch (validation_error& ex) {
        EXPECT_NE(std::string(ex.what()).find("'x+y' has priority -3"), std::string::npos);
    }
}

TEST(PreviousPlan, FindsAssignments) {
    PreviousPlan previous;
    previous.add("x", "A", TimeSlot(Day::MONDAY, 8, 0));
    ASSERT_NE(previous.find("x"), nullptr);
    EXPECT_EQ(previous.find("x")->teacher_id, "A");
    EXPECT_EQ(previous.find("y"), nullptr);
}
