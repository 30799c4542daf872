#include <plantsched/core/calendar.hpp>
#include <plantsched/core/error.hpp>

#include <gtest/gtest.h>

using namespace plantsched::core;

class CalendarTest : public ::testing::Test {
protected:
    WorkCalendar calendar_{5, 7};
};

TEST_F(CalendarTest, FirstDayIsOne) {
    EXPECT_EQ(WorkCalendar::first_day(), Day{1});
    EXPECT_TRUE(calendar_.is_working_day(WorkCalendar::first_day()));
}

TEST_F(CalendarTest, WorkingDaysOfFirstTwoWeeks) {
    for (uint32_t d : {1U, 2U, 3U, 4U, 5U, 8U, 9U, 10U, 11U, 12U}) {
        EXPECT_TRUE(calendar_.is_working_day(Day{d})) << "day " << d;
    }
    for (uint32_t d : {6U, 7U, 13U, 14U}) {
        EXPECT_FALSE(calendar_.is_working_day(Day{d})) << "day " << d;
    }
}

TEST_F(CalendarTest, DayZeroIsNotWorking) {
    EXPECT_FALSE(calendar_.is_working_day(Day{0}));
}

TEST_F(CalendarTest, NextWorkingDayWithinWeek) {
    EXPECT_EQ(calendar_.next_working_day(Day{1}), Day{2});
    EXPECT_EQ(calendar_.next_working_day(Day{4}), Day{5});
}

TEST_F(CalendarTest, NextWorkingDaySkipsWeekend) {
    EXPECT_EQ(calendar_.next_working_day(Day{5}), Day{8});
    EXPECT_EQ(calendar_.next_working_day(Day{12}), Day{15});
}

TEST_F(CalendarTest, NextWorkingDayFromWeekend) {
    EXPECT_EQ(calendar_.next_working_day(Day{6}), Day{8});
}

TEST(CalendarConfigTest, SixDayWeek) {
    WorkCalendar calendar(6, 7);
    EXPECT_TRUE(calendar.is_working_day(Day{6}));
    EXPECT_EQ(calendar.next_working_day(Day{6}), Day{8});
}

TEST(CalendarConfigTest, EveryDayWorking) {
    WorkCalendar calendar(7, 7);
    EXPECT_EQ(calendar.next_working_day(Day{7}), Day{8});
}

TEST(CalendarConfigTest, RejectsInvalidWeek) {
    EXPECT_THROW(WorkCalendar(0, 7), InvalidConfigurationError);
    EXPECT_THROW(WorkCalendar(8, 7), InvalidConfigurationError);
    EXPECT_THROW(WorkCalendar(1, 0), InvalidConfigurationError);
}
