/**
 * @file test_calendar.cpp
 * @brief Unit tests for the working calendar.
 */

#include "project/calendar.hpp"

#include <gtest/gtest.h>

using namespace mic_scheduler;
using namespace std::chrono;

TEST(CalendarTest, ParseDate) {
    auto date = parse_date("2024-06-03");
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(year_month_day{*date}, 2024y / June / 3d);
    EXPECT_FALSE(parse_date("2024-02-30").has_value());
    EXPECT_FALSE(parse_date("03/06/2024").has_value());
}

TEST(CalendarTest, ParseWeekday) {
    EXPECT_EQ(parse_weekday("Sun"), Sunday);
    EXPECT_EQ(parse_weekday("saturday"), Saturday);
    EXPECT_EQ(parse_weekday("WED"), Wednesday);
    EXPECT_FALSE(parse_weekday("Su").has_value());
    EXPECT_FALSE(parse_weekday("Funday").has_value());
}

TEST(CalendarTest, StandardWorkingHours) {
    auto cal = WorkingCalendar::standard();   // epoch is a Monday
    EXPECT_FALSE(cal.is_working_hour(SimTime{7}));
    EXPECT_TRUE(cal.is_working_hour(SimTime{8}));
    EXPECT_FALSE(cal.is_working_hour(SimTime{12}));   // lunch
    EXPECT_TRUE(cal.is_working_hour(SimTime{16}));
    EXPECT_FALSE(cal.is_working_hour(SimTime{17}));
    EXPECT_FALSE(cal.is_working_hour(SimTime{6 * 24 + 9}));   // Sunday
    EXPECT_EQ(cal.working_hours_per_day(), 8);
}

TEST(CalendarTest, NextWorkingHourSkipsNightAndSunday) {
    auto cal = WorkingCalendar::standard();
    EXPECT_EQ(cal.next_working_hour(SimTime{0}), SimTime{8});
    EXPECT_EQ(cal.next_working_hour(SimTime{12}), SimTime{13});
    // Saturday 17:00 -> Monday 08:00
    EXPECT_EQ(cal.next_working_hour(SimTime{5 * 24 + 17}), SimTime{7 * 24 + 8});
}

TEST(CalendarTest, AddWorkHoursSpansBreaks) {
    auto cal = WorkingCalendar::standard();
    EXPECT_EQ(cal.add_work_hours(SimTime{8}, Hours{4}), SimTime{12});
    EXPECT_EQ(cal.add_work_hours(SimTime{8}, Hours{5}), SimTime{14});
    EXPECT_EQ(cal.add_work_hours(SimTime{8}, Hours{9}), SimTime{24 + 9});
    EXPECT_EQ(cal.add_work_hours(SimTime{10}, Hours{0}), SimTime{10});
}

TEST(CalendarTest, WorkingHoursBetween) {
    auto cal = WorkingCalendar::standard();
    EXPECT_EQ(cal.working_hours_between(SimTime{0}, SimTime{24}), Hours{8});
    EXPECT_EQ(cal.working_hours_between(SimTime{0}, SimTime{7 * 24}), Hours{48});
}

TEST(CalendarTest, MonthAndWeekday) {
    auto cal = WorkingCalendar::standard();
    EXPECT_EQ(cal.month_of(SimTime{0}), 6u);
    EXPECT_EQ(cal.month_of(SimTime{28 * 24}), 7u);   // 1 July
    EXPECT_EQ(cal.weekday_of(SimTime{0}), Monday);
}

TEST(CalendarTest, AlwaysOn) {
    auto cal = WorkingCalendar::always_on();
    EXPECT_TRUE(cal.is_working_hour(SimTime{3}));
    EXPECT_EQ(cal.add_work_hours(SimTime{0}, Hours{30}), SimTime{30});
}

TEST(CalendarTest, FromConfig) {
    ProjectConfig project;
    project.start_date = "2024-01-01";
    CalendarConfig calendar{.work_windows = {{9, 17}}, .rest_days = {"Sat", "Sun"}};
    auto cal = WorkingCalendar::from_config(project, calendar);
    ASSERT_TRUE(cal.has_value()) << cal.error().message;
    EXPECT_EQ(cal->working_hours_per_day(), 8);
    EXPECT_EQ(cal->month_of(SimTime{0}), 1u);
}

TEST(CalendarTest, RejectsCalendarWithoutWork) {
    std::vector<weekday> all_days{Sunday, Monday, Tuesday, Wednesday, Thursday, Friday, Saturday};
    auto cal = WorkingCalendar::create(WorkingCalendar::default_epoch(), {{8, 17}}, all_days);
    ASSERT_FALSE(cal.has_value());
    EXPECT_EQ(cal.error().code, ErrorCode::ConfigError);

    ProjectConfig project;
    CalendarConfig bad_day{.work_windows = {{8, 17}}, .rest_days = {"Blursday"}};
    EXPECT_FALSE(WorkingCalendar::from_config(project, bad_day).has_value());
}
