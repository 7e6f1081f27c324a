#include "civil_time.h"
#include <gtest/gtest.h>

using namespace nprpark;

TEST(CivilTimeTest, WeekdaysFollowTheCalendar) {
    EXPECT_EQ(weekdayOf(makeCivilTime(1970, 1, 1)), Weekday::THURSDAY);
    EXPECT_EQ(weekdayOf(makeCivilTime(1969, 12, 31, 23, 59)), Weekday::WEDNESDAY);
    EXPECT_EQ(weekdayOf(makeCivilTime(2024, 1, 15, 10, 0)), Weekday::MONDAY);
    EXPECT_EQ(weekdayOf(makeCivilTime(2024, 1, 14, 23, 59)), Weekday::SUNDAY);
    EXPECT_EQ(previousWeekday(Weekday::MONDAY), Weekday::SUNDAY);
}

TEST(CivilTimeTest, DayArithmeticHandlesLeapDays) {
    int year;
    unsigned month, day;
    civilFromDays(daysFromCivil(2024, 2, 29), year, month, day);
    EXPECT_EQ(year, 2024);
    EXPECT_EQ(month, 2u);
    EXPECT_EQ(day, 29u);
    EXPECT_EQ(daysFromCivil(2024, 3, 1) - daysFromCivil(2024, 2, 28), 2);
    EXPECT_EQ(daysFromCivil(2023, 3, 1) - daysFromCivil(2023, 2, 28), 1);
}

TEST(CivilTimeTest, DayBoundariesOfATimestamp) {
    CivilTime t = makeCivilTime(2024, 1, 15, 13, 45);
    EXPECT_EQ(startOfDay(t), makeCivilTime(2024, 1, 15));
    EXPECT_EQ(minuteOfDay(t), 13 * 60 + 45);
    EXPECT_EQ(dayIndex(t) + 1, dayIndex(makeCivilTime(2024, 1, 16)));
}

TEST(CivilTimeTest, ParsesAcceptedTimestampFormats) {
    const CivilTime expected = makeCivilTime(2024, 1, 15, 9, 30);
    const char* inputs[] = {
        "2024-01-15T09:30:00",
        "2024-01-15T09:30:45.123",
        "2024-01-15 09:30:00",
        "2024-01-15 09:30",
        "2024-01-15T09:30"
    };
    for (const char* input : inputs) {
        ParsedTimestamp parsed;
        EXPECT_TRUE(parseTimestamp(input, parsed)) << input;
        EXPECT_EQ(parsed.wall, expected) << input;
        EXPECT_FALSE(parsed.has_offset) << input;
    }
}

TEST(CivilTimeTest, RejectsMalformedTimestamps) {
    const char* inputs[] = {
        "2024-01-15",
        "2024-02-30T10:00:00",
        "2024-01-15T25:00:00",
        "15-01-2024 10:00",
        "2024-01-15T10:00:00 trailing",
        "2024-01-15T10:00:00+1",
        "1899-12-31T23:00:00"
    };
    for (const char* input : inputs) {
        ParsedTimestamp parsed;
        EXPECT_FALSE(parseTimestamp(input, parsed)) << input;
    }
}

TEST(CivilTimeTest, OffsetIsKeptBesideTheWallTime) {
    ParsedTimestamp parsed;
    ASSERT_TRUE(parseTimestamp("2024-01-15T09:30:00+01:00", parsed));
    EXPECT_EQ(parsed.wall, makeCivilTime(2024, 1, 15, 9, 30));
    EXPECT_TRUE(parsed.has_offset);
    EXPECT_EQ(parsed.offset_minutes, 60);

    ASSERT_TRUE(parseTimestamp("2024-01-15T09:30:00Z", parsed));
    EXPECT_TRUE(parsed.has_offset);
    EXPECT_EQ(parsed.offset_minutes, 0);

    ASSERT_TRUE(parseTimestamp("2024-01-15T00:30:00-0230", parsed));
    EXPECT_EQ(parsed.offset_minutes, -150);
}

TEST(CivilTimeTest, ParsesDatesInIsoAndNprFormat) {
    CivilTime iso = 0, npr = 0;
    ASSERT_TRUE(parseDate("2024-07-01", iso));
    ASSERT_TRUE(parseDate("20240701", npr));
    EXPECT_EQ(iso, npr);
    EXPECT_EQ(iso, makeCivilTime(2024, 7, 1));
    EXPECT_FALSE(parseDate("2024-13-01", iso));
    EXPECT_FALSE(parseDate("2024071", iso));
}

TEST(CivilTimeTest, TimeOfDayAllowsEndOfDayOnlyWhenAsked) {
    int minutes = -1;
    EXPECT_TRUE(parseTimeOfDay("09:15", minutes));
    EXPECT_EQ(minutes, 555);
    EXPECT_TRUE(parseTimeOfDay("9:15", minutes));
    EXPECT_EQ(minutes, 555);
    EXPECT_FALSE(parseTimeOfDay("24:00", minutes));
    EXPECT_TRUE(parseTimeOfDay("24:00", minutes, true));
    EXPECT_EQ(minutes, MINUTES_PER_DAY);
    EXPECT_FALSE(parseTimeOfDay("12:60", minutes));
}

TEST(CivilTimeTest, WeekdayNamesInSeveralSpellings) {
    Weekday day;
    ASSERT_TRUE(parseWeekday("Mon", day));
    EXPECT_EQ(day, Weekday::MONDAY);
    ASSERT_TRUE(parseWeekday("friday", day));
    EXPECT_EQ(day, Weekday::FRIDAY);
    ASSERT_TRUE(parseWeekday("zo", day));
    EXPECT_EQ(day, Weekday::SUNDAY);
    EXPECT_FALSE(parseWeekday("someday", day));
}

TEST(CivilTimeTest, Formatting) {
    CivilTime t = makeCivilTime(2024, 1, 5, 7, 3);
    EXPECT_EQ(formatTimestamp(t), "2024-01-05T07:03:00");
    EXPECT_EQ(formatDate(t), "2024-01-05");
    EXPECT_EQ(formatTimeOfDay(MINUTES_PER_DAY), "24:00");
    EXPECT_EQ(formatDuration(45), "45 minutes");
    EXPECT_EQ(formatDuration(60), "1 hour");
    EXPECT_EQ(formatDuration(150), "2 hours 30 minutes");
    EXPECT_EQ(formatDuration(61), "1 hour 1 minute");
}
