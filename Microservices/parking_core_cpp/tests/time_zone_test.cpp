#include "time_zone.h"
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include <string>

using namespace nprpark;

namespace {

const char* const AMSTERDAM = "CET+01CEST+01,M3.5.0/02:00,M10.5.0/03:00";
const std::string DATABASE = std::string(NPR_PARKING_TEST_DATA_DIR) + "/timezones.csv";

} // namespace

TEST(TimeZoneTest, DefaultIsUtc) {
    TimeZone utc;
    CivilTime t = makeCivilTime(2024, 7, 1, 12, 0);
    EXPECT_EQ(utc.name(), "UTC");
    EXPECT_EQ(utc.toLocal(t), t);
    EXPECT_EQ(utc.toInstant(t), t);
    EXPECT_EQ(utc.offsetMinutes(t), 0);
    EXPECT_EQ(utc.formatLocal(t), "2024-07-01T12:00:00+00:00");
}

TEST(TimeZoneTest, WinterAndSummerOffsets) {
    TimeZone zone = TimeZone::fromPosix(AMSTERDAM);
    EXPECT_EQ(zone.toLocal(makeCivilTime(2024, 1, 15, 9, 0)), makeCivilTime(2024, 1, 15, 10, 0));
    EXPECT_EQ(zone.toLocal(makeCivilTime(2024, 7, 1, 9, 0)), makeCivilTime(2024, 7, 1, 11, 0));
    EXPECT_EQ(zone.offsetMinutes(makeCivilTime(2024, 7, 1, 9, 0)), 120);
    EXPECT_EQ(zone.formatLocal(makeCivilTime(2024, 1, 15, 9, 0)), "2024-01-15T10:00:00+01:00");
}

TEST(TimeZoneTest, FallBackRepeatsTheHourLocally) {
    TimeZone zone = TimeZone::fromPosix(AMSTERDAM);
    // 2024-10-27: 03:00 CEST -> 02:00 CET (01:00 UTC)
    Instant first = makeCivilTime(2024, 10, 27, 0, 30);
    Instant second = makeCivilTime(2024, 10, 27, 1, 30);
    EXPECT_EQ(zone.toLocal(first), makeCivilTime(2024, 10, 27, 2, 30));
    EXPECT_EQ(zone.toLocal(second), makeCivilTime(2024, 10, 27, 2, 30));
    EXPECT_EQ(zone.formatLocal(first), "2024-10-27T02:30:00+02:00");
    EXPECT_EQ(zone.formatLocal(second), "2024-10-27T02:30:00+01:00");

    // Неоднозначное местное время - первое вхождение
    EXPECT_EQ(zone.toInstant(makeCivilTime(2024, 10, 27, 2, 30)), first);
}

TEST(TimeZoneTest, SpringForwardGapUsesStandardOffset) {
    TimeZone zone = TimeZone::fromPosix(AMSTERDAM);
    // 2024-03-31: 02:00 CET -> 03:00 CEST (01:00 UTC)
    EXPECT_EQ(zone.toInstant(makeCivilTime(2024, 3, 31, 1, 30)), makeCivilTime(2024, 3, 31, 0, 30));
    EXPECT_EQ(zone.toInstant(makeCivilTime(2024, 3, 31, 3, 30)), makeCivilTime(2024, 3, 31, 1, 30));
    EXPECT_EQ(zone.toInstant(makeCivilTime(2024, 3, 31, 2, 30)), makeCivilTime(2024, 3, 31, 1, 30));
}

TEST(TimeZoneTest, NextTransitionIsStrictlyLater) {
    TimeZone zone = TimeZone::fromPosix(AMSTERDAM);
    Instant spring = makeCivilTime(2024, 3, 31, 1, 0);
    Instant autumn = makeCivilTime(2024, 10, 27, 1, 0);
    EXPECT_EQ(zone.nextTransition(makeCivilTime(2024, 1, 15)), spring);
    EXPECT_EQ(zone.nextTransition(spring), autumn);
    EXPECT_EQ(zone.nextTransition(autumn), makeCivilTime(2025, 3, 30, 1, 0));
    EXPECT_EQ(TimeZone().nextTransition(spring), std::numeric_limits<Instant>::max());
}

TEST(TimeZoneTest, ParsesNaiveAndOffsetTimestamps) {
    TimeZone zone = TimeZone::fromPosix(AMSTERDAM);
    Instant t = 0;
    ASSERT_TRUE(zone.parseInstant("2024-10-27T02:30:00+02:00", t));
    EXPECT_EQ(t, makeCivilTime(2024, 10, 27, 0, 30));
    ASSERT_TRUE(zone.parseInstant("2024-10-27T02:30:00+01:00", t));
    EXPECT_EQ(t, makeCivilTime(2024, 10, 27, 1, 30));
    ASSERT_TRUE(zone.parseInstant("2024-01-15T10:00:00", t));
    EXPECT_EQ(t, makeCivilTime(2024, 1, 15, 9, 0));
    ASSERT_TRUE(zone.parseInstant("2024-01-15T10:00:00Z", t));
    EXPECT_EQ(t, makeCivilTime(2024, 1, 15, 10, 0));
    EXPECT_FALSE(zone.parseInstant("2024-01-15", t));
}

TEST(TimeZoneTest, LoadsRegionFromDatabase) {
    TimeZone zone = TimeZone::load("Europe/Amsterdam", DATABASE);
    EXPECT_EQ(zone.name(), "Europe/Amsterdam");
    EXPECT_EQ(zone.formatLocal(makeCivilTime(2024, 7, 1, 9, 0)), "2024-07-01T11:00:00+02:00");
    EXPECT_EQ(zone.nextTransition(makeCivilTime(2024, 1, 15)), makeCivilTime(2024, 3, 31, 1, 0));

    TimeZone curacao = TimeZone::load("America/Curacao", DATABASE);
    EXPECT_EQ(curacao.offsetMinutes(makeCivilTime(2024, 7, 1)), -240);

    EXPECT_EQ(TimeZone::load("UTC", DATABASE).name(), "UTC");
    EXPECT_EQ(TimeZone::load(AMSTERDAM, DATABASE).offsetMinutes(makeCivilTime(2024, 1, 15)), 60);
}

TEST(TimeZoneTest, ReportsUnknownZones) {
    EXPECT_THROW(TimeZone::load("Europe/Atlantis", DATABASE), std::runtime_error);
    EXPECT_THROW(TimeZone::load("Europe/Amsterdam", "/nonexistent/timezones.csv"), std::runtime_error);
    EXPECT_THROW(TimeZone::fromPosix("CET+01CEST+01"), std::runtime_error);
}
