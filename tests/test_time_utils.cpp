#include <gtest/gtest.h>
#include <stdexcept>
#include "utils/time_utils.hpp"

TEST(TimeUtilsTest, UtcRoundTripThroughCalendarFields) {
    auto time_point = TimeUtils::make_utc_time_point(2024, 3, 4, 20, 59, 7);
    std::tm utc_time = TimeUtils::to_utc_tm(time_point);
    EXPECT_EQ(utc_time.tm_hour, 20);
    EXPECT_EQ(utc_time.tm_min, 59);
    EXPECT_EQ(utc_time.tm_sec, 7);
    EXPECT_EQ(TimeUtils::format_utc_time(time_point), "2024-03-04T20:59:07Z");
}

TEST(TimeUtilsTest, UnixSecondsMatchCalendar) {
    EXPECT_EQ(TimeUtils::from_unix_seconds(0), TimeUtils::make_utc_time_point(1970, 1, 1, 0, 0, 0));
    EXPECT_EQ(TimeUtils::from_unix_seconds(86400), TimeUtils::make_utc_time_point(1970, 1, 2, 0, 0, 0));
}

// Fractional seconds are truncated
TEST(TimeUtilsTest, ParsesIsoTimestampsWithOffsets) {
    auto expected_time = TimeUtils::make_utc_time_point(2024, 3, 4, 14, 30, 0);
    EXPECT_EQ(TimeUtils::parse_iso8601_utc("2024-03-04T14:30:00Z"), expected_time);
    EXPECT_EQ(TimeUtils::parse_iso8601_utc("2024-03-04T09:30:00-05:00"), expected_time);
    EXPECT_EQ(TimeUtils::parse_iso8601_utc("2024-03-04T14:30:00.123456789Z"), expected_time);
}

TEST(TimeUtilsTest, RejectsMalformedIsoText) {
    EXPECT_THROW(TimeUtils::parse_iso8601_utc("yesterday"), std::invalid_argument);
    EXPECT_THROW(TimeUtils::parse_iso8601_utc("2024-03-04 14:30:00"), std::invalid_argument);
}

TEST(TimeUtilsTest, SecondsBetweenIsSigned) {
    auto earlier = TimeUtils::make_utc_time_point(2024, 3, 4, 14, 30, 0);
    auto later = earlier + std::chrono::milliseconds(1500);
    EXPECT_DOUBLE_EQ(TimeUtils::seconds_between(earlier, later), 1.5);
    EXPECT_DOUBLE_EQ(TimeUtils::seconds_between(later, earlier), -1.5);
}
