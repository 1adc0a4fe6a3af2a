/**
 * @file test_duration_parser.cpp
 * @brief Unit tests for target duration strings
 */

#include "core/duration_parser.h"

#include <gtest/gtest.h>

using namespace subdub;

TEST(DurationParser, PlainSeconds) {
    ASSERT_TRUE(parseDurationString("93.5").has_value());
    EXPECT_DOUBLE_EQ(*parseDurationString("93.5"), 93.5);
    EXPECT_DOUBLE_EQ(*parseDurationString("2"), 2.0);
}

TEST(DurationParser, MinutesSeconds) {
    EXPECT_DOUBLE_EQ(*parseDurationString("01:30"), 90.0);
    EXPECT_DOUBLE_EQ(*parseDurationString("1:30.25"), 90.25);
}

TEST(DurationParser, HoursMinutesSeconds) {
    EXPECT_DOUBLE_EQ(*parseDurationString("01:02:03.5"), 3723.5);
    EXPECT_DOUBLE_EQ(*parseDurationString("00:00:02"), 2.0);
}

TEST(DurationParser, RejectsMalformed) {
    EXPECT_FALSE(parseDurationString("").has_value());
    EXPECT_FALSE(parseDurationString("abc").has_value());
    EXPECT_FALSE(parseDurationString("-5").has_value());
    EXPECT_FALSE(parseDurationString("1:2:3:4").has_value());
    EXPECT_FALSE(parseDurationString("00:61:00").has_value());
    EXPECT_FALSE(parseDurationString("00:00:75").has_value());
    EXPECT_FALSE(parseDurationString("1.5:00").has_value());
    EXPECT_FALSE(parseDurationString("10:").has_value());
}

TEST(DurationParser, FormatDuration) {
    EXPECT_EQ(formatDuration(3723.5), "01:02:03.500");
    EXPECT_EQ(formatDuration(0.0), "00:00:00.000");
    EXPECT_EQ(formatDuration(-1.0), "00:00:00.000");
}
