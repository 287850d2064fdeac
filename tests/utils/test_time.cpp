#include <gtest/gtest.h>

#include <chrono>

#include "clipvault/utils/time.hpp"

using namespace clipvault::utils;
using namespace std::chrono_literals;

TEST(TimeTest, EpochSecondsRoundTripWithinAMicrosecond) {
    const Timestamp now = Clock::now();
    const Timestamp back = fromEpochSeconds(toEpochSeconds(now));
    EXPECT_LT(std::chrono::abs(back - now), 1us);
}

TEST(TimeTest, ParsesUtcTimestamp) {
    auto parsed = parseIso8601("2024-01-15T10:30:00Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_DOUBLE_EQ(toEpochSeconds(*parsed), 1705314600.0);
}

TEST(TimeTest, ParsesFractionAndOffset) {
    auto utc = parseIso8601("2024-01-15T10:30:00.250Z");
    auto offset = parseIso8601("2024-01-15T12:30:00.250+02:00");
    ASSERT_TRUE(utc.has_value());
    ASSERT_TRUE(offset.has_value());
    EXPECT_NEAR(toEpochSeconds(*utc), 1705314600.25, 1e-6);
    EXPECT_NEAR(toEpochSeconds(*offset), toEpochSeconds(*utc), 1e-6);
}

TEST(TimeTest, RejectsMalformedTimestamps) {
    EXPECT_FALSE(parseIso8601("").has_value());
    EXPECT_FALSE(parseIso8601("2024-01-15").has_value());
    EXPECT_FALSE(parseIso8601("2024-13-15T10:30:00Z").has_value());
    EXPECT_FALSE(parseIso8601("2024-01-15T10:30:00").has_value());
    EXPECT_FALSE(parseIso8601("2024-01-15T10:30:00Zjunk").has_value());
}

TEST(TimeTest, FormatTimestampIsShortDateTime) {
    const std::string text = formatTimestamp(Clock::now());
    ASSERT_EQ(text.size(), 16U);
    EXPECT_EQ(text[4], '-');
    EXPECT_EQ(text[10], ' ');
    EXPECT_EQ(text[13], ':');
}
