#include <gtest/gtest.h>
#include <core/time_utils.hpp>
#include <core/errors.hpp>

TEST(TimeUtils, ParseDurationEmpty) {
    EXPECT_EQ(parse_duration_secs(""), 0);
    EXPECT_EQ(parse_duration_secs("   "), 0);
}

TEST(TimeUtils, ParseDurationBadParse) {
    EXPECT_EQ(parse_duration_secs("soon"), 0);
    EXPECT_EQ(parse_duration_secs("10w"), 0);
    EXPECT_EQ(parse_duration_secs("1:2:3:4"), 0);
    EXPECT_EQ(parse_duration_secs("-5s"), 0);
}

TEST(TimeUtils, ParseDurationUnits) {
    EXPECT_EQ(parse_duration_secs("90"), 90);
    EXPECT_EQ(parse_duration_secs("90s"), 90);
    EXPECT_EQ(parse_duration_secs("15m"), 900);
    EXPECT_EQ(parse_duration_secs("24h"), 86400);
    EXPECT_EQ(parse_duration_secs("7d"), 604800);
    EXPECT_EQ(parse_duration_secs("2H"), 7200);
}

TEST(TimeUtils, ParseDurationClock) {
    EXPECT_EQ(parse_duration_secs("01:00:00"), 3600);
    EXPECT_EQ(parse_duration_secs("30:00"), 1800);         // MM:SS
    EXPECT_EQ(parse_duration_secs("1-00:00:00"), 86400);
    EXPECT_EQ(parse_duration_secs("1-02:30"), 95400);      // D-HH:MM
}

TEST(TimeUtils, ParseDurationOverflow) {
    EXPECT_EQ(parse_duration_secs("999999999999999999d"), 0);
    EXPECT_EQ(parse_duration_secs("9223372036854775807m"), 0);
    EXPECT_EQ(parse_duration_secs("99999999999999999999"), 0);
    EXPECT_EQ(parse_duration_secs("999999999999999999:00:00"), 0);
    EXPECT_EQ(parse_duration_secs("999999999999999-00:00:00"), 0);
    EXPECT_EQ(parse_duration_secs("1-999999999999999999:00"), 0);
    // Largest value that still fits is accepted.
    EXPECT_EQ(parse_duration_secs("9223372036854775807"), 9223372036854775807L);
}

TEST(TimeUtils, FormatTimeout) {
    EXPECT_EQ(format_timeout(3600), "3600s");
    EXPECT_EQ(format_timeout(604800), "604800s");
}

TEST(TimeUtils, NormalizeTimeout) {
    EXPECT_EQ(normalize_timeout("7d"), "604800s");
    EXPECT_EQ(normalize_timeout("2h"), "7200s");
    EXPECT_EQ(normalize_timeout("3600s"), "3600s");
}

TEST(TimeUtils, NormalizeTimeoutRejects) {
    EXPECT_THROW(normalize_timeout(""), ConfigurationError);
    EXPECT_THROW(normalize_timeout("0s"), ConfigurationError);
    EXPECT_THROW(normalize_timeout("forever"), ConfigurationError);
    EXPECT_THROW(normalize_timeout("999999999999999999d"), ConfigurationError);
}
