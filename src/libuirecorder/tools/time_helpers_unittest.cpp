#include <chrono>

#include <gtest/gtest.h>

#include "time_helpers.h"

using namespace std::chrono;


TEST(TimeHelpersTest, FormatsUtcWithMicroseconds)
{
    auto tp = system_clock::from_time_t(1714558272) + microseconds(123456);
    EXPECT_EQ("2024-05-01T10:11:12.123456Z", format_utc_iso8601(tp));

    auto whole = system_clock::from_time_t(1714558272);
    EXPECT_EQ("2024-05-01T10:11:12.000000Z", format_utc_iso8601(whole));
}

TEST(TimeHelpersTest, ParsesWhatItFormats)
{
    auto tp = time_point_cast<microseconds>(system_clock::now());
    system_clock::time_point parsed;
    ASSERT_TRUE(parse_utc_iso8601(format_utc_iso8601(tp), parsed));
    EXPECT_EQ(tp, parsed);
}

TEST(TimeHelpersTest, AcceptsVaryingFractionalDigits)
{
    auto base = system_clock::from_time_t(1714558272);
    system_clock::time_point tp;

    ASSERT_TRUE(parse_utc_iso8601("2024-05-01T10:11:12Z", tp));
    EXPECT_EQ(base, tp);

    ASSERT_TRUE(parse_utc_iso8601("2024-05-01T10:11:12.5Z", tp));
    EXPECT_EQ(base + milliseconds(500), tp);

    // .NET writes 7 digits, sub-microsecond digits are dropped
    ASSERT_TRUE(parse_utc_iso8601("2024-05-01T10:11:12.1234567Z", tp));
    EXPECT_EQ(base + microseconds(123456), tp);

    ASSERT_TRUE(parse_utc_iso8601("2024-05-01T10:11:12.123456789", tp));
    EXPECT_EQ(base + microseconds(123456), tp);
}

TEST(TimeHelpersTest, RejectsGarbage)
{
    system_clock::time_point tp;
    EXPECT_FALSE(parse_utc_iso8601("", tp));
    EXPECT_FALSE(parse_utc_iso8601("yesterday", tp));
    EXPECT_FALSE(parse_utc_iso8601("2024-13-01T10:11:12Z", tp));
    EXPECT_FALSE(parse_utc_iso8601("2024-05-01T10:11:12.Z", tp));
    EXPECT_FALSE(parse_utc_iso8601("2024-05-01T10:11:12.1234567890Z", tp));
    EXPECT_FALSE(parse_utc_iso8601("2024-05-01T10:11:12Z trailing", tp));
}
