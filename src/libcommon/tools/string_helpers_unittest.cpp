#include <gtest/gtest.h>

#include "tools/string_helpers.h"


TEST(StringHelpersTest, StartsAndEndsWith)
{
    EXPECT_TRUE(startswith("google-chrome", "google-chrome"));
    EXPECT_TRUE(startswith("google-chrome-beta", "google-chrome"));
    EXPECT_FALSE(startswith("chrome", "google-chrome"));
    EXPECT_TRUE(endswith("Example - Google Chrome", " - Google Chrome"));
    EXPECT_FALSE(endswith("Chrome", " - Google Chrome"));
    EXPECT_TRUE(endswith("anything", ""));
}

TEST(StringHelpersTest, ToInt)
{
    int value = 0;
    EXPECT_TRUE(to_int("50", value));
    EXPECT_EQ(50, value);
    EXPECT_TRUE(to_int("-7", value));
    EXPECT_EQ(-7, value);

    value = 3;
    EXPECT_FALSE(to_int("", value));
    EXPECT_FALSE(to_int("12ms", value));
    EXPECT_FALSE(to_int("99999999999999999999", value));
    EXPECT_EQ(3, value);
}

TEST(StringHelpersTest, SplitKeepsEmptyFields)
{
    // /proc/<pid>/cmdline is NUL separated
    auto parts = split(std::string("/usr/bin/gedit\0--new-window\0\0x", 30), '\0');
    ASSERT_EQ(4u, parts.size());
    EXPECT_EQ("/usr/bin/gedit", parts[0]);
    EXPECT_EQ("--new-window", parts[1]);
    EXPECT_EQ("", parts[2]);
    EXPECT_EQ("x", parts[3]);
}

TEST(StringHelpersTest, StripIsUnicodeAware)
{
    EXPECT_EQ("https://example.com", strip("  https://example.com \t"));
    EXPECT_EQ("Grüße", strip(" Grüße "));
}

TEST(StringHelpersTest, LowerIsUnicodeAware)
{
    EXPECT_EQ("google-chrome", lower("Google-Chrome"));
    EXPECT_EQ("äöü", lower("ÄÖÜ"));
}

TEST(StringHelpersTest, SstrStreamsIntoString)
{
    std::string s = sstr() << "pid " << 42 << ' ' << 1.5;
    EXPECT_EQ("pid 42 1.5", s);
}
