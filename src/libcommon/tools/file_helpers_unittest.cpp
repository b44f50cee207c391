#include <experimental/filesystem>
namespace fs = std::experimental::filesystem;

#include <gtest/gtest.h>

#include "tools/file_helpers.h"


TEST(FileHelpersTest, ReplaceAndReadBack)
{
    TempDir tmp;
    auto fn = (fs::path(tmp.dir) / "events.json").string();
    std::string error;

    EXPECT_FALSE(is_file(fn));
    ASSERT_TRUE(replace_file_contents(fn, "[1]", error)) << error;
    ASSERT_TRUE(replace_file_contents(fn, "[1, 2]", error)) << error;
    EXPECT_TRUE(is_file(fn));
    EXPECT_FALSE(is_file(fn + ".tmp"));

    std::string contents;
    ASSERT_TRUE(read_file(contents, fn));
    EXPECT_EQ("[1, 2]", contents);

    ASSERT_TRUE(read_file(contents, fn, 2));
    EXPECT_EQ("[1", contents);
}

TEST(FileHelpersTest, ReportsErrors)
{
    TempDir tmp;
    auto fn = (fs::path(tmp.dir) / "missing" / "events.json").string();
    std::string contents;
    std::string error;

    EXPECT_FALSE(read_file(contents, fn, 0, error));
    EXPECT_FALSE(error.empty());

    error.clear();
    EXPECT_FALSE(replace_file_contents(fn, "[]", error));
    EXPECT_FALSE(error.empty());
}

TEST(FileHelpersTest, TempDirIsRemoved)
{
    std::string dir;
    {
        TempDir tmp("uirecorder_test_");
        dir = tmp.dir;
        EXPECT_TRUE(fs::is_directory(dir));
        std::string error;
        ASSERT_TRUE(replace_file_contents((fs::path(dir) / "f").string(), "x", error));
    }
    EXPECT_FALSE(fs::exists(dir));
}
