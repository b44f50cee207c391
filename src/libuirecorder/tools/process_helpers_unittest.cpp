#include <unistd.h>

#include <gtest/gtest.h>

#include "../exception.h"
#include "process_helpers.h"


TEST(ProcessHelpersTest, NamesOwnProcess)
{
    EXPECT_EQ("uirecorder_unittests", Process::get_process_name(getpid()));
}

TEST(ProcessHelpersTest, CmdlineOfOwnProcess)
{
    auto cmdline = Process::get_cmdline(getpid());
    ASSERT_FALSE(cmdline.empty());
    EXPECT_NE(std::string::npos, cmdline[0].find("uirecorder_unittests"));
}

TEST(ProcessHelpersTest, ThrowsForInvalidPid)
{
    EXPECT_THROW(Process::get_process_name(0), ProcessException);
    EXPECT_THROW(Process::get_process_name(-1), ProcessException);
    EXPECT_THROW(Process::get_process_name(999999999), ProcessException);
}
