#include <atomic>
#include <chrono>
#include <thread>

#include <unistd.h>

#include <gtest/gtest.h>

#include "controlinput.h"
#include "testing/testcontext.h"

using namespace std::chrono;


class ControlInputTest : public ::testing::Test
{
    protected:
        void SetUp() override
        {
            ASSERT_EQ(0, pipe(m_fds));
        }

        void TearDown() override
        {
            close(m_fds[0]);
            if (m_fds[1] >= 0)
                close(m_fds[1]);
        }

        void send(const std::string& s)
        {
            ASSERT_EQ(static_cast<ssize_t>(s.size()), write(m_fds[1], s.data(), s.size()));
        }

        bool wait_for_lines(int n)
        {
            auto deadline = steady_clock::now() + seconds(10);
            while (m_lines < n && steady_clock::now() < deadline)
                std::this_thread::sleep_for(milliseconds(1));
            return m_lines >= n;
        }

    protected:
        TestContext m_context{LogLevel::NONE};
        int m_fds[2]{-1, -1};
        std::atomic<int> m_lines{0};
};

TEST_F(ControlInputTest, OneCallPerLine)
{
    ControlInput input(m_context, m_fds[0], [this]{m_lines++;});
    input.start();
    EXPECT_TRUE(input.is_running());

    send("\n");
    ASSERT_TRUE(wait_for_lines(1));
    send("p\n\n");
    ASSERT_TRUE(wait_for_lines(3));
    send("no newline yet");

    input.stop();
    EXPECT_FALSE(input.is_running());
    EXPECT_EQ(3, m_lines);
}

TEST_F(ControlInputTest, EndOfInputEndsThread)
{
    ControlInput input(m_context, m_fds[0], [this]{m_lines++;});
    input.start();

    send("\n");
    close(m_fds[1]);
    m_fds[1] = -1;
    ASSERT_TRUE(wait_for_lines(1));

    input.stop();
    EXPECT_EQ(1, m_lines);
}

TEST_F(ControlInputTest, FailingCallbackKeepsReading)
{
    ControlInput input(m_context, m_fds[0], [this]
    {
        m_lines++;
        throw std::runtime_error("toggle failed");
    });
    input.start();

    send("\n\n");
    ASSERT_TRUE(wait_for_lines(2));
    input.stop();
}
