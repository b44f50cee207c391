#include <algorithm>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "eventaggregator.h"


TEST(EventAggregatorTest, ConcurrentAppendsAreAllKept)
{
    EventAggregator aggregator;
    const int num_threads = 4;
    const int per_thread = 500;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++)
    {
        threads.emplace_back([&aggregator, t]
        {
            for (int i = 0; i < per_thread; i++)
            {
                PointerClickEvent e;
                e.x = t;
                e.y = i;
                aggregator.get_pointer_clicks().append(e);
            }
        });
    }
    for (auto& thread : threads)
        thread.join();

    auto clicks = aggregator.get_pointer_clicks().snapshot();
    ASSERT_EQ(static_cast<size_t>(num_threads * per_thread), clicks.size());

    // each thread's records stay in the order it appended them
    std::vector<int> next(num_threads, 0);
    for (auto& c : clicks)
    {
        EXPECT_EQ(next[static_cast<size_t>(c.x)], c.y);
        next[static_cast<size_t>(c.x)]++;
    }
}

TEST(EventAggregatorTest, SnapshotIsPrefixOfLaterSnapshot)
{
    EventBuffer<int> buffer;
    buffer.append(1);
    buffer.append(2);
    auto first = buffer.snapshot();
    buffer.append(3);
    auto second = buffer.snapshot();

    ASSERT_EQ(2u, first.size());
    ASSERT_EQ(3u, second.size());
    EXPECT_TRUE(std::equal(first.begin(), first.end(), second.begin()));
    EXPECT_EQ(3u, buffer.size());
}

TEST(EventAggregatorTest, BrowserUrlOnlyOnChange)
{
    EventAggregator aggregator;
    BrowserUrlEvent a{now_utc(), "chrome", "https://a.example"};
    BrowserUrlEvent b{now_utc(), "chrome", "https://b.example"};

    EXPECT_TRUE(aggregator.append_browser_url_if_changed(a));
    EXPECT_FALSE(aggregator.append_browser_url_if_changed(a));
    EXPECT_TRUE(aggregator.append_browser_url_if_changed(b));
    EXPECT_TRUE(aggregator.append_browser_url_if_changed(a));

    auto urls = aggregator.get_browser_urls().snapshot();
    ASSERT_EQ(3u, urls.size());
    EXPECT_EQ("https://a.example", urls[0].url);
    EXPECT_EQ("https://b.example", urls[1].url);
    EXPECT_EQ("https://a.example", urls[2].url);
}
