#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>

#include "../src/thread_pool.hh"

TEST(ThreadPoolTest, RunsEveryJob)
{
    ThreadPool pool(4);
    atomic<int> counter{0};

    for (int i = 0; i < 50; ++i)
        pool.enqueue([&counter]()
                     { counter++; });

    pool.waitAll();
    EXPECT_EQ(counter.load(), 50);
}

TEST(ThreadPoolTest, NeverExceedsWorkerCount)
{
    ThreadPool pool(2);
    atomic<int> running{0};
    atomic<int> peak{0};

    for (int i = 0; i < 8; ++i)
    {
        pool.enqueue([&]()
                     {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now))
            {
            }
            this_thread::sleep_for(chrono::milliseconds(20));
            --running; });
    }

    pool.waitAll();
    EXPECT_LE(peak.load(), 2);
    EXPECT_EQ(pool.size(), 2u);
}

TEST(ThreadPoolTest, ThrowingJobDoesNotKillWorker)
{
    ThreadPool pool(1);
    atomic<bool> ranAfter{false};

    pool.enqueue([]()
                 { throw runtime_error("boom"); });
    pool.enqueue([&ranAfter]()
                 { ranAfter = true; });

    pool.waitAll();
    EXPECT_TRUE(ranAfter.load());
}

TEST(ThreadPoolTest, ZeroThreadsCoercedToOne)
{
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
}
