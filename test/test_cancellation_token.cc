#include <gtest/gtest.h>
#include <csignal>
#include <thread>

#include "../src/CancellationToken.hh"
#include "../src/ShutdownSignal.hh"

TEST(CancellationTokenTest, SleepRunsFullDurationWhenNotCancelled)
{
    CancellationToken token;

    auto start = chrono::steady_clock::now();
    EXPECT_TRUE(token.sleepFor(chrono::milliseconds(50)));
    auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start);

    EXPECT_GE(elapsed.count(), 50);
    EXPECT_FALSE(token.isCancelled());
}

TEST(CancellationTokenTest, CancelWakesSleeper)
{
    CancellationToken token;

    thread canceller([&token]()
                     {
        this_thread::sleep_for(chrono::milliseconds(30));
        token.cancel(); });

    auto start = chrono::steady_clock::now();
    bool completed = token.sleepFor(chrono::seconds(10));
    auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start);

    canceller.join();

    EXPECT_FALSE(completed);
    EXPECT_LT(elapsed.count(), 5000);
    EXPECT_TRUE(token.isCancelled());
}

TEST(CancellationTokenTest, SleepAfterCancelReturnsImmediately)
{
    CancellationToken token;
    token.cancel();

    EXPECT_FALSE(token.sleepFor(chrono::seconds(10)));
    EXPECT_FALSE(token.sleepFor(chrono::milliseconds(0)));
}

TEST(CancellationTokenTest, ZeroSleepSucceedsWhenActive)
{
    CancellationToken token;
    EXPECT_TRUE(token.sleepFor(chrono::milliseconds(0)));
}

TEST(ShutdownSignalTest, SigtermCancelsToken)
{
    CancellationToken token;
    ShutdownSignal shutdown(token);

    raise(SIGTERM);

    // The handler runs on the io_context thread
    for (int i = 0; i < 200 && !token.isCancelled(); ++i)
        this_thread::sleep_for(chrono::milliseconds(10));

    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(shutdown.receivedSignal(), SIGTERM);
}

TEST(ShutdownSignalTest, TeardownWithoutSignal)
{
    CancellationToken token;
    {
        ShutdownSignal shutdown(token);
        EXPECT_EQ(shutdown.receivedSignal(), 0);
    }

    EXPECT_FALSE(token.isCancelled());
}
