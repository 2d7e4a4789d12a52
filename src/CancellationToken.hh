#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

using namespace std;

/*
Cooperative cancellation shared by every account pipeline of a run.
All suspension points (cooldown, retry delay) go through sleepFor so a shutdown wakes them at once.
*/
class CancellationToken
{
public:
    void cancel();

    bool isCancelled() const { return cancelled.load(); }

    // Returns false if the token was cancelled before or during the wait
    bool sleepFor(chrono::milliseconds duration);

private:
    atomic<bool> cancelled{false};
    mutex mtx;
    condition_variable cv;
};
