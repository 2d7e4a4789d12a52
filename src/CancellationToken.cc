#include "CancellationToken.hh"

void CancellationToken::cancel()
{
    {
        lock_guard<mutex> lock(mtx);
        cancelled = true;
    }

    cv.notify_all();
}

bool CancellationToken::sleepFor(chrono::milliseconds duration)
{
    if (duration.count() <= 0)
        return !cancelled.load();

    unique_lock<mutex> lock(mtx);

    // Wakes early only when cancelled
    bool woken = cv.wait_for(lock, duration, [this]
                             { return cancelled.load(); });

    return !woken;
}
