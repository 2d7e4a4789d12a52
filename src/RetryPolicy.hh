#pragma once

#include <chrono>

#include "ErrorKind.hh"

using namespace std;

enum class RetryAction
{
    Retry,  // call again after `delay`
    Verify, // solve the attached challenge, then call once more
    Stop    // terminal
};

struct RetryDecision
{
    RetryAction action = RetryAction::Stop;
    chrono::milliseconds delay{0};

    bool retry() const { return action != RetryAction::Stop; }
};

/*
Pure decision function for the executor's attempt loop.

- VerificationRequired: delegated to the verification flow, once per task.
- RateLimited / NetworkError: fixed cooldown, while attemptNumber < maxRetries,
  so maxRetries = k gives k + 1 attempts in total.
- Everything else is terminal.
*/
class RetryPolicy
{
public:
    RetryPolicy(int maxRetries, chrono::milliseconds cooldown);

    // attemptNumber: zero-based index of the attempt that just failed
    // verificationsUsed: solve attempts already spent by this task
    RetryDecision decide(ErrorKind kind, int attemptNumber, int verificationsUsed = 0) const;

    int maxRetries() const { return maxRetries_; }
    chrono::milliseconds cooldown() const { return cooldown_; }

private:
    int maxRetries_;
    chrono::milliseconds cooldown_;
};
