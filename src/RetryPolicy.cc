#include "RetryPolicy.hh"

RetryPolicy::RetryPolicy(int maxRetries, chrono::milliseconds cooldown)
    : maxRetries_(maxRetries < 0 ? 0 : maxRetries), cooldown_(cooldown)
{
}

RetryDecision RetryPolicy::decide(ErrorKind kind, int attemptNumber, int verificationsUsed) const
{
    RetryDecision decision;

    switch (kind)
    {
    case ErrorKind::VerificationRequired:
        // One successful solve per task; a second challenge is terminal
        if (verificationsUsed == 0)
            decision.action = RetryAction::Verify;
        break;

    case ErrorKind::RateLimited:
    case ErrorKind::NetworkError:
        if (attemptNumber < maxRetries_)
        {
            decision.action = RetryAction::Retry;
            decision.delay = cooldown_;
        }
        break;

    default:
        break;
    }

    return decision;
}
