#pragma once

#include "CancellationToken.hh"
#include "GameApi.hh"
#include "GameTask.hh"
#include "Logger.hh"
#include "RetryPolicy.hh"
#include "TaskResult.hh"
#include "VerificationClient.hh"

/*
Drives one GameTask to its TaskResult.

Every GameApiError / VerificationError is absorbed and classified here; nothing thrown by a
collaborator escapes execute(). Retries follow RetryPolicy, the verification flow allows one
solve and one retried call per task.
*/
class GameTaskExecutor
{
public:
    GameTaskExecutor(const GameApiRegistry &apis, const RetryPolicy &policy,
                     VerificationSolver &solver, CancellationToken &token);

    TaskResult execute(GameTask &task);

private:
    const GameApiRegistry &apis;
    const RetryPolicy &policy;
    VerificationSolver &solver;
    CancellationToken &token;

    // One API call; attempts is incremented before the call
    ApiOutcome call(GameApi &api, GameTask &task, const SolvedToken *solved);

    void logAttempt(const GameTask &task, const string &status, long long elapsedMs, LogLevel level);

    TaskResult finish(TaskResult result, GameTask &task, chrono::steady_clock::time_point start);
};
