#include "GameTaskExecutor.hh"
#include "Logger.hh"

namespace
{
    struct Failure
    {
        ErrorKind kind;
        string detail;
        optional<VerificationChallenge> challenge;
    };

    long long elapsedSince(chrono::steady_clock::time_point start)
    {
        return chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start).count();
    }
}

GameTaskExecutor::GameTaskExecutor(const GameApiRegistry &registry, const RetryPolicy &retryPolicy,
                                   VerificationSolver &verificationSolver, CancellationToken &cancelToken)
    : apis(registry), policy(retryPolicy), solver(verificationSolver), token(cancelToken)
{
}

TaskResult GameTaskExecutor::execute(GameTask &task)
{
    auto overallStart = chrono::steady_clock::now();
    TaskResult result = TaskResult::forTask(task);

    GameApi *api = apis.find(task.game);
    if (!api)
        return finish(TaskResult::skipped(task, ErrorKind::None, "no API registered for " + task.game), task, overallStart);

    task.state = TaskState::Running;
    int verificationsUsed = 0;

    while (true)
    {
        if (token.isCancelled())
        {
            if (task.attempts == 0)
                return finish(TaskResult::skipped(task, ErrorKind::Cancelled, "run cancelled before start"), task, overallStart);

            result.outcome = TaskOutcome::Failed;
            result.error = ErrorKind::Cancelled;
            result.detail = "run cancelled after " + to_string(task.attempts) + " attempt(s)";
            return finish(result, task, overallStart);
        }

        Failure failure{ErrorKind::None, "", nullopt};
        auto attemptStart = chrono::steady_clock::now();

        try
        {
            ApiOutcome outcome = call(*api, task, nullptr);
            result.outcome = outcome == ApiOutcome::AlreadyDone ? TaskOutcome::AlreadyDone : TaskOutcome::Success;
            logAttempt(task, outcomeToString(result.outcome), elapsedSince(attemptStart), LogLevel::Info);
            return finish(result, task, overallStart);
        }
        catch (const GameApiError &e)
        {
            failure = {e.kind(), e.what(), e.challenge()};
        }
        catch (const exception &e)
        {
            failure = {ErrorKind::UnknownAPIError, e.what(), nullopt};
        }

        logAttempt(task, errorKindToString(failure.kind) + ": " + failure.detail, elapsedSince(attemptStart), LogLevel::Warn);

        RetryDecision decision = policy.decide(failure.kind, task.attempts - 1, verificationsUsed);

        if (decision.action == RetryAction::Stop)
        {
            result.outcome = TaskOutcome::Failed;
            result.error = failure.kind;
            result.detail = failure.detail;
            return finish(result, task, overallStart);
        }

        if (decision.action == RetryAction::Verify)
        {
            ++verificationsUsed;

            VerificationChallenge challenge = failure.challenge.value_or(VerificationChallenge{});
            challenge.taskId = task.id;

            SolvedToken solved;
            try
            {
                solved = solver.solve(challenge);
            }
            catch (const VerificationError &e)
            {
                result.outcome = TaskOutcome::Failed;
                result.error = e.kind();
                result.detail = e.what();
                return finish(result, task, overallStart);
            }
            catch (const exception &e)
            {
                // Anything else from the solver means no usable backend
                result.outcome = TaskOutcome::Failed;
                result.error = ErrorKind::VerificationUnavailable;
                result.detail = string("verification backend error: ") + e.what();
                return finish(result, task, overallStart);
            }

            // Exactly one retried call with the token attached; any failure is terminal
            attemptStart = chrono::steady_clock::now();
            try
            {
                ApiOutcome outcome = call(*api, task, &solved);
                result.outcome = outcome == ApiOutcome::AlreadyDone ? TaskOutcome::AlreadyDone : TaskOutcome::Success;
                logAttempt(task, outcomeToString(result.outcome) + " after verification", elapsedSince(attemptStart), LogLevel::Info);
            }
            catch (const GameApiError &e)
            {
                result.outcome = TaskOutcome::Failed;
                result.error = e.kind();
                result.detail = string("after verification: ") + e.what();
            }
            catch (const exception &e)
            {
                result.outcome = TaskOutcome::Failed;
                result.error = ErrorKind::UnknownAPIError;
                result.detail = string("after verification: ") + e.what();
            }

            if (result.outcome == TaskOutcome::Failed)
                logAttempt(task, errorKindToString(result.error) + ": " + result.detail, elapsedSince(attemptStart), LogLevel::Error);

            return finish(result, task, overallStart);
        }

        // RetryAction::Retry
        if (!token.sleepFor(decision.delay))
        {
            result.outcome = TaskOutcome::Failed;
            result.error = ErrorKind::Cancelled;
            result.detail = "run cancelled while waiting to retry (last error " + errorKindToString(failure.kind) + ": " + failure.detail + ")";
            return finish(result, task, overallStart);
        }
    }
}

ApiOutcome GameTaskExecutor::call(GameApi &api, GameTask &task, const SolvedToken *solved)
{
    ++task.attempts;

    if (task.kind == TaskKind::SignIn)
        return api.performSignIn(*task.account, task.game, solved);

    return api.performMission(*task.account, task.game, task.kind, solved);
}

void GameTaskExecutor::logAttempt(const GameTask &task, const string &status, long long elapsedMs, LogLevel level)
{
    Logger::log(level, task.id, status, static_cast<int>(elapsedMs), task.attempts);
}

TaskResult GameTaskExecutor::finish(TaskResult result, GameTask &task, chrono::steady_clock::time_point start)
{
    task.state = TaskState::Done;

    result.attempts = task.attempts;
    result.durationMs = elapsedSince(start);
    result.endTime = system_clock::now();

    if (result.outcome == TaskOutcome::Failed)
        Logger::log(LogLevel::Error, task.id, "failed: " + errorKindToString(result.error), static_cast<int>(result.durationMs), task.attempts);

    return result;
}
