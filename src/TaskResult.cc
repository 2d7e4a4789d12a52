#include "TaskResult.hh"

string outcomeToString(TaskOutcome outcome)
{
    switch (outcome)
    {
    case TaskOutcome::Success:
        return "success";

    case TaskOutcome::AlreadyDone:
        return "already-done";

    case TaskOutcome::Failed:
        return "failed";

    case TaskOutcome::Skipped:
        return "skipped";
    }

    return "failed";
}

json TaskResult::toJSON() const
{
    json j;
    j["taskId"] = taskId;
    j["account"] = accountId;
    j["game"] = game;
    j["kind"] = taskKindToString(kind);
    j["outcome"] = outcomeToString(outcome);
    j["attempts"] = attempts;
    j["durationMs"] = durationMs;

    if (error != ErrorKind::None)
        j["error"] = errorKindToString(error);

    if (!detail.empty())
        j["detail"] = detail;

    j["timestamp"] = system_clock::to_time_t(endTime);

    return j;
}

TaskResult TaskResult::forTask(const GameTask &task)
{
    TaskResult result;
    result.taskId = task.id;
    result.accountId = task.account ? task.account->id : "";
    result.game = task.game;
    result.kind = task.kind;
    result.startTime = system_clock::now();
    result.endTime = result.startTime;

    return result;
}

TaskResult TaskResult::skipped(const GameTask &task, ErrorKind reason, const string &detail)
{
    TaskResult result = forTask(task);
    result.outcome = TaskOutcome::Skipped;
    result.error = reason;
    result.attempts = task.attempts;
    result.detail = detail;

    return result;
}
