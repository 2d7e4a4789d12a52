#include "AccountTaskQueue.hh"

AccountTaskQueue::AccountTaskQueue(GameTaskExecutor &taskExecutor, chrono::milliseconds sleepTime, CancellationToken &cancelToken)
    : executor(taskExecutor), cooldown(sleepTime), token(cancelToken)
{
}

vector<TaskResult> AccountTaskQueue::run(vector<GameTask> &tasks, const ResultSink &sink)
{
    vector<TaskResult> results;
    results.reserve(tasks.size());

    bool cancelled = false;

    for (size_t i = 0; i < tasks.size(); ++i)
    {
        // No cooldown before the first task
        if (i > 0 && !cancelled && !token.sleepFor(cooldown))
            cancelled = true;

        TaskResult result;
        if (cancelled || token.isCancelled())
        {
            result = TaskResult::skipped(tasks[i], ErrorKind::Cancelled, "run cancelled before start");
            tasks[i].state = TaskState::Done;
        }
        else
        {
            result = executor.execute(tasks[i]);
        }

        if (result.error == ErrorKind::Cancelled)
            cancelled = true;

        if (sink)
            sink(result);

        results.push_back(std::move(result));
    }

    return results;
}
