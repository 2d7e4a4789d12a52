#include "TaskOrchestrator.hh"
#include "AccountTaskQueue.hh"
#include "GameTaskExecutor.hh"
#include "Logger.hh"
#include "thread_pool.hh"

#include <algorithm>

TaskOrchestrator::TaskOrchestrator(const RunConfig &runConfig, const GameApiRegistry &registry,
                                   VerificationSolver &verificationSolver, CancellationToken &cancelToken)
    : config(runConfig),
      apis(registry),
      solver(verificationSolver),
      token(cancelToken),
      policy(runConfig.maxRetries, runConfig.retryInterval)
{
}

vector<GameTask> TaskOrchestrator::expand(const Account &account, const vector<TaskKind> &enabledKinds)
{
    vector<GameTask> tasks;

    vector<string> games;
    for (const string &game : account.games)
    {
        // Each (game, kind) pair is one task; repeats are dropped
        if (find(games.begin(), games.end(), game) != games.end())
            continue;
        games.push_back(game);

        vector<TaskKind> kinds;
        for (TaskKind kind : account.tasks)
        {
            if (!enabledKinds.empty() && find(enabledKinds.begin(), enabledKinds.end(), kind) == enabledKinds.end())
                continue;

            if (find(kinds.begin(), kinds.end(), kind) != kinds.end())
                continue;
            kinds.push_back(kind);

            tasks.emplace_back(account, game, kind);
        }
    }

    return tasks;
}

Report TaskOrchestrator::run()
{
    return run(config.accounts, config.enabledTasks);
}

Report TaskOrchestrator::run(const vector<Account> &accounts, const vector<TaskKind> &enabledKinds)
{
    vector<vector<GameTask>> perAccount;
    vector<string> order;
    int total = 0;

    for (const Account &account : accounts)
    {
        perAccount.push_back(expand(account, enabledKinds));
        order.push_back(account.id);
        total += static_cast<int>(perAccount.back().size());
    }

    ResultAggregator aggregator(total);
    aggregator.setAccountOrder(order);
    aggregator.setLogInterval(max(1, total / 10));

    Logger::dualSafeLog("Running " + to_string(total) + " tasks for " + to_string(accounts.size()) + " accounts");

    if (total > 0)
    {
        size_t workers = min(static_cast<size_t>(max(1, config.maxConcurrentAccounts)), accounts.size());
        ThreadPool pool(workers);

        for (size_t i = 0; i < accounts.size(); ++i)
        {
            if (perAccount[i].empty())
                continue;

            pool.enqueue([this, &account = accounts[i], tasks = std::move(perAccount[i]), &aggregator]() mutable
                         { runAccount(account, std::move(tasks), aggregator); });
        }

        pool.waitAll();
    }

    Report report = aggregator.finalize(token.isCancelled());

    if (report.cancelled)
        Logger::dualSafeLog("Run cancelled, " + to_string(report.summary.total) + " results kept");

    return report;
}

void TaskOrchestrator::runAccount(const Account &account, vector<GameTask> tasks, ResultAggregator &aggregator)
{
    Logger::log(LogLevel::Debug, account.displayName(), "account started", 0, 0);

    // Executor and queue are per pipeline; only the aggregator is shared
    GameTaskExecutor executor(apis, policy, solver, token);
    AccountTaskQueue queue(executor, config.sleepTime, token);

    try
    {
        queue.run(tasks, [&aggregator](const TaskResult &result)
                  { aggregator.record(result); });
    }
    catch (const exception &e)
    {
        Logger::log(LogLevel::Error, account.displayName(), string("pipeline aborted: ") + e.what(), 0, 0);

        // Nothing may go missing from the report
        for (const GameTask &task : tasks)
        {
            if (aggregator.contains(task.id))
                continue;

            TaskResult lost = TaskResult::forTask(task);
            lost.outcome = TaskOutcome::Failed;
            lost.error = ErrorKind::UnknownAPIError;
            lost.detail = string("account pipeline aborted: ") + e.what();
            lost.attempts = task.attempts;
            lost.endTime = system_clock::now();
            aggregator.record(lost);
        }
    }

    Logger::log(LogLevel::Debug, account.displayName(), "account finished", 0, 0);
}
