#pragma once

#include <chrono>
#include <functional>
#include <vector>

#include "CancellationToken.hh"
#include "GameTaskExecutor.hh"

using namespace std;

/*
Runs one account's tasks strictly in enumeration order, with a cooldown between consecutive
tasks. A failed task never stops the ones after it.
*/
class AccountTaskQueue
{
public:
    // Called with every result as soon as it is produced
    using ResultSink = function<void(const TaskResult &)>;

    AccountTaskQueue(GameTaskExecutor &executor, chrono::milliseconds cooldown, CancellationToken &token);

    vector<TaskResult> run(vector<GameTask> &tasks, const ResultSink &sink = nullptr);

private:
    GameTaskExecutor &executor;
    chrono::milliseconds cooldown;
    CancellationToken &token;
};
