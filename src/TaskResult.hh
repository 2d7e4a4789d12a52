#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "Account.hh"
#include "ErrorKind.hh"
#include "GameTask.hh"

using namespace std;
using namespace chrono;
using json = nlohmann::json;

enum class TaskOutcome
{
    Success,
    AlreadyDone,
    Failed,
    Skipped
};

string outcomeToString(TaskOutcome outcome);

// Terminal result of one GameTask; immutable once produced
struct TaskResult
{
    string taskId;
    string accountId;
    string game;
    TaskKind kind = TaskKind::SignIn;

    TaskOutcome outcome = TaskOutcome::Failed;
    ErrorKind error = ErrorKind::None; // set when Failed or Skipped
    int attempts = 0;
    long long durationMs = 0;
    string detail;

    system_clock::time_point startTime;
    system_clock::time_point endTime;

    bool succeeded() const
    {
        return outcome == TaskOutcome::Success || outcome == TaskOutcome::AlreadyDone;
    }

    json toJSON() const;

    // Result for a task that never got to run
    static TaskResult skipped(const GameTask &task, ErrorKind reason, const string &detail);

    // Result stamped with the task identity, outcome to be filled by the caller
    static TaskResult forTask(const GameTask &task);
};
