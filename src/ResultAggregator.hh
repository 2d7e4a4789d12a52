#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "TaskResult.hh"

using namespace std;

// Run-level counters; succeeded includes already-done
struct RunSummary
{
    int total = 0;
    int succeeded = 0;
    int alreadyDone = 0;
    int failed = 0;
    int skipped = 0;
};

// Overall verdict, also selects the notification title
enum class RunStatus
{
    Success = 0,
    Failed = 1,
    PartialFailure = 2,
    VerificationBlocked = 3
};

string runStatusTitle(RunStatus status);

struct Report
{
    // account -> game -> kind -> result
    map<string, map<string, map<TaskKind, TaskResult>>> results;
    // Accounts in configuration order, for printing
    vector<string> accountOrder;
    RunSummary summary;
    long long durationMs = 0;
    bool cancelled = false;

    RunStatus status() const;

    // nullptr if no result was recorded for that key
    const TaskResult *find(const string &account, const string &game, TaskKind kind) const;

    json toJSON() const;

    // Multi-line human summary, the body of push notifications
    string toText() const;
};

/*
Thread-safe accumulation of TaskResults as they stream in from concurrent account pipelines.
Results may arrive in any interleaving; finalize() snapshots them into a Report.
*/
class ResultAggregator
{
public:
    explicit ResultAggregator(int expectedTasks = 0);

    void setAccountOrder(vector<string> accounts);

    // Print a progress line every `count` results (0 disables)
    void setLogInterval(int count);

    // Throws logic_error if a result for the same task was already recorded
    void record(const TaskResult &result);

    int recorded() const;

    bool contains(const string &taskId) const;

    Report finalize(bool cancelled = false) const;

private:
    mutable mutex mtx;
    Report report;
    unordered_set<string> seen;
    int expected = 0;
    int logInterval = 0;
    chrono::steady_clock::time_point startTime;

    void updateProgress(int done, int total) const;
};
