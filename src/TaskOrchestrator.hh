#pragma once

#include <vector>

#include "Account.hh"
#include "CancellationToken.hh"
#include "GameApi.hh"
#include "GameTask.hh"
#include "ResultAggregator.hh"
#include "RetryPolicy.hh"
#include "VerificationClient.hh"
#include "config.hh"

using namespace std;

/*
Top-level driver of one run.

Expands every account into its ordered task list, then runs one AccountTaskQueue per account
on a ThreadPool bounded by maxConcurrentAccounts. Results stream into a ResultAggregator as they
are produced; run() returns once every account pipeline has finished (or was cancelled).
*/
class TaskOrchestrator
{
public:
    TaskOrchestrator(const RunConfig &config, const GameApiRegistry &apis,
                     VerificationSolver &solver, CancellationToken &token);

    // Games in account order, kinds in account order filtered by enabledKinds (empty = all)
    static vector<GameTask> expand(const Account &account, const vector<TaskKind> &enabledKinds);

    Report run(const vector<Account> &accounts, const vector<TaskKind> &enabledKinds);

    // Uses the accounts and enabled tasks of the configuration
    Report run();

private:
    const RunConfig &config;
    const GameApiRegistry &apis;
    VerificationSolver &solver;
    CancellationToken &token;
    RetryPolicy policy;

    void runAccount(const Account &account, vector<GameTask> tasks, ResultAggregator &aggregator);
};
