#include "ResultAggregator.hh"
#include "Logger.hh"

#include <algorithm>
#include <sstream>
#include <stdexcept>

string runStatusTitle(RunStatus status)
{
    switch (status)
    {
    case RunStatus::Success:
        return "Run succeeded";

    case RunStatus::Failed:
        return "Run failed";

    case RunStatus::PartialFailure:
        return "Some tasks failed";

    case RunStatus::VerificationBlocked:
        return "Verification challenge blocked a task";
    }

    return "Run failed";
}

RunStatus Report::status() const
{
    if (summary.failed == 0)
        return RunStatus::Success;

    for (const auto &[account, games] : results)
        for (const auto &[game, kinds] : games)
            for (const auto &[kind, result] : kinds)
                if (result.outcome == TaskOutcome::Failed && isVerificationKind(result.error))
                    return RunStatus::VerificationBlocked;

    if (summary.succeeded == 0)
        return RunStatus::Failed;

    return RunStatus::PartialFailure;
}

const TaskResult *Report::find(const string &account, const string &game, TaskKind kind) const
{
    auto a = results.find(account);
    if (a == results.end())
        return nullptr;

    auto g = a->second.find(game);
    if (g == a->second.end())
        return nullptr;

    auto k = g->second.find(kind);
    return k == g->second.end() ? nullptr : &k->second;
}

json Report::toJSON() const
{
    json j;
    j["status"] = static_cast<int>(status());
    j["title"] = runStatusTitle(status());
    j["cancelled"] = cancelled;
    j["duration_ms"] = durationMs;
    j["summary"] = {
        {"total", summary.total},
        {"succeeded", summary.succeeded},
        {"already_done", summary.alreadyDone},
        {"failed", summary.failed},
        {"skipped", summary.skipped}};

    json accounts = json::object();
    for (const auto &[account, games] : results)
    {
        json gamesJson = json::object();
        for (const auto &[game, kinds] : games)
        {
            json kindsJson = json::object();
            for (const auto &[kind, result] : kinds)
                kindsJson[taskKindToString(kind)] = result.toJSON();

            gamesJson[game] = kindsJson;
        }

        accounts[account] = gamesJson;
    }

    j["accounts"] = accounts;
    return j;
}

string Report::toText() const
{
    ostringstream ss;

    ss << runStatusTitle(status()) << "\n\n"
       << "Succeeded: " << summary.succeeded
       << " (already done: " << summary.alreadyDone << ")"
       << " | Failed: " << summary.failed
       << " | Skipped: " << summary.skipped
       << " | Total: " << summary.total << "\n";

    if (cancelled)
        ss << "Run was cancelled before all tasks finished\n";

    // Configured order first, then anything not listed
    vector<string> order = accountOrder;
    for (const auto &[account, games] : results)
    {
        if (find_if(order.begin(), order.end(), [&](const string &a)
                    { return a == account; }) == order.end())
            order.push_back(account);
    }

    for (const string &account : order)
    {
        auto it = results.find(account);
        if (it == results.end())
            continue;

        ss << "\n[" << maskAccountId(account) << "]\n";

        for (const auto &[game, kinds] : it->second)
        {
            ss << "  " << game << "\n";

            for (const auto &[kind, result] : kinds)
            {
                ss << "    " << taskKindToString(kind) << ": " << outcomeToString(result.outcome);

                if (result.outcome == TaskOutcome::Failed || result.outcome == TaskOutcome::Skipped)
                {
                    if (result.error != ErrorKind::None)
                        ss << " (" << errorKindToString(result.error) << ")";

                    if (!result.detail.empty())
                        ss << " - " << result.detail;
                }

                if (result.attempts > 1)
                    ss << " [" << result.attempts << " attempts]";

                ss << "\n";
            }
        }
    }

    return ss.str();
}

ResultAggregator::ResultAggregator(int expectedTasks)
    : expected(expectedTasks), startTime(chrono::steady_clock::now()) {}

void ResultAggregator::setAccountOrder(vector<string> accounts)
{
    lock_guard<mutex> lock(mtx);
    report.accountOrder = std::move(accounts);
}

void ResultAggregator::setLogInterval(int count)
{
    lock_guard<mutex> lock(mtx);
    logInterval = count > 0 ? count : 0;
}

void ResultAggregator::record(const TaskResult &result)
{
    int done = 0;
    int total = 0;
    bool logNow = false;

    {
        lock_guard<mutex> lock(mtx);

        if (!seen.insert(result.taskId).second)
            throw logic_error("duplicate result for task " + result.taskId);

        report.results[result.accountId][result.game][result.kind] = result;

        RunSummary &s = report.summary;
        s.total++;

        switch (result.outcome)
        {
        case TaskOutcome::Success:
            s.succeeded++;
            break;

        case TaskOutcome::AlreadyDone:
            s.succeeded++;
            s.alreadyDone++;
            break;

        case TaskOutcome::Failed:
            s.failed++;
            break;

        case TaskOutcome::Skipped:
            s.skipped++;
            break;
        }

        done = s.total;
        total = expected;
        logNow = logInterval > 0 && (done % logInterval == 0 || done == expected);
    }

    if (logNow)
        updateProgress(done, total);
}

int ResultAggregator::recorded() const
{
    lock_guard<mutex> lock(mtx);
    return report.summary.total;
}

bool ResultAggregator::contains(const string &taskId) const
{
    lock_guard<mutex> lock(mtx);
    return seen.count(taskId) > 0;
}

Report ResultAggregator::finalize(bool cancelled) const
{
    lock_guard<mutex> lock(mtx);

    Report out = report;
    out.cancelled = cancelled;
    out.durationMs = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - startTime).count();

    return out;
}

void ResultAggregator::updateProgress(int done, int total) const
{
    int percent = total <= 0 ? 100 : static_cast<int>(100.0 * done / total);
    if (percent > 100)
        percent = 100;

    Logger::dualSafeLog("Progress: " + to_string(percent) + "% (" + to_string(done) + "/" + to_string(total) + " tasks)");
}
