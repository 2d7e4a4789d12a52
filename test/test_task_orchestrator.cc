#include <gtest/gtest.h>

#include "../src/TaskOrchestrator.hh"
#include "fakes.hh"

namespace
{
    Account makeAccount(const string &id, vector<string> games, vector<TaskKind> tasks)
    {
        Account a;
        a.id = id;
        a.games = std::move(games);
        a.tasks = std::move(tasks);
        return a;
    }
}

class TaskOrchestratorTest : public ::testing::Test
{
protected:
    shared_ptr<ScriptedGameApi> api = make_shared<ScriptedGameApi>();
    GameApiRegistry registry;
    CancellationToken token;
    FakeSolver solver;
    RunConfig config;

    void SetUp() override
    {
        for (const string &game : knownGames())
            registry.add(game, api);

        config.maxRetries = 2;
        config.retryInterval = chrono::milliseconds(1);
        config.sleepTime = chrono::milliseconds(0);
        config.maxConcurrentAccounts = 4;
    }
};

TEST_F(TaskOrchestratorTest, ExpandsGamesThenKindsInAccountOrder)
{
    Account a = makeAccount("a", {"StarRail", "GenshinImpact"}, {TaskKind::Read, TaskKind::SignIn, TaskKind::Share});

    vector<GameTask> tasks = TaskOrchestrator::expand(a, {TaskKind::SignIn, TaskKind::Read});

    ASSERT_EQ(tasks.size(), 4u);
    EXPECT_EQ(tasks[0].id, "a/StarRail/read");
    EXPECT_EQ(tasks[1].id, "a/StarRail/sign-in");
    EXPECT_EQ(tasks[2].id, "a/GenshinImpact/read");
    EXPECT_EQ(tasks[3].id, "a/GenshinImpact/sign-in");

    EXPECT_EQ(TaskOrchestrator::expand(a, {}).size(), 6u);
}

TEST_F(TaskOrchestratorTest, RepeatedGamesAndKindsExpandOnce)
{
    Account a = makeAccount("alice", {"StarRail", "StarRail", "GenshinImpact"}, {TaskKind::SignIn, TaskKind::SignIn});

    vector<GameTask> tasks = TaskOrchestrator::expand(a, {});

    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[0].id, "alice/StarRail/sign-in");
    EXPECT_EQ(tasks[1].id, "alice/GenshinImpact/sign-in");

    TaskOrchestrator orchestrator(config, registry, solver, token);
    Report report = orchestrator.run({a}, {});

    EXPECT_EQ(report.summary.total, 2);
    EXPECT_EQ(report.summary.succeeded, 2);
    EXPECT_EQ(report.summary.failed, 0);
    EXPECT_EQ(api->callsFor("alice/GenshinImpact/sign-in"), 1);
}

// Two accounts; the second one meets a verification gate and a persistent rate limit
TEST_F(TaskOrchestratorTest, EndToEndMixedOutcomes)
{
    vector<Account> accounts = {
        makeAccount("acc1", {"GenshinImpact"}, {TaskKind::SignIn}),
        makeAccount("acc2", {"GenshinImpact"}, {TaskKind::SignIn, TaskKind::Read})};

    api->script("acc2/GenshinImpact/sign-in", {Step::fail(ErrorKind::VerificationRequired), Step::ok()});
    api->script("acc2/GenshinImpact/read", {Step::fail(ErrorKind::RateLimited), Step::fail(ErrorKind::RateLimited),
                                           Step::fail(ErrorKind::RateLimited)});

    TaskOrchestrator orchestrator(config, registry, solver, token);
    Report report = orchestrator.run(accounts, {});

    EXPECT_EQ(report.summary.total, 3);
    EXPECT_EQ(report.summary.succeeded, 2);
    EXPECT_EQ(report.summary.failed, 1);
    EXPECT_FALSE(report.cancelled);

    const TaskResult *signIn = report.find("acc2", "GenshinImpact", TaskKind::SignIn);
    ASSERT_NE(signIn, nullptr);
    EXPECT_EQ(signIn->outcome, TaskOutcome::Success);
    EXPECT_EQ(signIn->attempts, 2);

    const TaskResult *read = report.find("acc2", "GenshinImpact", TaskKind::Read);
    ASSERT_NE(read, nullptr);
    EXPECT_EQ(read->outcome, TaskOutcome::Failed);
    EXPECT_EQ(read->error, ErrorKind::RateLimited);
    EXPECT_EQ(read->attempts, 3);

    EXPECT_EQ(solver.solves.load(), 1);
    EXPECT_EQ(report.status(), RunStatus::PartialFailure);
}

TEST_F(TaskOrchestratorTest, EveryTaskReportedExactlyOnce)
{
    vector<Account> accounts;
    for (int i = 0; i < 5; ++i)
        accounts.push_back(makeAccount("user" + to_string(i), {"GenshinImpact", "StarRail", "ZenlessZoneZero"},
                                       {TaskKind::SignIn, TaskKind::Read, TaskKind::Like, TaskKind::Share}));

    api->script("user3/StarRail/like", {Step::fail(ErrorKind::AuthError)});

    TaskOrchestrator orchestrator(config, registry, solver, token);
    Report report = orchestrator.run(accounts, {});

    EXPECT_EQ(report.summary.total, 5 * 3 * 4);
    EXPECT_EQ(report.summary.failed, 1);
    EXPECT_EQ(report.summary.succeeded, 5 * 3 * 4 - 1);
    EXPECT_EQ(static_cast<int>(api->calls().size()), 5 * 3 * 4);

    for (const Account &a : accounts)
        for (const string &game : a.games)
            for (TaskKind kind : a.tasks)
                EXPECT_NE(report.find(a.id, game, kind), nullptr) << a.id << "/" << game;
}

TEST_F(TaskOrchestratorTest, FailingAccountDoesNotAffectOthers)
{
    vector<Account> accounts = {
        makeAccount("broken", {"StarRail"}, {TaskKind::SignIn, TaskKind::Read}),
        makeAccount("healthy", {"StarRail"}, {TaskKind::SignIn, TaskKind::Read})};

    api->script("broken/StarRail/sign-in", {Step::fail(ErrorKind::AuthError)});
    api->script("broken/StarRail/read", {Step::fail(ErrorKind::AuthError)});

    TaskOrchestrator orchestrator(config, registry, solver, token);
    Report report = orchestrator.run(accounts, {});

    EXPECT_EQ(report.find("healthy", "StarRail", TaskKind::SignIn)->outcome, TaskOutcome::Success);
    EXPECT_EQ(report.find("healthy", "StarRail", TaskKind::Read)->outcome, TaskOutcome::Success);
    EXPECT_EQ(report.summary.failed, 2);
}

TEST_F(TaskOrchestratorTest, ConcurrencyBoundedByConfig)
{
    config.maxConcurrentAccounts = 2;
    api->setLatency(chrono::milliseconds(30));

    vector<Account> accounts;
    for (int i = 0; i < 6; ++i)
        accounts.push_back(makeAccount("c" + to_string(i), {"StarRail"}, {TaskKind::SignIn, TaskKind::Read}));

    TaskOrchestrator orchestrator(config, registry, solver, token);
    Report report = orchestrator.run(accounts, {});

    EXPECT_EQ(report.summary.total, 12);
    EXPECT_LE(api->peakConcurrency(), 2);
}

TEST_F(TaskOrchestratorTest, EnabledKindsFilterTasks)
{
    vector<Account> accounts = {makeAccount("a", {"StarRail"}, {TaskKind::SignIn, TaskKind::Read, TaskKind::Like})};

    TaskOrchestrator orchestrator(config, registry, solver, token);
    Report report = orchestrator.run(accounts, {TaskKind::Like});

    EXPECT_EQ(report.summary.total, 1);
    EXPECT_NE(report.find("a", "StarRail", TaskKind::Like), nullptr);
}

TEST_F(TaskOrchestratorTest, CancelledRunKeepsProducedResults)
{
    config.sleepTime = chrono::seconds(30);
    config.maxConcurrentAccounts = 1;

    vector<Account> accounts = {
        makeAccount("first", {"StarRail"}, {TaskKind::SignIn, TaskKind::Read}),
        makeAccount("second", {"StarRail"}, {TaskKind::SignIn})};

    thread canceller([this]()
                     {
        this_thread::sleep_for(chrono::milliseconds(100));
        token.cancel(); });

    TaskOrchestrator orchestrator(config, registry, solver, token);
    Report report = orchestrator.run(accounts, {});
    canceller.join();

    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.summary.total, 3);
    EXPECT_EQ(report.find("first", "StarRail", TaskKind::SignIn)->outcome, TaskOutcome::Success);
    EXPECT_EQ(report.find("first", "StarRail", TaskKind::Read)->outcome, TaskOutcome::Skipped);
    EXPECT_EQ(report.find("second", "StarRail", TaskKind::SignIn)->outcome, TaskOutcome::Skipped);
}

TEST_F(TaskOrchestratorTest, RunUsesConfiguredAccounts)
{
    config.accounts = {makeAccount("cfg", {"HonkaiImpact3"}, {TaskKind::SignIn})};
    config.enabledTasks = {TaskKind::SignIn};

    TaskOrchestrator orchestrator(config, registry, solver, token);
    Report report = orchestrator.run();

    EXPECT_EQ(report.summary.total, 1);
    EXPECT_EQ(report.summary.succeeded, 1);
}
