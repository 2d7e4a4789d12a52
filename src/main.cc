#include <filesystem>
#include <fstream>
#include <iostream>

#include "Logger.hh"
#include "ShutdownSignal.hh"
#include "TaskOrchestrator.hh"
#include "config.hh"

namespace fs = filesystem;

// Write the report next to the log so external tooling can pick it up
static void exportSummary(const Report &report, const string &path)
{
    fs::path output(path);

    if (output.has_parent_path())
    {
        error_code ec;
        fs::create_directories(output.parent_path(), ec);
    }

    ofstream out(output);
    if (!out.is_open())
    {
        Logger::log(LogLevel::Error, "summary", "cannot write " + path, 0, 0);
        return;
    }

    out << report.toJSON().dump(4);
    out.flush();

    Logger::dualSafeLog("Summary exported to " + path);
}

int main(int argc, char *argv[])
{
    // Start measuring the total running time of the entire program
    auto overallStart = chrono::steady_clock::now();

    const string configPath = argc > 1 ? argv[1] : "config.json";

    // ======== Step 1: Load configuration ========
    RunConfig config;
    try
    {
        config = loadConfig(configPath);
    }
    catch (const ConfigError &e)
    {
        lock_guard<mutex> lock(Logger::coutMutex);
        cerr << "Configuration error: " << e.what() << endl;
        return 1;
    }

    // ======== Step 2: Initialize the logging system ========
    Logger &log = Logger::instance();
    Logger::setMinLevel(config.logLevel);

    try
    {
        log.start(config.logFile);
    }
    catch (const exception &e)
    {
        lock_guard<mutex> lock(Logger::coutMutex);
        cerr << e.what() << endl;
        return 1;
    }

    log.dualSafeLog("==== Check-in run started, " + to_string(config.accounts.size()) + " accounts ===");

    // ======== Step 3: Run every account ========
    CancellationToken token;
    Report report;
    int caught = 0;

    {
        // SIGINT / SIGTERM cancel the run cooperatively
        ShutdownSignal shutdown(token);

        GameApiRegistry apis = buildGameApis(config);
        HttpVerificationClient verifier(config.verification);

        TaskOrchestrator orchestrator(config, apis, verifier, token);
        report = orchestrator.run();

        caught = shutdown.receivedSignal();
    }

    // ======== Step 4: Report ========
    {
        lock_guard<mutex> lock(Logger::coutMutex);
        cout << "\n" << report.toText() << endl;
    }

    exportSummary(report, config.summaryFile);

    // ======== Step 5: Send result notification ========
    PushNotifier notifier = buildNotifier(config);
    for (const ChannelOutcome &outcome : notifier.notify(report))
    {
        if (!outcome.delivered)
            log.dualSafeLog("Notification via " + outcome.channel + " failed: " + outcome.error);
    }

    logElapsedTime("Total run time", overallStart, chrono::steady_clock::now());

    Logger::flush();
    log.stop();

    // Partial failure is still a completed run
    return caught != 0 ? 130 : 0;
}
