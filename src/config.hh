#pragma once

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "Account.hh"
#include "HttpGameApi.hh"
#include "Logger.hh"
#include "PushNotifier.hh"
#include "VerificationClient.hh"

using namespace std;
using json = nlohmann::json;

// Unreadable or invalid configuration; the only failure that aborts a run
class ConfigError : public runtime_error
{
public:
    explicit ConfigError(const string &message) : runtime_error(message) {}
};

/*
Everything a run needs, built once at startup and passed down explicitly.
Durations are given in seconds in the file.
*/
struct RunConfig
{
    chrono::milliseconds timeout{10000};       // network timeout, every HTTP call
    int maxRetries = 3;                        // extra attempts for RateLimited / NetworkError
    chrono::milliseconds retryInterval{2000};  // fixed delay between those attempts
    chrono::milliseconds sleepTime{2000};      // cooldown between tasks of one account
    int maxConcurrentAccounts = 4;

    string logFile = "checkin_log.txt";
    LogLevel logLevel = LogLevel::Info;
    string summaryFile = "checkin_summary.json";

    // Task kinds allowed this run; empty means all
    vector<TaskKind> enabledTasks;

    VerificationConfig verification;
    map<string, GameEndpoint> games;
    vector<Account> accounts;

    PushOptions push;
    // Raw channel entries, turned into NotificationChannels by buildNotifier
    json channels = json::array();
};

RunConfig loadConfig(const string &path);

RunConfig parseConfig(const json &root);

GameApiRegistry buildGameApis(const RunConfig &config);

PushNotifier buildNotifier(const RunConfig &config);

void logElapsedTime(const string &label, chrono::steady_clock::time_point start, chrono::steady_clock::time_point end);
