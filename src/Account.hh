#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

using namespace std;

enum class TaskKind
{
    SignIn,
    Read,
    Like,
    Share,
    MissionStatusQuery
};

string taskKindToString(TaskKind kind);

optional<TaskKind> taskKindFromString(const string &name);

// Every kind, in the order a fresh account enables them
const vector<TaskKind> &allTaskKinds();

// The six supported titles
const vector<string> &knownGames();

bool isKnownGame(const string &game);

// Long digit runs masked, e.g. "13812345678" -> "138****5678"
string maskAccountId(const string &id);

/*
One user account, built from configuration at startup and never modified during the run.
Credentials are opaque to the orchestration core; only a GameApi reads them.
*/
struct Account
{
    string id;
    // Raw cookie header for the platform
    string cookies;
    // Any other token material (stoken, device ids, ...)
    unordered_map<string, string> credentials;
    // Device platform the sign-in headers pretend to be ("ios" or "android")
    string platform = "ios";
    // Enabled games, in execution order
    vector<string> games;
    // Enabled task kinds, in execution order
    vector<TaskKind> tasks;

    // Account id with long digit runs masked, safe to print in reports
    string displayName() const;
};
