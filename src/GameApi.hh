#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "Account.hh"
#include "ErrorKind.hh"
#include "VerificationClient.hh"

using namespace std;

enum class ApiOutcome
{
    Success,
    AlreadyDone // the action had already been performed today
};

/*
Per-game API collaborator. One variant per title, selected by game id through GameApiRegistry.
Failures are thrown as GameApiError carrying the classification hint.
`token` is null on a normal call and set on the single post-verification retry.
*/
class GameApi
{
public:
    virtual ~GameApi() = default;

    virtual ApiOutcome performSignIn(const Account &account, const string &game, const SolvedToken *token) = 0;

    virtual ApiOutcome performMission(const Account &account, const string &game, TaskKind kind, const SolvedToken *token) = 0;
};

class GameApiRegistry
{
public:
    void add(const string &game, shared_ptr<GameApi> api);

    // nullptr if no variant is registered for the game
    GameApi *find(const string &game) const;

    size_t size() const { return apis.size(); }

private:
    unordered_map<string, shared_ptr<GameApi>> apis;
};
