#pragma once

#include <chrono>
#include <map>
#include <string>

#include "GameApi.hh"

using namespace std;

// Endpoints of one title, from the "games" section of the configuration
struct GameEndpoint
{
    string baseUrl;
    string signPath;
    string actId;
    // Forum mission endpoints by kind (read, like, share, mission-status-query)
    map<TaskKind, string> missionPaths;
};

/*
Generic JSON-over-HTTP game variant. The platform answers every call with
{"retcode": <int>, "message": <str>, "data": {...}}; the retcode decides the outcome.
*/
class HttpGameApi : public GameApi
{
public:
    HttpGameApi(GameEndpoint endpoint, chrono::milliseconds timeout);

    ApiOutcome performSignIn(const Account &account, const string &game, const SolvedToken *token) override;

    ApiOutcome performMission(const Account &account, const string &game, TaskKind kind, const SolvedToken *token) override;

    // Maps an HTTP status and body to an outcome, or throws GameApiError
    static ApiOutcome classifyResponse(int httpStatus, const string &body);

private:
    GameEndpoint endpoint;
    chrono::milliseconds timeout;

    ApiOutcome post(const Account &account, const string &path, const json &body, const SolvedToken *token);
};
