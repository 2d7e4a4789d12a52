#include "HttpGameApi.hh"
#include "HttpUtil.hh"

namespace
{
    // Platform return codes
    constexpr int kOk = 0;
    constexpr int kAlreadySigned = -5003;
    constexpr int kLoginExpired = -100;
    constexpr int kNotLoggedIn = 10001;
    constexpr int kInvalidCookie = -10001;
    constexpr int kNeedVerify = 1034;
    constexpr int kTooFrequent = -110;

    string credential(const Account &account, const string &key)
    {
        auto it = account.credentials.find(key);
        return it == account.credentials.end() ? "" : it->second;
    }
}

HttpGameApi::HttpGameApi(GameEndpoint gameEndpoint, chrono::milliseconds networkTimeout)
    : endpoint(std::move(gameEndpoint)), timeout(networkTimeout)
{
}

ApiOutcome HttpGameApi::performSignIn(const Account &account, const string &game, const SolvedToken *token)
{
    json body;
    body["act_id"] = endpoint.actId;

    string uid = credential(account, "uid_" + game);
    body["uid"] = uid.empty() ? credential(account, "uid") : uid;

    string region = credential(account, "region_" + game);
    if (!region.empty())
        body["region"] = region;

    return post(account, endpoint.signPath, body, token);
}

ApiOutcome HttpGameApi::performMission(const Account &account, const string &game, TaskKind kind, const SolvedToken *token)
{
    auto it = endpoint.missionPaths.find(kind);
    if (it == endpoint.missionPaths.end() || it->second.empty())
        throw GameApiError(ErrorKind::UnknownAPIError, "no " + taskKindToString(kind) + " endpoint configured for " + game);

    json body;
    body["gids"] = endpoint.actId;

    return post(account, it->second, body, token);
}

ApiOutcome HttpGameApi::post(const Account &account, const string &path, const json &body, const SolvedToken *token)
{
    auto parts = splitUrl(endpoint.baseUrl);
    if (!parts)
        throw GameApiError(ErrorKind::UnknownAPIError, "invalid base url: " + endpoint.baseUrl);

    httplib::Client client(parts->origin);
    if (!client.is_valid())
        throw GameApiError(ErrorKind::NetworkError, "unsupported url: " + endpoint.baseUrl);

    applyTimeout(client, timeout);

    httplib::Headers headers = {
        {"Cookie", account.cookies},
        {"x-rpc-platform", account.platform},
        {"x-rpc-client_type", account.platform == "android" ? "2" : "1"}};

    if (token)
    {
        headers.emplace("x-rpc-challenge", token->challenge);
        headers.emplace("x-rpc-validate", token->validate);
        headers.emplace("x-rpc-seccode", token->seccode);
    }

    string fullPath = parts->path == "/" ? path : parts->path + path;
    auto res = client.Post(fullPath, headers, body.dump(), "application/json");

    if (!res)
        throw GameApiError(ErrorKind::NetworkError, describe(res));

    return classifyResponse(res->status, res->body);
}

ApiOutcome HttpGameApi::classifyResponse(int httpStatus, const string &body)
{
    if (httpStatus == 429)
        throw GameApiError(ErrorKind::RateLimited, "HTTP 429");

    if (httpStatus >= 500)
        throw GameApiError(ErrorKind::NetworkError, "HTTP " + to_string(httpStatus));

    if (httpStatus == 401 || httpStatus == 403)
        throw GameApiError(ErrorKind::AuthError, "HTTP " + to_string(httpStatus));

    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("retcode") || !j["retcode"].is_number_integer())
        throw GameApiError(ErrorKind::UnknownAPIError, "unrecognized response (HTTP " + to_string(httpStatus) + ")");

    int retcode = j["retcode"].get<int>();
    string message = j.value("message", "");
    const json data = j.contains("data") && j["data"].is_object() ? j["data"] : json::object();

    auto challengeFrom = [&data, &body]()
    {
        VerificationChallenge challenge;
        challenge.gt = data.value("gt", "");
        challenge.challenge = data.value("challenge", "");
        challenge.payload = body;
        return challenge;
    };

    switch (retcode)
    {
    case kOk:
    {
        // A risk code or a gt in a "successful" answer is a verification gate
        bool risky = data.contains("risk_code") && data["risk_code"].is_number() && data["risk_code"].get<int>() != 0;
        bool gated = !data.value("gt", "").empty();

        if (risky || gated)
            throw GameApiError(ErrorKind::VerificationRequired, "verification challenge issued", challengeFrom());

        if (data.value("is_done", false))
            return ApiOutcome::AlreadyDone;

        return ApiOutcome::Success;
    }

    case kAlreadySigned:
        return ApiOutcome::AlreadyDone;

    case kLoginExpired:
    case kNotLoggedIn:
    case kInvalidCookie:
        throw GameApiError(ErrorKind::AuthError, "login expired: " + message);

    case kNeedVerify:
        throw GameApiError(ErrorKind::VerificationRequired, "verification required: " + message, challengeFrom());

    case kTooFrequent:
        throw GameApiError(ErrorKind::RateLimited, "too frequent: " + message);

    default:
        throw GameApiError(ErrorKind::UnknownAPIError, "retcode " + to_string(retcode) + ": " + message);
    }
}
