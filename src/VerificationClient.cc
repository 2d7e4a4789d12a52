#include "VerificationClient.hh"
#include "HttpUtil.hh"
#include "Logger.hh"

HttpVerificationClient::HttpVerificationClient(VerificationConfig config) : cfg(std::move(config)) {}

SolvedToken HttpVerificationClient::solve(const VerificationChallenge &challenge)
{
    if (cfg.url.empty())
        throw VerificationError(ErrorKind::VerificationUnavailable, "no verification backend configured");

    if (challenge.challenge.empty() || challenge.gt.empty())
        throw VerificationError(ErrorKind::VerificationRejected, "challenge payload lacks gt / challenge");

    auto parts = splitUrl(cfg.url);
    if (!parts)
        throw VerificationError(ErrorKind::VerificationUnavailable, "invalid verification url: " + cfg.url);

    httplib::Params values = {{"gt", challenge.gt}, {"challenge", challenge.challenge}};

    httplib::Params query = values;
    for (const auto &[key, value] : cfg.params.items())
        query.emplace(key, value.is_string() ? value.get<string>() : value.dump());

    json body = substituteTemplate(cfg.bodyTemplate, values);

    httplib::Client client(parts->origin);
    if (!client.is_valid())
        throw VerificationError(ErrorKind::VerificationUnavailable, "unsupported verification url: " + cfg.url);

    applyTimeout(client, cfg.timeout);

    Logger::log(LogLevel::Debug, "verification " + challenge.taskId, "POST " + cfg.url, 0, 1);

    auto start = chrono::steady_clock::now();
    auto res = client.Post(withQuery(parts->path, query), body.dump(), "application/json");
    int latency = static_cast<int>(chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start).count());

    if (!res || res->status < 200 || res->status >= 300)
    {
        Logger::log(LogLevel::Warn, "verification " + challenge.taskId, describe(res), latency, 1);
        throw VerificationError(ErrorKind::VerificationUnavailable, "solver unreachable: " + describe(res));
    }

    json answer = json::parse(res->body, nullptr, false);
    if (answer.is_discarded())
        throw VerificationError(ErrorKind::VerificationRejected, "solver returned a non-JSON body");

    json::json_pointer tokenPtr;
    json::json_pointer seccodePtr;

    try
    {
        tokenPtr = json::json_pointer(cfg.tokenPath);
        seccodePtr = json::json_pointer(cfg.seccodePath);
    }
    catch (const json::exception &e)
    {
        throw VerificationError(ErrorKind::VerificationUnavailable, string("bad token location: ") + e.what());
    }

    if (!answer.contains(tokenPtr) || !answer[tokenPtr].is_string() || answer[tokenPtr].get<string>().empty())
        throw VerificationError(ErrorKind::VerificationRejected, "solver returned no token at " + cfg.tokenPath);

    SolvedToken token;
    token.challenge = challenge.challenge;
    token.validate = answer[tokenPtr].get<string>();

    if (answer.contains(seccodePtr) && answer[seccodePtr].is_string() && !answer[seccodePtr].get<string>().empty())
        token.seccode = answer[seccodePtr].get<string>();
    else
        token.seccode = token.validate + "|jordan";

    Logger::log(LogLevel::Info, "verification " + challenge.taskId, "solved", latency, 1);

    return token;
}
