#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "ErrorKind.hh"

using namespace std;
using json = nlohmann::json;

// Answer of a solving backend, attached to the retried API call
struct SolvedToken
{
    string challenge;
    string validate;
    string seccode;
};

class VerificationSolver
{
public:
    virtual ~VerificationSolver() = default;

    // Throws VerificationError (VerificationUnavailable / VerificationRejected)
    virtual SolvedToken solve(const VerificationChallenge &challenge) = 0;
};

struct VerificationConfig
{
    // Solving endpoint; empty means no backend configured
    string url;
    // Extra query parameters, merged after gt / challenge
    json params = json::object();
    // Request body; "{gt}" and "{challenge}" are substituted in string values
    json bodyTemplate = {{"gt", "{gt}"}, {"challenge", "{challenge}"}};
    // JSON pointers into the response
    string tokenPath = "/data/validate";
    string seccodePath = "/data/seccode";
    chrono::milliseconds timeout{10000};
};

/*
Thin adapter over a third-party solving service. The templates are opaque configuration:
only placeholder substitution is applied. No retry here; a challenge id is single use.
*/
class HttpVerificationClient : public VerificationSolver
{
public:
    explicit HttpVerificationClient(VerificationConfig config);

    SolvedToken solve(const VerificationChallenge &challenge) override;

    const VerificationConfig &config() const { return cfg; }

private:
    VerificationConfig cfg;
};
