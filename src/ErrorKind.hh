#pragma once

#include <optional>
#include <stdexcept>
#include <string>

using namespace std;

// Classification of everything that can go wrong while driving a task
enum class ErrorKind
{
    None,
    NetworkError,
    RateLimited,
    AuthError,
    VerificationRequired,
    VerificationUnavailable,
    VerificationRejected,
    UnknownAPIError,
    Cancelled
};

string errorKindToString(ErrorKind kind);

bool isVerificationKind(ErrorKind kind);

// Human-verification gate handed back by a game API in place of a normal answer
struct VerificationChallenge
{
    string challenge; // challenge id, single use
    string gt;        // provider key
    string payload;   // raw provider payload, opaque to the core
    string taskId;    // originating task
};

/*
Thrown by a GameApi when a call does not reach a success / already-done outcome.
Carries the classification hint and, for VerificationRequired, the challenge.
*/
class GameApiError : public runtime_error
{
public:
    GameApiError(ErrorKind kind, const string &detail, optional<VerificationChallenge> challenge = nullopt);

    ErrorKind kind() const { return kind_; }
    const optional<VerificationChallenge> &challenge() const { return challenge_; }

private:
    ErrorKind kind_;
    optional<VerificationChallenge> challenge_;
};

// Thrown by a VerificationSolver: VerificationUnavailable or VerificationRejected
class VerificationError : public runtime_error
{
public:
    VerificationError(ErrorKind kind, const string &detail);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};
