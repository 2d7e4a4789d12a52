#include "ErrorKind.hh"

string errorKindToString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::None:
        return "None";

    case ErrorKind::NetworkError:
        return "NetworkError";

    case ErrorKind::RateLimited:
        return "RateLimited";

    case ErrorKind::AuthError:
        return "AuthError";

    case ErrorKind::VerificationRequired:
        return "VerificationRequired";

    case ErrorKind::VerificationUnavailable:
        return "VerificationUnavailable";

    case ErrorKind::VerificationRejected:
        return "VerificationRejected";

    case ErrorKind::UnknownAPIError:
        return "UnknownAPIError";

    case ErrorKind::Cancelled:
        return "Cancelled";
    }

    return "UnknownAPIError";
}

bool isVerificationKind(ErrorKind kind)
{
    return kind == ErrorKind::VerificationRequired ||
           kind == ErrorKind::VerificationUnavailable ||
           kind == ErrorKind::VerificationRejected;
}

GameApiError::GameApiError(ErrorKind kind, const string &detail, optional<VerificationChallenge> challenge)
    : runtime_error(detail), kind_(kind), challenge_(std::move(challenge))
{
}

VerificationError::VerificationError(ErrorKind kind, const string &detail)
    : runtime_error(detail), kind_(kind)
{
}
