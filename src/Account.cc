#include "Account.hh"

#include <algorithm>
#include <cctype>

string taskKindToString(TaskKind kind)
{
    switch (kind)
    {
    case TaskKind::SignIn:
        return "sign-in";

    case TaskKind::Read:
        return "read";

    case TaskKind::Like:
        return "like";

    case TaskKind::Share:
        return "share";

    case TaskKind::MissionStatusQuery:
        return "mission-status-query";
    }

    return "unknown";
}

optional<TaskKind> taskKindFromString(const string &name)
{
    for (TaskKind kind : allTaskKinds())
    {
        if (taskKindToString(kind) == name)
            return kind;
    }

    // Accept the "mission-" prefixed spelling used for forum tasks
    if (name.rfind("mission-", 0) == 0)
        return taskKindFromString(name.substr(8));

    return nullopt;
}

const vector<TaskKind> &allTaskKinds()
{
    static const vector<TaskKind> kinds = {
        TaskKind::SignIn,
        TaskKind::Read,
        TaskKind::Like,
        TaskKind::Share,
        TaskKind::MissionStatusQuery};

    return kinds;
}

const vector<string> &knownGames()
{
    static const vector<string> games = {
        "GenshinImpact",
        "HonkaiImpact3",
        "HoukaiGakuen2",
        "TearsOfThemis",
        "StarRail",
        "ZenlessZoneZero"};

    return games;
}

bool isKnownGame(const string &game)
{
    const auto &games = knownGames();
    return find(games.begin(), games.end(), game) != games.end();
}

string Account::displayName() const
{
    return maskAccountId(id);
}

string maskAccountId(const string &id)
{
    // Phone numbers and uids: keep the first 3 and last 4 digits of a run of 7+ digits
    string out = id;
    size_t i = 0;

    while (i < out.size())
    {
        if (!isdigit(static_cast<unsigned char>(out[i])))
        {
            ++i;
            continue;
        }

        size_t j = i;
        while (j < out.size() && isdigit(static_cast<unsigned char>(out[j])))
            ++j;

        if (j - i >= 7)
        {
            for (size_t k = i + 3; k < j - 4; ++k)
                out[k] = '*';
        }

        i = j;
    }

    return out;
}
