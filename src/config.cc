#include "config.hh"
#include "HttpUtil.hh"
#include "NotificationChannels.hh"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <unordered_set>

namespace
{
    chrono::milliseconds secondsField(const json &section, const string &key, chrono::milliseconds fallback, const string &where)
    {
        if (!section.contains(key))
            return fallback;

        const json &value = section[key];
        if (!value.is_number() || value.get<double>() < 0)
            throw ConfigError(where + "." + key + " must be a non-negative number of seconds");

        return chrono::milliseconds(llround(value.get<double>() * 1000.0));
    }

    int integer(const json &section, const string &key, int fallback, int minimum, const string &where)
    {
        if (!section.contains(key))
            return fallback;

        const json &value = section[key];
        if (!value.is_number_integer() || value.get<int>() < minimum)
            throw ConfigError(where + "." + key + " must be an integer >= " + to_string(minimum));

        return value.get<int>();
    }

    bool flag(const json &section, const string &key, bool fallback, const string &where)
    {
        if (!section.contains(key))
            return fallback;

        if (!section[key].is_boolean())
            throw ConfigError(where + "." + key + " must be true or false");

        return section[key].get<bool>();
    }

    string text(const json &section, const string &key, const string &fallback, const string &where)
    {
        if (!section.contains(key))
            return fallback;

        if (!section[key].is_string())
            throw ConfigError(where + "." + key + " must be a string");

        return section[key].get<string>();
    }

    const json &object(const json &root, const string &key, const string &where)
    {
        static const json empty = json::object();

        if (!root.contains(key))
            return empty;

        if (!root[key].is_object())
            throw ConfigError(where + key + " must be an object");

        return root[key];
    }

    vector<TaskKind> taskList(const json &value, const string &where)
    {
        if (!value.is_array())
            throw ConfigError(where + " must be an array of task names");

        vector<TaskKind> kinds;
        for (const auto &item : value)
        {
            auto kind = item.is_string() ? taskKindFromString(item.get<string>()) : nullopt;
            if (!kind)
                throw ConfigError(where + " contains unknown task " + item.dump());

            if (find(kinds.begin(), kinds.end(), *kind) != kinds.end())
                throw ConfigError(where + " lists " + item.dump() + " more than once");

            kinds.push_back(*kind);
        }

        return kinds;
    }

    Account parseAccount(const json &entry, size_t index)
    {
        const string where = "accounts[" + to_string(index) + "]";

        if (!entry.is_object())
            throw ConfigError(where + " must be an object");

        Account account;
        account.id = text(entry, "id", "", where);
        if (account.id.empty())
            throw ConfigError(where + ".id is required");

        account.cookies = text(entry, "cookies", "", where);
        account.platform = text(entry, "platform", "ios", where);
        if (account.platform != "ios" && account.platform != "android")
            throw ConfigError(where + ".platform must be \"ios\" or \"android\"");

        for (const auto &[key, value] : object(entry, "credentials", where + ".").items())
        {
            if (!value.is_string())
                throw ConfigError(where + ".credentials." + key + " must be a string");

            account.credentials[key] = value.get<string>();
        }

        if (entry.contains("games"))
        {
            if (!entry["games"].is_array())
                throw ConfigError(where + ".games must be an array");

            for (const auto &game : entry["games"])
            {
                if (!game.is_string() || !isKnownGame(game.get<string>()))
                    throw ConfigError(where + ".games contains unknown game " + game.dump());

                if (find(account.games.begin(), account.games.end(), game.get<string>()) != account.games.end())
                    throw ConfigError(where + ".games lists " + game.dump() + " more than once");

                account.games.push_back(game.get<string>());
            }
        }
        else
        {
            account.games = knownGames();
        }

        account.tasks = entry.contains("tasks")
                            ? taskList(entry["tasks"], where + ".tasks")
                            : vector<TaskKind>{TaskKind::SignIn, TaskKind::Read, TaskKind::Like, TaskKind::Share};

        // Coarse switches kept from the older config layout
        if (!flag(entry, "enable_game_sign", true, where))
            erase(account.tasks, TaskKind::SignIn);

        if (!flag(entry, "enable_mission", true, where))
            erase_if(account.tasks, [](TaskKind k)
                     { return k != TaskKind::SignIn; });

        return account;
    }

    GameEndpoint parseGame(const string &name, const json &entry)
    {
        const string where = "games." + name;

        if (!isKnownGame(name))
            throw ConfigError(where + " is not a supported game");

        if (!entry.is_object())
            throw ConfigError(where + " must be an object");

        GameEndpoint endpoint;
        endpoint.baseUrl = text(entry, "base_url", "", where);
        endpoint.signPath = text(entry, "sign_path", "", where);
        endpoint.actId = text(entry, "act_id", "", where);

        if (!splitUrl(endpoint.baseUrl))
            throw ConfigError(where + ".base_url must be an http(s) url");

        for (const auto &[kindName, path] : object(entry, "missions", where + ".").items())
        {
            auto kind = taskKindFromString(kindName);
            if (!kind || *kind == TaskKind::SignIn || !path.is_string())
                throw ConfigError(where + ".missions." + kindName + " is not a mission endpoint");

            endpoint.missionPaths[*kind] = path.get<string>();
        }

        return endpoint;
    }
}

RunConfig loadConfig(const string &path)
{
    ifstream in(path);
    if (!in.is_open())
        throw ConfigError("cannot open config file " + path);

    json root = json::parse(in, nullptr, false);
    if (root.is_discarded())
        throw ConfigError("config file " + path + " is not valid JSON");

    return parseConfig(root);
}

static RunConfig parseRoot(const json &root)
{
    if (!root.is_object())
        throw ConfigError("configuration root must be an object");

    RunConfig cfg;

    const json &pref = object(root, "preference", "");
    cfg.timeout = secondsField(pref, "timeout", cfg.timeout, "preference");
    cfg.maxRetries = integer(pref, "max_retry_times", cfg.maxRetries, 0, "preference");
    cfg.retryInterval = secondsField(pref, "retry_interval", cfg.retryInterval, "preference");
    cfg.sleepTime = secondsField(pref, "sleep_time", cfg.sleepTime, "preference");
    cfg.maxConcurrentAccounts = integer(pref, "max_concurrent_accounts", cfg.maxConcurrentAccounts, 1, "preference");
    cfg.logFile = text(pref, "log_file", cfg.logFile, "preference");
    cfg.summaryFile = text(pref, "summary_file", cfg.summaryFile, "preference");

    if (pref.contains("log_level"))
    {
        auto level = pref["log_level"].is_string() ? Logger::logLevelFromString(pref["log_level"].get<string>()) : nullopt;
        if (!level)
            throw ConfigError("preference.log_level must be one of debug, info, warn, error");

        cfg.logLevel = *level;
    }

    if (pref.contains("enabled_tasks"))
        cfg.enabledTasks = taskList(pref["enabled_tasks"], "preference.enabled_tasks");

    const json &verification = object(root, "verification", "");
    cfg.verification.url = text(verification, "url", "", "verification");
    cfg.verification.tokenPath = text(verification, "token_path", cfg.verification.tokenPath, "verification");
    cfg.verification.seccodePath = text(verification, "seccode_path", cfg.verification.seccodePath, "verification");
    cfg.verification.timeout = cfg.timeout;

    if (verification.contains("params"))
    {
        if (!verification["params"].is_object())
            throw ConfigError("verification.params must be an object");

        cfg.verification.params = verification["params"];
    }

    if (verification.contains("json"))
    {
        if (!verification["json"].is_object())
            throw ConfigError("verification.json must be an object");

        cfg.verification.bodyTemplate = verification["json"];
    }

    for (const auto &[name, entry] : object(root, "games", "").items())
        cfg.games[name] = parseGame(name, entry);

    if (!root.contains("accounts") || !root["accounts"].is_array())
        throw ConfigError("accounts must be an array");

    unordered_set<string> ids;
    for (size_t i = 0; i < root["accounts"].size(); ++i)
    {
        Account account = parseAccount(root["accounts"][i], i);

        if (!ids.insert(account.id).second)
            throw ConfigError("duplicate account id " + account.id);

        cfg.accounts.push_back(std::move(account));
    }

    const json &push = object(root, "push", "");
    cfg.push.enable = flag(push, "enable", true, "push");
    cfg.push.errorPushOnly = flag(push, "error_push_only", false, "push");

    if (push.contains("block_keys"))
    {
        if (!push["block_keys"].is_array())
            throw ConfigError("push.block_keys must be an array of strings");

        for (const auto &key : push["block_keys"])
        {
            if (!key.is_string())
                throw ConfigError("push.block_keys must be an array of strings");

            cfg.push.blockKeys.push_back(key.get<string>());
        }
    }

    if (push.contains("channels"))
    {
        if (!push["channels"].is_array())
            throw ConfigError("push.channels must be an array");

        cfg.channels = push["channels"];

        // Fail at load time rather than at the end of the run
        for (const auto &channel : cfg.channels)
        {
            try
            {
                makeChannel(channel, cfg.timeout);
            }
            catch (const invalid_argument &e)
            {
                throw ConfigError(string("push.channels: ") + e.what());
            }
        }
    }

    return cfg;
}

RunConfig parseConfig(const json &root)
{
    try
    {
        return parseRoot(root);
    }
    catch (const json::exception &e)
    {
        // Shape errors the explicit checks missed
        throw ConfigError(string("malformed configuration: ") + e.what());
    }
}

GameApiRegistry buildGameApis(const RunConfig &config)
{
    GameApiRegistry registry;

    for (const auto &[name, endpoint] : config.games)
        registry.add(name, make_shared<HttpGameApi>(endpoint, config.timeout));

    return registry;
}

PushNotifier buildNotifier(const RunConfig &config)
{
    PushNotifier notifier(config.push);

    for (const auto &channel : config.channels)
        notifier.addChannel(makeChannel(channel, config.timeout));

    return notifier;
}

void logElapsedTime(const string &label, chrono::steady_clock::time_point start, chrono::steady_clock::time_point end)
{
    auto elapsed = chrono::duration_cast<chrono::milliseconds>(end - start).count();

    Logger::dualSafeLog(label + ": " + to_string(elapsed / 1000) + "." + to_string((elapsed % 1000) / 100) + " seconds");
}
