#include "NotificationChannels.hh"
#include "HttpUtil.hh"

#include <stdexcept>

namespace
{
    httplib::Client openClient(const UrlParts &parts, chrono::milliseconds timeout)
    {
        httplib::Client client(parts.origin);
        if (!client.is_valid())
            throw runtime_error("unsupported url " + parts.origin);

        applyTimeout(client, timeout);
        return client;
    }

    UrlParts parse(const string &url)
    {
        auto parts = splitUrl(url);
        if (!parts)
            throw runtime_error("invalid url " + url);

        return *parts;
    }

    // Throws unless the server answered 2xx
    string check(const httplib::Result &res)
    {
        if (!res)
            throw runtime_error(describe(res));

        if (res->status < 200 || res->status >= 300)
            throw runtime_error(describe(res) + " " + res->body.substr(0, 200));

        return res->body;
    }

    string postJson(const string &url, const json &body, chrono::milliseconds timeout)
    {
        UrlParts parts = parse(url);
        httplib::Client client = openClient(parts, timeout);
        return check(client.Post(parts.path, body.dump(), "application/json; charset=utf-8"));
    }

    string required(const json &settings, const string &key)
    {
        if (!settings.contains(key) || !settings[key].is_string() || settings[key].get<string>().empty())
            throw invalid_argument("channel '" + settings.value("type", string("?")) + "' needs a non-empty \"" + key + "\"");

        return settings[key].get<string>();
    }
}

WebhookChannel::WebhookChannel(string webhookUrl, chrono::milliseconds networkTimeout)
    : url(std::move(webhookUrl)), timeout(networkTimeout) {}

void WebhookChannel::send(const string &title, const string &message)
{
    postJson(url, {{"title", title}, {"message", message}}, timeout);
}

GotifyChannel::GotifyChannel(string api, string appToken, int messagePriority, chrono::milliseconds networkTimeout)
    : apiUrl(std::move(api)), token(std::move(appToken)), priority(messagePriority), timeout(networkTimeout) {}

void GotifyChannel::send(const string &title, const string &message)
{
    string base = apiUrl;
    if (!base.empty() && base.back() == '/')
        base.pop_back();

    postJson(base + "/message?token=" + urlEncode(token),
             {{"title", title}, {"message", title + "\n\n" + message}, {"priority", priority}},
             timeout);
}

FeishuBotChannel::FeishuBotChannel(string hook, chrono::milliseconds networkTimeout)
    : webhook(std::move(hook)), timeout(networkTimeout) {}

void FeishuBotChannel::send(const string &title, const string &message)
{
    string body = postJson(webhook,
                           {{"msg_type", "text"}, {"content", {{"text", title + "\n\n" + message}}}},
                           timeout);

    // The bot answers 200 with an error code in the body
    json answer = json::parse(body, nullptr, false);
    if (answer.is_object())
    {
        int code = answer.value("code", answer.value("StatusCode", 0));
        if (code != 0)
            throw runtime_error("feishu returned code " + to_string(code) + ": " + answer.value("msg", string("")));
    }
}

TelegramChannel::TelegramChannel(string host, string token, string chat, chrono::milliseconds networkTimeout)
    : apiHost(std::move(host)), botToken(std::move(token)), chatId(std::move(chat)), timeout(networkTimeout) {}

void TelegramChannel::send(const string &title, const string &message)
{
    string base = apiHost.find("://") == string::npos ? "https://" + apiHost : apiHost;
    UrlParts parts = parse(base);
    httplib::Client client = openClient(parts, timeout);

    string prefix = parts.path == "/" ? "" : parts.path;
    httplib::Params form = {{"chat_id", chatId}, {"text", title + "\n\n" + message}};

    check(client.Post(prefix + "/bot" + botToken + "/sendMessage", form));
}

BarkChannel::BarkChannel(string api, string deviceToken, chrono::milliseconds networkTimeout)
    : apiUrl(std::move(api)), token(std::move(deviceToken)), timeout(networkTimeout) {}

void BarkChannel::send(const string &title, const string &message)
{
    UrlParts parts = parse(apiUrl);
    httplib::Client client = openClient(parts, timeout);

    string prefix = parts.path == "/" ? "" : parts.path;
    if (!prefix.empty() && prefix.back() == '/')
        prefix.pop_back();

    check(client.Get(prefix + "/" + urlEncode(token) + "/" + urlEncode(title) + "/" + urlEncode(message)));
}

unique_ptr<NotificationChannel> makeChannel(const json &settings, chrono::milliseconds timeout)
{
    if (!settings.is_object())
        throw invalid_argument("channel entry must be an object");

    if (settings.contains("type") && !settings["type"].is_string())
        throw invalid_argument("channel \"type\" must be a string");

    string type = settings.value("type", string(""));

    if (type == "webhook")
        return make_unique<WebhookChannel>(required(settings, "url"), timeout);

    if (type == "gotify")
    {
        if (settings.contains("priority") && !settings["priority"].is_number_integer())
            throw invalid_argument("channel 'gotify' needs an integer \"priority\"");

        return make_unique<GotifyChannel>(required(settings, "api_url"), required(settings, "token"),
                                          settings.value("priority", 5), timeout);
    }

    if (type == "feishubot")
        return make_unique<FeishuBotChannel>(required(settings, "webhook"), timeout);

    if (type == "telegram")
        return make_unique<TelegramChannel>(settings.value("api_url", string("api.telegram.org")),
                                            required(settings, "bot_token"), required(settings, "chat_id"), timeout);

    if (type == "bark")
        return make_unique<BarkChannel>(required(settings, "api_url"), required(settings, "token"), timeout);

    throw invalid_argument("unknown push channel type '" + type + "'");
}
