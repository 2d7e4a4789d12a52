#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "PushNotifier.hh"

using namespace std;
using json = nlohmann::json;

// POST {"title", "message"} as JSON to an arbitrary url
class WebhookChannel : public NotificationChannel
{
public:
    WebhookChannel(string url, chrono::milliseconds timeout);

    string name() const override { return "webhook"; }
    void send(const string &title, const string &message) override;

private:
    string url;
    chrono::milliseconds timeout;
};

class GotifyChannel : public NotificationChannel
{
public:
    GotifyChannel(string apiUrl, string token, int priority, chrono::milliseconds timeout);

    string name() const override { return "gotify"; }
    void send(const string &title, const string &message) override;

private:
    string apiUrl;
    string token;
    int priority;
    chrono::milliseconds timeout;
};

class FeishuBotChannel : public NotificationChannel
{
public:
    FeishuBotChannel(string webhook, chrono::milliseconds timeout);

    string name() const override { return "feishubot"; }
    void send(const string &title, const string &message) override;

private:
    string webhook;
    chrono::milliseconds timeout;
};

class TelegramChannel : public NotificationChannel
{
public:
    TelegramChannel(string apiHost, string botToken, string chatId, chrono::milliseconds timeout);

    string name() const override { return "telegram"; }
    void send(const string &title, const string &message) override;

private:
    string apiHost;
    string botToken;
    string chatId;
    chrono::milliseconds timeout;
};

class BarkChannel : public NotificationChannel
{
public:
    BarkChannel(string apiUrl, string token, chrono::milliseconds timeout);

    string name() const override { return "bark"; }
    void send(const string &title, const string &message) override;

private:
    string apiUrl;
    string token;
    chrono::milliseconds timeout;
};

/*
Builds a channel from one entry of push.channels, e.g. {"type": "webhook", "url": "..."}.
Throws invalid_argument for unknown types or missing fields.
*/
unique_ptr<NotificationChannel> makeChannel(const json &settings, chrono::milliseconds timeout);
