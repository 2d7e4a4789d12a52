#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ResultAggregator.hh"

using namespace std;

// One configured delivery target; send() throws on failure
class NotificationChannel
{
public:
    virtual ~NotificationChannel() = default;

    virtual string name() const = 0;

    virtual void send(const string &title, const string &message) = 0;
};

struct ChannelOutcome
{
    string channel;
    bool delivered = false;
    string error;
};

struct PushOptions
{
    bool enable = true;
    // Skip delivery entirely when the run succeeded
    bool errorPushOnly = false;
    // Masked with '*' before anything leaves the process
    vector<string> blockKeys;
};

/*
Formats the final Report and hands it to every channel independently.
A failing channel is reported in its ChannelOutcome; it never prevents delivery to the others
and notify() itself never throws.
*/
class PushNotifier
{
public:
    explicit PushNotifier(PushOptions options = {});

    void addChannel(unique_ptr<NotificationChannel> channel);

    size_t channelCount() const { return channels.size(); }

    vector<ChannelOutcome> notify(const Report &report);

    string title(const Report &report) const;
    string format(const Report &report) const;

    static string maskBlockKeys(string text, const vector<string> &keys);

private:
    PushOptions options;
    vector<unique_ptr<NotificationChannel>> channels;
};
