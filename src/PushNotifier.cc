#include "PushNotifier.hh"
#include "Logger.hh"

PushNotifier::PushNotifier(PushOptions pushOptions) : options(std::move(pushOptions)) {}

void PushNotifier::addChannel(unique_ptr<NotificationChannel> channel)
{
    channels.push_back(std::move(channel));
}

string PushNotifier::title(const Report &report) const
{
    return maskBlockKeys(runStatusTitle(report.status()), options.blockKeys);
}

string PushNotifier::format(const Report &report) const
{
    return maskBlockKeys(report.toText(), options.blockKeys);
}

vector<ChannelOutcome> PushNotifier::notify(const Report &report)
{
    vector<ChannelOutcome> outcomes;

    if (!options.enable)
    {
        Logger::dualSafeLog("Push disabled, skipping notification");
        return outcomes;
    }

    if (options.errorPushOnly && report.status() == RunStatus::Success)
    {
        Logger::dualSafeLog("Push only on errors and the run succeeded, skipping notification");
        return outcomes;
    }

    const string subject = title(report);
    const string message = format(report);

    for (auto &channel : channels)
    {
        ChannelOutcome outcome;
        outcome.channel = channel->name();

        auto start = chrono::steady_clock::now();

        try
        {
            channel->send(subject, message);
            outcome.delivered = true;
        }
        catch (const exception &e)
        {
            outcome.error = maskBlockKeys(e.what(), options.blockKeys);
        }

        int latency = static_cast<int>(chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start).count());

        if (outcome.delivered)
            Logger::log(LogLevel::Info, "push " + outcome.channel, "delivered", latency, 1);
        else
            Logger::log(LogLevel::Error, "push " + outcome.channel, "failed: " + outcome.error, latency, 1);

        outcomes.push_back(std::move(outcome));
    }

    return outcomes;
}

string PushNotifier::maskBlockKeys(string text, const vector<string> &keys)
{
    for (const string &key : keys)
    {
        if (key.empty())
            continue;

        const string mask(key.size(), '*');
        size_t pos = 0;

        while ((pos = text.find(key, pos)) != string::npos)
        {
            text.replace(pos, key.size(), mask);
            pos += mask.size();
        }
    }

    return text;
}
