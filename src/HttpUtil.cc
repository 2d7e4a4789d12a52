#include "HttpUtil.hh"

#include <cctype>
#include <iomanip>
#include <sstream>

optional<UrlParts> splitUrl(const string &url)
{
    size_t schemeEnd = url.find("://");
    if (schemeEnd == string::npos)
        return nullopt;

    string scheme = url.substr(0, schemeEnd);
    if (scheme != "http" && scheme != "https")
        return nullopt;

    size_t hostStart = schemeEnd + 3;
    size_t pathStart = url.find_first_of("/?", hostStart);

    UrlParts parts;
    parts.origin = url.substr(0, pathStart);

    if (pathStart != string::npos)
    {
        parts.path = url.substr(pathStart);
        if (parts.path[0] == '?')
            parts.path = "/" + parts.path;
    }

    if (parts.origin.size() == hostStart)
        return nullopt;

    return parts;
}

string urlEncode(const string &value)
{
    ostringstream oss;

    for (char c : value)
    {
        unsigned char uc = static_cast<unsigned char>(c);

        if (isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~')
            oss << c;
        else
            oss << '%' << uppercase << hex << setw(2) << setfill('0') << static_cast<int>(uc) << nouppercase << dec;
    }

    return oss.str();
}

string withQuery(const string &path, const httplib::Params &params)
{
    if (params.empty())
        return path;

    string out = path;
    char sep = path.find('?') == string::npos ? '?' : '&';

    for (const auto &[key, value] : params)
    {
        out += sep;
        out += urlEncode(key) + "=" + urlEncode(value);
        sep = '&';
    }

    return out;
}

string substitutePlaceholders(string text, const httplib::Params &values)
{
    for (const auto &[key, value] : values)
    {
        const string token = "{" + key + "}";
        size_t pos = 0;

        while ((pos = text.find(token, pos)) != string::npos)
        {
            text.replace(pos, token.size(), value);
            pos += value.size();
        }
    }

    return text;
}

json substituteTemplate(const json &tmpl, const httplib::Params &values)
{
    if (tmpl.is_string())
        return substitutePlaceholders(tmpl.get<string>(), values);

    if (tmpl.is_object())
    {
        json out = json::object();
        for (const auto &[key, value] : tmpl.items())
            out[key] = substituteTemplate(value, values);
        return out;
    }

    if (tmpl.is_array())
    {
        json out = json::array();
        for (const auto &value : tmpl)
            out.push_back(substituteTemplate(value, values));
        return out;
    }

    return tmpl;
}

void applyTimeout(httplib::Client &client, chrono::milliseconds timeout)
{
    time_t sec = static_cast<time_t>(timeout.count() / 1000);
    time_t usec = static_cast<time_t>((timeout.count() % 1000) * 1000);

    client.set_connection_timeout(sec, usec);
    client.set_read_timeout(sec, usec);
    client.set_write_timeout(sec, usec);
}

string describe(const httplib::Result &res)
{
    if (!res)
        return "transport error: " + httplib::to_string(res.error());

    return "HTTP " + to_string(res->status);
}
