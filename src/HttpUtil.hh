#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

using namespace std;
using json = nlohmann::json;

// "scheme://host[:port]" and the path + query that follows it
struct UrlParts
{
    string origin;
    string path = "/";
};

// nullopt when the url has no http(s) scheme or no host
optional<UrlParts> splitUrl(const string &url);

string urlEncode(const string &value);

// Appends params to path as an encoded query string
string withQuery(const string &path, const httplib::Params &params);

// Replaces every "{key}" in text with its value
string substitutePlaceholders(string text, const httplib::Params &values);

// Applies substitutePlaceholders to every string value of a JSON template, recursively
json substituteTemplate(const json &tmpl, const httplib::Params &values);

// Client with connect/read/write timeouts set from one network timeout
void applyTimeout(httplib::Client &client, chrono::milliseconds timeout);

string describe(const httplib::Result &res);
