#pragma once

#include <map>
#include <string>
#include <vector>

namespace civerify::github
{

struct Header
{
    std::string name;
    std::string value;
};

struct SessionConfig
{
    int connect_timeout_ms = 10000;
    int timeout_ms = 30000;
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error; // non-empty on network/transport errors
    std::map<std::string, std::string> headers; // lower-cased names

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }

    std::string header(const std::string& lowerName) const
    {
        auto it = headers.find(lowerName);
        return it == headers.end() ? std::string() : it->second;
    }
};

// Simple GET helper
HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg);

// RFC 3986 percent-encoding of everything outside the unreserved set
std::string url_escape(const std::string& s);

} // namespace civerify::github
