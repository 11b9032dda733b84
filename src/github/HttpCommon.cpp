#include "HttpCommon.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <cctype>

namespace
{

inline void apply_common(cpr::Session& s, const civerify::github::SessionConfig& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ cfg.timeout_ms });
}

inline cpr::Header make_header(const std::vector<civerify::github::Header>& headers)
{
    cpr::Header h;
    for (const auto& kv : headers)
    {
        h.emplace(kv.name, kv.value);
    }
    return h;
}

inline std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

namespace civerify::github
{

HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers));
    apply_common(s, cfg);
    auto r = s.Get();
    HttpResponse hr;
    if (r.error)
    {
        hr.error = r.error.message.empty() ? std::string("request failed") : r.error.message;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);
    for (const auto& [name, value] : r.header)
    {
        hr.headers[to_lower(name)] = value;
    }
    return hr;
}

std::string url_escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size() * 3);
    const char* hex = "0123456789ABCDEF";
    for (unsigned char c : s)
    {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' ||
            c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

} // namespace civerify::github
