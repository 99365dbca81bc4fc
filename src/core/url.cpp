#include "url.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>

namespace tessera
{

namespace
{

constexpr std::array<std::string_view, 11> AUTH_HOST_PATTERNS = {
    "accounts.google.com",
    "accounts.youtube.com",
    "github.com/login",
    "login.microsoftonline.com",
    "login.microsoft.com",
    "login.live.com",
    "facebook.com/login",
    "facebook.com/dialog/oauth",
    "twitter.com/oauth",
    "x.com/oauth",
    "linkedin.com/oauth",
};

constexpr std::array<std::string_view, 6> AUTH_PATH_PATTERNS = {
    "/oauth/",
    "/auth/",
    "/signin",
    "/login",
    "/sso/",
    "storagerelay://",
};

constexpr std::array<std::string_view, 4> AUTH_QUERY_PARAMS = {
    "client_id",
    "redirect_uri",
    "response_type",
    "scope",
};

std::string to_lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(),
                   out.end(),
                   out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_scheme_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

// True if `query` (without the leading '?') contains `name` as a parameter key.
bool query_has_param(std::string_view query, std::string_view name)
{
    size_t pos = 0;
    while (pos <= query.size())
    {
        size_t amp = query.find('&', pos);
        if (amp == std::string_view::npos)
            amp = query.size();
        std::string_view pair = query.substr(pos, amp - pos);
        std::string_view key  = pair.substr(0, pair.find('='));
        if (key == name)
            return true;
        pos = amp + 1;
    }
    return false;
}

}   // namespace

std::string_view trim(std::string_view s)
{
    const char* ws    = " \t\n\r\f\v";
    size_t      first = s.find_first_not_of(ws);
    if (first == std::string_view::npos)
        return {};
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

bool has_url_scheme(std::string_view input)
{
    std::string lower = to_lower(input.substr(0, 16));
    if (lower.starts_with("about:") || lower.starts_with("data:")
        || lower.starts_with("view-source:"))
        return true;

    size_t sep = input.find("://");
    if (sep == std::string_view::npos || sep == 0)
        return false;
    if (!std::isalpha(static_cast<unsigned char>(input[0])))
        return false;
    return std::all_of(input.begin(), input.begin() + sep, is_scheme_char);
}

bool is_local_file_path(std::string_view input)
{
    if (input.starts_with('/') || input.starts_with("~/"))
        return true;
    // C:\ or C:/
    return input.size() >= 3 && std::isalpha(static_cast<unsigned char>(input[0]))
           && input[1] == ':' && (input[2] == '\\' || input[2] == '/');
}

std::optional<std::string> normalize_url(std::string_view input)
{
    std::string_view url = trim(input);
    if (url.empty())
        return std::nullopt;

    if (has_url_scheme(url))
        return std::string(url);

    if (is_local_file_path(url))
    {
        if (url.starts_with("~/"))
        {
            const char* home = std::getenv("HOME");
            std::string base = home ? home : "";
            return "file://" + base + std::string(url.substr(1));
        }
        if (url.starts_with('/'))
            return "file://" + std::string(url);

        std::string path(url);
        std::replace(path.begin(), path.end(), '\\', '/');
        return "file:///" + path;
    }

    return "https://" + std::string(url);
}

bool is_authentication_url(std::string_view url)
{
    std::string lower = to_lower(url);

    for (auto pattern : AUTH_HOST_PATTERNS)
    {
        if (lower.find(pattern) != std::string::npos)
            return true;
    }
    for (auto pattern : AUTH_PATH_PATTERNS)
    {
        if (lower.find(pattern) != std::string::npos)
            return true;
    }

    size_t q = lower.find('?');
    if (q != std::string::npos)
    {
        std::string_view query(lower);
        query = query.substr(q + 1);
        query = query.substr(0, query.find('#'));
        for (auto param : AUTH_QUERY_PARAMS)
        {
            if (query_has_param(query, param))
                return true;
        }
    }
    return false;
}

}   // namespace tessera
