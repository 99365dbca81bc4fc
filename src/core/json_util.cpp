#include "json_util.hpp"

#include <cstdlib>

namespace tessera::json
{

namespace
{

// Position just past the ':' following "key", or npos.
size_t value_pos(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return std::string::npos;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return std::string::npos;
    return json.find_first_not_of(" \t\n\r", pos + 1);
}

// Index of the bracket closing the one at `open`, skipping string contents.
size_t matching_bracket(const std::string& json, size_t open)
{
    char   open_c  = json[open];
    char   close_c = open_c == '[' ? ']' : '}';
    int    depth   = 0;
    bool   in_str  = false;
    for (size_t i = open; i < json.size(); ++i)
    {
        char c = json[i];
        if (in_str)
        {
            if (c == '\\')
                ++i;
            else if (c == '"')
                in_str = false;
            continue;
        }
        if (c == '"')
            in_str = true;
        else if (c == open_c)
            ++depth;
        else if (c == close_c && --depth == 0)
            return i;
    }
    return std::string::npos;
}

}   // namespace

std::string escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

std::string unescape(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] != '\\' || i + 1 == s.size())
        {
            out += s[i];
            continue;
        }
        char c = s[++i];
        switch (c)
        {
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            case 't':
                out += '\t';
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

std::optional<std::string> read_string(const std::string& json, const std::string& key)
{
    auto pos = value_pos(json, key);
    if (pos == std::string::npos || json[pos] != '"')
        return std::nullopt;
    size_t end = pos + 1;
    while (end < json.size())
    {
        if (json[end] == '\\')
        {
            end += 2;
            continue;
        }
        if (json[end] == '"')
            break;
        ++end;
    }
    if (end >= json.size())
        return std::nullopt;
    return unescape(json.substr(pos + 1, end - pos - 1));
}

std::optional<double> read_number(const std::string& json, const std::string& key)
{
    auto pos = value_pos(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    const char* begin = json.c_str() + pos;
    char*       end   = nullptr;
    double      v     = std::strtod(begin, &end);
    if (end == begin)
        return std::nullopt;
    return v;
}

std::optional<bool> read_bool(const std::string& json, const std::string& key)
{
    auto pos = value_pos(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    if (json.compare(pos, 4, "true") == 0)
        return true;
    if (json.compare(pos, 5, "false") == 0)
        return false;
    return std::nullopt;
}

std::vector<std::string> read_object_array(const std::string& json, const std::string& key)
{
    std::vector<std::string> objects;
    auto                     pos = value_pos(json, key);
    if (pos == std::string::npos || json[pos] != '[')
        return objects;
    size_t close = matching_bracket(json, pos);
    if (close == std::string::npos)
        return objects;

    for (size_t i = pos + 1; i < close; ++i)
    {
        if (json[i] != '{')
            continue;
        size_t obj_end = matching_bracket(json, i);
        if (obj_end == std::string::npos || obj_end > close)
            break;
        objects.push_back(json.substr(i, obj_end - i + 1));
        i = obj_end;
    }
    return objects;
}

std::string strip_array(const std::string& json, const std::string& key)
{
    auto pos = value_pos(json, key);
    if (pos == std::string::npos || json[pos] != '[')
        return json;
    size_t close = matching_bracket(json, pos);
    if (close == std::string::npos)
        return json;
    return json.substr(0, pos) + "[]" + json.substr(close + 1);
}

}   // namespace tessera::json
