// File: src/utils/StringUtils.cpp

#include "utils/StringUtils.hpp"

namespace StatTrack::Utils {

std::string escapeField(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        switch (c)
        {
            case '\\': out += "\\\\"; break;
            case '|':  out += "\\p";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            default:   out += c;      break;
        }
    }
    return out;
}

std::string unescapeField(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i)
    {
        const char c = s[i];
        if (c != '\\' || i + 1 >= s.size())
        {
            out += c;
            continue;
        }

        const char next = s[++i];
        switch (next)
        {
            case 'p': out += '|';  break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            default:  out += next; break;
        }
    }
    return out;
}

std::vector<std::string_view> splitRecord(std::string_view record)
{
    std::vector<std::string_view> fields;

    std::size_t start = 0;
    for (std::size_t i = 0; i < record.size(); ++i)
    {
        if (record[i] == '\\')
        {
            ++i; // skip the escaped character
            continue;
        }
        if (record[i] == '|')
        {
            fields.push_back(record.substr(start, i - start));
            start = i + 1;
        }
    }
    fields.push_back(record.substr(start));

    return fields;
}

std::uint64_t fnv1a64(std::string_view data) noexcept
{
    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : data)
    {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // namespace StatTrack::Utils
