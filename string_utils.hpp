#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

inline std::string trim(const std::string &s)
{
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return s.substr(begin, end - begin);
}

inline std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::string to_upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

inline bool starts_with(const std::string &s, const std::string &prefix)
{
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool contains(const std::string &s, const std::string &needle)
{
    return s.find(needle) != std::string::npos;
}

inline std::vector<std::string> split_lines(const std::string &s)
{
    std::vector<std::string> lines;
    std::istringstream in(s);
    std::string line;
    while (std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

// Whitespace separated fields
inline std::vector<std::string> split_fields(const std::string &s)
{
    std::vector<std::string> fields;
    std::istringstream in(s);
    std::string field;
    while (in >> field)
        fields.push_back(field);
    return fields;
}

inline std::vector<std::string> split(const std::string &s, char sep)
{
    std::vector<std::string> parts;
    std::string part;
    std::istringstream in(s);
    while (std::getline(in, part, sep))
        parts.push_back(part);
    if (!s.empty() && s.back() == sep)
        parts.push_back("");
    return parts;
}

// Splits "key<sep>value" at the first separator. Returns false if absent.
inline bool cut(const std::string &s, const std::string &sep, std::string &before, std::string &after)
{
    size_t pos = s.find(sep);
    if (pos == std::string::npos)
        return false;
    before = s.substr(0, pos);
    after = s.substr(pos + sep.size());
    return true;
}

#endif
