#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <string_view>

/**
 * @file string_utils.hpp
 * @brief Lightweight string helpers shared by runtime parsing utilities.
 *
 * Provides case normalization, trimming, scheme-id canonicalization,
 * boolean parsing, and JSON escaping.
 * Functions are header-inline because they are small and reused in
 * configuration, factory, and report code paths.
 */

namespace nowcast
{
namespace strutil
{

/**
 * @brief Returns a lowercase copy of the input string.
 * @param value Source string view.
 * @return Lowercased string.
 */
inline std::string lower_copy(std::string_view value)
{
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c)
    {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/**
 * @brief Returns a copy with leading and trailing whitespace removed.
 */
inline std::string trim_copy(std::string_view value)
{
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])))
    {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])))
    {
        --end;
    }
    return std::string(value.substr(begin, end - begin));
}

/**
 * @brief Normalizes a scheme identifier for factory lookup.
 *
 * Drops separators and whitespace and lowercases, so "Block-Match",
 * "block_match" and "blockmatch" resolve to the same scheme.
 */
inline std::string canonical_id(std::string_view value)
{
    std::string canonical;
    canonical.reserve(value.size());
    for (unsigned char c : value)
    {
        if (c == '_' || c == '-' || std::isspace(c))
        {
            continue;
        }
        canonical.push_back(static_cast<char>(std::tolower(c)));
    }
    return canonical;
}

/**
 * @brief Parses common truthy boolean spellings.
 * @param value Input string view.
 * @return True for 1/true/yes/on (case-insensitive), false otherwise.
 */
inline bool parse_bool(std::string_view value)
{
    const std::string normalized = lower_copy(trim_copy(value));
    return normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on";
}

/**
 * @brief Escapes control characters for safe JSON string emission.
 * @param value Input string view.
 * @return Escaped JSON-safe string.
 */
inline std::string json_escape(std::string_view value)
{
    std::ostringstream oss;
    for (char c : value)
    {
        switch (c)
        {
            case '\\': oss << "\\\\"; break;
            case '"': oss << "\\\""; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default: oss << c; break;
        }
    }
    return oss.str();
}

} // namespace strutil
} // namespace nowcast
