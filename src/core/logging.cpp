/**
 * @file logging.cpp
 * @brief Log profile storage and parsing.
 */

#include "logging.hpp"
#include "string_utils.hpp"

namespace nowcast
{

LogProfile global_log_profile = LogProfile::normal;

/**
 * @brief Parses runtime logging profile from text.
 */
LogProfile parse_log_profile(const std::string& value, bool* valid)
{
    const std::string normalized = strutil::lower_copy(strutil::trim_copy(value));
    if (normalized == "quiet")
    {
        if (valid) *valid = true;
        return LogProfile::quiet;
    }
    if (normalized == "normal")
    {
        if (valid) *valid = true;
        return LogProfile::normal;
    }
    if (normalized == "debug")
    {
        if (valid) *valid = true;
        return LogProfile::debug;
    }

    if (valid) *valid = false;
    return LogProfile::normal;
}

} // namespace nowcast
