#pragma once

#include <stdexcept>
#include <string>

/**
 * @file nowcast_errors.hpp
 * @brief Error taxonomy for forecast requests and configuration.
 *
 * Malformed configuration or requests raise ConfigurationError before any
 * numerical work starts. Degraded inputs never throw; they are reported
 * through forecast diagnostics instead.
 */

namespace nowcast
{

/**
 * @brief Fatal request or configuration error raised before computation.
 */
class ConfigurationError : public std::runtime_error
{
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

} // namespace nowcast
