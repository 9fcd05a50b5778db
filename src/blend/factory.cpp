/**
 * @file factory.cpp
 * @brief Blend weight scheme factory.
 */

#include "blend_base.hpp"
#include "nowcast_errors.hpp"
#include "string_utils.hpp"
#include "schemes/exponential/exponential.hpp"
#include "schemes/linear/linear.hpp"

namespace nowcast
{

std::unique_ptr<BlendSchemeBase> create_blend_scheme(const std::string& scheme_name)
{
    const std::string canonical = strutil::canonical_id(scheme_name);

    if (canonical == "exponential" || canonical == "halflife")
    {
        return std::make_unique<ExponentialBlendScheme>();
    }
    else if (canonical == "linear")
    {
        return std::make_unique<LinearBlendScheme>();
    }
    else
    {
        throw ConfigurationError("Unknown blend scheme: " + scheme_name);
    }
}

std::vector<std::string> get_available_blend_schemes()
{
    return {"exponential", "linear"};
}

std::vector<std::string> get_available_blend_fallbacks()
{
    return {"decay", "persistence", "zero"};
}

}
