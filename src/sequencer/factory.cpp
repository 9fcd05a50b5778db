/**
 * @file factory.cpp
 * @brief Sequencing strategy factory.
 */

#include "sequencer_base.hpp"
#include "nowcast_errors.hpp"
#include "string_utils.hpp"
#include "schemes/advanced/advanced.hpp"
#include "schemes/basic/basic.hpp"

namespace nowcast
{

std::unique_ptr<ForecastSequencer> create_sequencer(const std::string& strategy)
{
    const std::string canonical = strutil::canonical_id(strategy);

    if (canonical == "basic" || canonical == "simple")
    {
        return std::make_unique<BasicSequencer>();
    }
    else if (canonical == "advanced")
    {
        return std::make_unique<AdvancedSequencer>();
    }
    else
    {
        throw ConfigurationError("Unknown forecast strategy: " + strategy);
    }
}

std::vector<std::string> get_available_sequencers()
{
    return {"basic", "advanced"};
}

}
