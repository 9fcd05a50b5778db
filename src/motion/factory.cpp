/**
 * @file factory.cpp
 * @brief Motion scheme factory.
 */

#include "motion_base.hpp"
#include "nowcast_errors.hpp"
#include "string_utils.hpp"
#include "schemes/block_match/block_match.hpp"
#include "schemes/global_translation/global_translation.hpp"
#include "schemes/persistence/persistence.hpp"

namespace nowcast
{

std::unique_ptr<MotionSchemeBase> create_motion_scheme(const std::string& scheme_name)
{
    const std::string canonical = strutil::canonical_id(scheme_name);

    if (canonical == "blockmatch" || canonical == "blockmatching")
    {
        return std::make_unique<BlockMatchScheme>();
    }
    else if (canonical == "globaltranslation" || canonical == "global")
    {
        return std::make_unique<GlobalTranslationScheme>();
    }
    else if (canonical == "persistence" || canonical == "none")
    {
        return std::make_unique<PersistenceMotionScheme>();
    }
    else
    {
        throw ConfigurationError("Unknown motion scheme: " + scheme_name);
    }
}

std::vector<std::string> get_available_motion_schemes()
{
    return {"block_match", "global_translation", "persistence"};
}

}
