#pragma once

#include "advection.hpp"
#include "blend_base.hpp"
#include "field_validation.hpp"
#include "motion_base.hpp"
#include "sequencer_base.hpp"

/**
 * @file nowcast_config.hpp
 * @brief Aggregate configuration consumed by the forecast engine.
 *
 * Each member is owned by the module that reads it. Semantic checks live in
 * validate_nowcast_config so that an engine never starts from a malformed
 * configuration.
 */

namespace nowcast
{

struct NowcastConfig
{
    MotionConfig motion;
    AdvectionConfig advection;
    BlendConfig blend;
    SequencerConfig sequencer;
    ValidationPolicy validation;
    InputConfig input;
};

/**
 * @brief Checks value ranges and scheme names.
 *
 * Throws ConfigurationError naming the first offending key.
 */
void validate_nowcast_config(const NowcastConfig& cfg);

} // namespace nowcast
