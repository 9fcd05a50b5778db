#pragma once

#include <memory>
#include <string>
#include <vector>

#include "field_grid.hpp"

/*This header file contains the base classes and structures for the blend module.
Pure advection cannot create new precipitation and loses skill with lead time.
The blend module mixes the advected field with a fallback field using a weight
that grows monotonically with lead time and stays within [0, 1].*/

namespace nowcast
{

/*Blend module configuration*/
struct BlendConfig
{
    std::string scheme_id = "exponential";  // weight curve: "exponential" or "linear"
    double half_life_s = 1800.0;            // lead time at which the exponential weight reaches one half [s]
    std::string fallback = "decay";         // "decay", "persistence" or "zero"
    int fallback_kernel = 9;                // smoothing width of the decay fallback [cells]
    double max_weight = 1.0;                // upper bound of the fallback weight
};

/*Abstract base class for blend weight curves*/
class BlendSchemeBase
{
public:
    virtual ~BlendSchemeBase() = default;

    virtual std::string name() const = 0;

    //Unscaled weight in [0, 1], non-decreasing in lead time
    virtual double weight(double lead_time_s, const BlendConfig& cfg) const = 0;
};

/**
 * @brief Fallback weight for a lead time, scaled by `max_weight`.
 *
 * Negative lead times are treated as zero.
 */
double blend_weight(double lead_time_s, const BlendConfig& cfg);

/**
 * @brief Mixes an advected grid with the configured fallback.
 * @param advected Extrapolated grid; its mask is kept unchanged.
 * @param lead_time_s Lead time of the frame [s].
 * @param cfg Blend configuration.
 * @param persistence Last observation, used by the persistence fallback.
 * When absent the decay fallback is used instead.
 * @return (1 - w) * advected + w * fallback on valid cells.
 */
FieldGrid blend(const FieldGrid& advected,
                double lead_time_s,
                const BlendConfig& cfg,
                const FieldGrid* persistence = nullptr);

// Factory and lookup functions
std::unique_ptr<BlendSchemeBase> create_blend_scheme(const std::string& scheme_name);
std::vector<std::string> get_available_blend_schemes();
std::vector<std::string> get_available_blend_fallbacks();

} // namespace nowcast
