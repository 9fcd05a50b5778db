/**
 * @file linear.hpp
 * @brief Linear ramp blend weight curve.
 *
 * w(t) = min(1, t / (2 * half_life)), matching the exponential curve at
 * one half-life and reaching the full fallback at two.
 */

#pragma once

#include "blend_base.hpp"

namespace nowcast
{

class LinearBlendScheme : public BlendSchemeBase
{
public:
    std::string name() const override { return "linear"; }

    double weight(double lead_time_s, const BlendConfig& cfg) const override;
};

}
