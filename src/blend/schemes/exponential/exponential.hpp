/**
 * @file exponential.hpp
 * @brief Half-life blend weight curve.
 *
 * w(t) = 1 - 2^(-t / half_life): half of the forecast comes from the
 * fallback at one half-life, three quarters at two.
 */

#pragma once

#include "blend_base.hpp"

namespace nowcast
{

class ExponentialBlendScheme : public BlendSchemeBase
{
public:
    std::string name() const override { return "exponential"; }

    double weight(double lead_time_s, const BlendConfig& cfg) const override;
};

}
