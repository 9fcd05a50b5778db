#include "exponential.hpp"

#include <algorithm>
#include <cmath>

namespace nowcast
{

double ExponentialBlendScheme::weight(double lead_time_s, const BlendConfig& cfg) const
{
    if (lead_time_s <= 0.0 || cfg.half_life_s <= 0.0)
    {
        return 0.0;
    }
    const double w = 1.0 - std::exp2(-lead_time_s / cfg.half_life_s);
    return std::clamp(w, 0.0, 1.0);
}

}
