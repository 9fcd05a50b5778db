#include "linear.hpp"

#include <algorithm>

namespace nowcast
{

double LinearBlendScheme::weight(double lead_time_s, const BlendConfig& cfg) const
{
    if (lead_time_s <= 0.0 || cfg.half_life_s <= 0.0)
    {
        return 0.0;
    }
    return std::min(1.0, lead_time_s / (2.0 * cfg.half_life_s));
}

}
