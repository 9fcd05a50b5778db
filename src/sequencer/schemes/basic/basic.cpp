#include "basic.hpp"
#include "nowcast_config.hpp"

namespace nowcast
{

int BasicSequencer::history_window(const NowcastConfig& /*cfg*/) const
{
    return 2;
}

MotionField BasicSequencer::derive_motion(const std::vector<FieldGrid>& window,
                                          const NowcastConfig& cfg) const
{
    return temporal_motion(window, cfg.motion, 1.0);
}

}
