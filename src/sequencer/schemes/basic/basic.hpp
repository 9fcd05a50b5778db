/**
 * @file basic.hpp
 * @brief Frozen-motion extrapolation strategy.
 *
 * Motion is estimated once from the two most recent frames and applied
 * unchanged at every lead time. Frames are not blended.
 */

#pragma once

#include "sequencer_base.hpp"

namespace nowcast
{

class BasicSequencer : public ForecastSequencer
{
public:
    std::string name() const override { return "basic"; }

protected:
    int history_window(const NowcastConfig& cfg) const override;

    MotionField derive_motion(const std::vector<FieldGrid>& window,
                              const NowcastConfig& cfg) const override;
};

}
