/**
 * @file advanced.hpp
 * @brief Multi-frame, multi-scale extrapolation strategy.
 *
 * - Motion is a decay-weighted combination of pair estimates over the
 *   configured history window and slows down with lead time.
 * - The last observation is split into a smooth large-scale part and a
 *   small-scale residual. Both are advected; the residual loses amplitude
 *   with its own lifetime, since small features are the least predictable.
 * - Every output frame is blended toward the configured fallback. The
 *   propagated state stays unblended so that blending does not compound.
 */

#pragma once

#include "sequencer_base.hpp"

namespace nowcast
{

class AdvancedSequencer : public ForecastSequencer
{
public:
    std::string name() const override { return "advanced"; }

protected:
    int history_window(const NowcastConfig& cfg) const override;

    MotionField derive_motion(const std::vector<FieldGrid>& window,
                              const NowcastConfig& cfg) const override;

    MotionField step_motion(const MotionField& initial,
                            double t_mid_s,
                            const NowcastConfig& cfg) const override;

    std::vector<FieldGrid> decompose(const FieldGrid& last,
                                     const NowcastConfig& cfg) const override;

    FieldGrid compose(const std::vector<FieldGrid>& components,
                      double lead_time_s,
                      const NowcastConfig& cfg) const override;

    FieldGrid finalize(const FieldGrid& frame,
                       double lead_time_s,
                       const FieldGrid& last,
                       const NowcastConfig& cfg) const override;
};

}
