#include "advanced.hpp"
#include "blend_base.hpp"
#include "nowcast_config.hpp"
#include "numerics/smoothing/smoothing_filter.hpp"

#include <algorithm>
#include <cmath>

namespace nowcast
{

int AdvancedSequencer::history_window(const NowcastConfig& cfg) const
{
    return std::max(cfg.sequencer.history_window, 2);
}

MotionField AdvancedSequencer::derive_motion(const std::vector<FieldGrid>& window,
                                             const NowcastConfig& cfg) const
{
    return temporal_motion(window, cfg.motion, cfg.sequencer.temporal_decay);
}

MotionField AdvancedSequencer::step_motion(const MotionField& initial,
                                           double t_mid_s,
                                           const NowcastConfig& cfg) const
{
    const double tau = cfg.sequencer.motion_decay_timescale_s;
    if (tau <= 0.0)
    {
        return initial;
    }
    return initial.scaled(std::exp(-t_mid_s / tau));
}

/**
 * @brief Splits the observation into {large scale, small-scale residual}.
 */
std::vector<FieldGrid> AdvancedSequencer::decompose(const FieldGrid& last,
                                                    const NowcastConfig& cfg) const
{
    Field2D large = last.values();
    const auto filter = create_smoothing_filter("box", cfg.sequencer.scale_kernel);
    filter->apply_2d(large, &last.valid_mask());

    Field2D small(last.rows(), last.cols(), 0.0f);
    const Mask2D& mask = last.valid_mask();
    const float* src = last.values().data();
    const float* pl = large.data();
    float* ps = small.data();
    for (std::size_t i = 0; i < small.size(); ++i)
    {
        if (mask[i])
        {
            ps[i] = src[i] - pl[i];
        }
    }

    std::vector<FieldGrid> out;
    out.reserve(2);
    out.emplace_back(last.geometry(), last.timestamp_s(), std::move(large), mask);
    out.emplace_back(last.geometry(), last.timestamp_s(), std::move(small), mask);
    return out;
}

FieldGrid AdvancedSequencer::compose(const std::vector<FieldGrid>& components,
                                     double lead_time_s,
                                     const NowcastConfig& cfg) const
{
    const FieldGrid& large = components[0];
    const FieldGrid& small = components[1];
    const double lifetime = cfg.sequencer.small_scale_lifetime_s;
    const double damping = lifetime > 0.0 ? std::exp(-lead_time_s / lifetime) : 0.0;

    Field2D values(large.rows(), large.cols(), 0.0f);
    Mask2D mask(values.size(), 0);
    const float* pl = large.values().data();
    const float* ps = small.values().data();
    const Mask2D& ml = large.valid_mask();
    const Mask2D& ms = small.valid_mask();
    float* dst = values.data();
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        if (ml[i] && ms[i])
        {
            dst[i] = static_cast<float>(pl[i] + damping * ps[i]);
            mask[i] = 1;
        }
    }
    return FieldGrid(large.geometry(), large.timestamp_s(), std::move(values), std::move(mask));
}

FieldGrid AdvancedSequencer::finalize(const FieldGrid& frame,
                                      double lead_time_s,
                                      const FieldGrid& last,
                                      const NowcastConfig& cfg) const
{
    return blend(frame, lead_time_s, cfg.blend, &last);
}

}
