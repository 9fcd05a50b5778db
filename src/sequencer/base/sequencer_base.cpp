/**
 * @file sequencer_base.cpp
 * @brief Forecast loop and primitives shared by all sequencing strategies.
 *
 * Lead times are processed in ascending order of unique values. Each step
 * advects the propagated state from the previous lead time, so one motion
 * field and one advection routine serve every strategy.
 */

#include "sequencer_base.hpp"
#include "blend_base.hpp"
#include "logging.hpp"
#include "nowcast_config.hpp"
#include "nowcast_errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace nowcast
{

namespace
{

constexpr double kLowConfidenceBase = 0.2;
constexpr double kIrregularSpacingTolerance = 0.1;

struct SpacingStats
{
    double mean_interval_s = 0.0;
    double relative_spread = 0.0;
    bool irregular = false;
};

SpacingStats spacing_stats(const std::vector<FieldGrid>& window)
{
    SpacingStats out;
    if (window.size() < 2)
    {
        return out;
    }

    double lo = 0.0;
    double hi = 0.0;
    double sum = 0.0;
    for (std::size_t i = 1; i < window.size(); ++i)
    {
        const double interval = window[i].timestamp_s() - window[i - 1].timestamp_s();
        if (i == 1)
        {
            lo = hi = interval;
        }
        lo = std::min(lo, interval);
        hi = std::max(hi, interval);
        sum += interval;
    }
    out.mean_interval_s = sum / static_cast<double>(window.size() - 1);
    if (out.mean_interval_s > 0.0)
    {
        out.relative_spread = (hi - lo) / out.mean_interval_s;
    }
    out.irregular = out.relative_spread > kIrregularSpacingTolerance;
    return out;
}

FieldGrid clamp_to_range(const FieldGrid& grid, float lo, float hi)
{
    Field2D values = grid.values();
    float* v = values.data();
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        v[i] = std::clamp(v[i], lo, hi);
    }
    return FieldGrid(grid.geometry(), grid.timestamp_s(), std::move(values), grid.valid_mask());
}

}

MotionField ForecastSequencer::temporal_motion(const std::vector<FieldGrid>& window,
                                               const MotionConfig& cfg,
                                               double decay)
{
    if (window.size() < 2)
    {
        const int rows = window.empty() ? 0 : window.front().rows();
        const int cols = window.empty() ? 0 : window.front().cols();
        return MotionField::zero(rows, cols);
    }

    // pairs[k] is the k-th most recent frame pair
    std::vector<MotionField> pairs;
    pairs.reserve(window.size() - 1);
    for (std::size_t i = window.size() - 1; i >= 1; --i)
    {
        pairs.push_back(estimate_motion(window[i - 1], window[i], cfg));
    }

    std::vector<double> weights(pairs.size(), 0.0);
    double weight_sum = 0.0;
    std::size_t confident = 0;
    for (std::size_t k = 0; k < pairs.size(); ++k)
    {
        if (pairs[k].low_confidence)
        {
            continue;
        }
        weights[k] = std::pow(decay, static_cast<double>(k)) * std::max(pairs[k].quality, 1.0e-6);
        weight_sum += weights[k];
        ++confident;
    }

    if (log_debug_enabled())
    {
        std::cout << "[sequencer] temporal motion: pairs=" << pairs.size()
                  << " confident=" << confident << std::endl;
    }

    if (confident == 0 || weight_sum <= 0.0)
    {
        return pairs.front();
    }
    if (confident == 1)
    {
        for (const MotionField& pair : pairs)
        {
            if (!pair.low_confidence)
            {
                return pair;
            }
        }
    }

    const MotionField& latest = pairs.front();
    MotionField out = MotionField::zero(latest.rows, latest.cols, latest.interval_s);
    out.valid_fraction = latest.valid_fraction;
    out.low_confidence = false;

    double quality = 0.0;
    for (std::size_t k = 0; k < pairs.size(); ++k)
    {
        quality += weights[k] * pairs[k].quality;
    }
    out.quality = quality / weight_sum;

    #pragma omp parallel for schedule(static)
    for (int r = 0; r < out.rows; ++r)
    {
        for (int c = 0; c < out.cols; ++c)
        {
            const std::size_t idx = static_cast<std::size_t>(r) * static_cast<std::size_t>(out.cols) +
                                    static_cast<std::size_t>(c);
            double su = 0.0;
            double sv = 0.0;
            std::uint8_t direct = 0;
            for (std::size_t k = 0; k < pairs.size(); ++k)
            {
                if (weights[k] <= 0.0)
                {
                    continue;
                }
                su += weights[k] * pairs[k].u(r, c);
                sv += weights[k] * pairs[k].v(r, c);
                direct = static_cast<std::uint8_t>(direct | pairs[k].valid[idx]);
            }
            out.u(r, c) = static_cast<float>(su / weight_sum);
            out.v(r, c) = static_cast<float>(sv / weight_sum);
            out.valid[idx] = direct;
        }
    }
    return out;
}

MotionField ForecastSequencer::step_motion(const MotionField& initial,
                                           double /*t_mid_s*/,
                                           const NowcastConfig& /*cfg*/) const
{
    return initial;
}

std::vector<FieldGrid> ForecastSequencer::decompose(const FieldGrid& last,
                                                    const NowcastConfig& /*cfg*/) const
{
    return {last};
}

FieldGrid ForecastSequencer::compose(const std::vector<FieldGrid>& components,
                                     double /*lead_time_s*/,
                                     const NowcastConfig& /*cfg*/) const
{
    return components.front();
}

FieldGrid ForecastSequencer::finalize(const FieldGrid& frame,
                                      double /*lead_time_s*/,
                                      const FieldGrid& /*last*/,
                                      const NowcastConfig& /*cfg*/) const
{
    return frame;
}

std::vector<ForecastFrame> ForecastSequencer::forecast(const std::vector<FieldGrid>& history,
                                                       const std::vector<double>& lead_times_s,
                                                       const NowcastConfig& cfg,
                                                       const FrameObserver& observer,
                                                       SequencerDiagnostics* diagnostics) const
{
    if (history.empty())
    {
        throw ConfigurationError("Forecast history is empty");
    }

    const FieldGrid& last = history.back();
    const std::size_t window_size = static_cast<std::size_t>(
        std::clamp<int>(history_window(cfg), 1, static_cast<int>(history.size())));
    const std::vector<FieldGrid> window(history.end() - static_cast<std::ptrdiff_t>(window_size), history.end());
    const SpacingStats spacing = spacing_stats(window);

    std::vector<double> leads = lead_times_s;
    std::sort(leads.begin(), leads.end());
    leads.erase(std::unique(leads.begin(), leads.end()), leads.end());

    const bool fully_masked = last.valid_count() == 0;
    MotionField motion = MotionField::zero(last.rows(), last.cols());
    if (!fully_masked && window.size() >= 2)
    {
        motion = derive_motion(window, cfg);
    }

    double base_confidence = 0.0;
    if (!fully_masked && last.echo_count(cfg.motion.signal_threshold) > 0)
    {
        base_confidence = motion.low_confidence ? kLowConfidenceBase : std::clamp(motion.quality, 0.0, 1.0);
    }
    if (spacing.irregular)
    {
        base_confidence /= (1.0 + spacing.relative_spread);
    }

    float lo = 0.0f;
    float hi = 0.0f;
    const bool has_range = last.value_range(lo, hi);

    SequencerDiagnostics diag;
    diag.mean_flow_cells_per_s = motion.mean_speed_cells_per_s();
    diag.max_flow_cells_per_s = motion.max_speed_cells_per_s();
    diag.motion_valid_fraction = motion.valid_fraction;
    diag.motion_quality = motion.quality;
    diag.low_confidence = motion.low_confidence || base_confidence <= 0.0;
    diag.irregular_spacing = spacing.irregular;
    diag.relative_spacing_spread = spacing.relative_spread;
    diag.mean_interval_s = spacing.mean_interval_s;
    diag.frames_used = static_cast<int>(window_size);
    diag.base_confidence = base_confidence;

    std::vector<FieldGrid> state;
    if (!fully_masked)
    {
        state = decompose(last, cfg);
    }

    std::vector<ForecastFrame> produced;
    produced.reserve(leads.size());
    double prev_t = 0.0;

    for (double t : leads)
    {
        ForecastFrame frame;
        frame.lead_time_s = t;
        frame.confidence = base_confidence * (1.0 - blend_weight(t, cfg.blend));

        if (fully_masked)
        {
            frame.grid = FieldGrid::no_data(last.geometry(), last.timestamp_s() + t);
        }
        else
        {
            const double dt = t - prev_t;
            const MotionField step = step_motion(motion, prev_t + 0.5 * dt, cfg);
            for (FieldGrid& component : state)
            {
                AdvectionDiagnostics adv;
                component = advect(component, step, dt, cfg.advection, &adv);
                diag.max_substeps = std::max(diag.max_substeps, adv.substeps);
            }

            FieldGrid out = finalize(compose(state, t, cfg), t, last, cfg);
            if (cfg.sequencer.clamp_to_observed_range && has_range)
            {
                out = clamp_to_range(out, lo, hi);
            }
            frame.grid = out.retimed(last.timestamp_s() + t);
        }
        prev_t = t;

        if (log_debug_enabled())
        {
            std::cout << "[sequencer] " << name() << " lead=" << t << " s valid="
                      << frame.grid.valid_count() << "/" << frame.grid.cell_count()
                      << " confidence=" << frame.confidence << std::endl;
        }

        produced.push_back(std::move(frame));
        if (observer && !observer(produced.back()))
        {
            diag.cancelled = true;
            break;
        }
    }

    std::vector<ForecastFrame> out;
    out.reserve(lead_times_s.size());
    for (double requested : lead_times_s)
    {
        const auto it = std::lower_bound(leads.begin(), leads.end(), requested);
        const std::size_t idx = static_cast<std::size_t>(it - leads.begin());
        if (idx < produced.size())
        {
            out.push_back(produced[idx]);
        }
    }

    if (diagnostics)
    {
        *diagnostics = diag;
    }
    return out;
}

}
