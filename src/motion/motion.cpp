/**
 * @file motion.cpp
 * @brief Motion field helpers and the estimate_motion entry point.
 *
 * Wraps the configured displacement scheme with the checks shared by every
 * scheme: geometry agreement, frame interval, and the sparse-echo fallback.
 */

#include "motion_base.hpp"
#include "logging.hpp"
#include "nowcast_errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

namespace nowcast
{

MotionField MotionField::zero(int rows, int cols, double interval_s)
{
    MotionField out;
    out.rows = rows;
    out.cols = cols;
    out.u.resize(rows, cols, 0.0f);
    out.v.resize(rows, cols, 0.0f);
    out.valid.assign(out.u.size(), 0);
    out.low_confidence = true;
    out.interval_s = interval_s;
    return out;
}

MotionField MotionField::scaled(double factor) const
{
    MotionField out(*this);
    float* pu = out.u.data();
    float* pv = out.v.data();
    const float f = static_cast<float>(factor);
    for (std::size_t i = 0; i < out.u.size(); ++i)
    {
        pu[i] *= f;
        pv[i] *= f;
    }
    return out;
}

double MotionField::max_speed_cells_per_s() const
{
    double max_speed = 0.0;
    const float* pu = u.data();
    const float* pv = v.data();
    for (std::size_t i = 0; i < u.size(); ++i)
    {
        max_speed = std::max(max_speed, std::hypot(static_cast<double>(pu[i]), static_cast<double>(pv[i])));
    }
    return max_speed;
}

double MotionField::mean_speed_cells_per_s() const
{
    if (u.empty())
    {
        return 0.0;
    }

    // Row partial sums reduced serially keep the result thread-count independent.
    std::vector<double> row_sums(static_cast<std::size_t>(rows), 0.0);
    #pragma omp parallel for schedule(static)
    for (int r = 0; r < rows; ++r)
    {
        double sum = 0.0;
        for (int c = 0; c < cols; ++c)
        {
            sum += std::hypot(static_cast<double>(u(r, c)), static_cast<double>(v(r, c)));
        }
        row_sums[static_cast<std::size_t>(r)] = sum;
    }

    double total = 0.0;
    for (double s : row_sums)
    {
        total += s;
    }
    return total / static_cast<double>(u.size());
}

double MotionField::direct_fraction() const
{
    if (valid.empty())
    {
        return 0.0;
    }
    const auto direct = std::count(valid.begin(), valid.end(), std::uint8_t{1});
    return static_cast<double>(direct) / static_cast<double>(valid.size());
}

double jointly_valid_fraction(const FieldGrid& prev, const FieldGrid& curr, float signal_threshold)
{
    const std::size_t n = prev.cell_count();
    if (n == 0 || curr.cell_count() != n)
    {
        return 0.0;
    }

    const Mask2D& mp = prev.valid_mask();
    const Mask2D& mc = curr.valid_mask();
    const float* vp = prev.values().data();
    const float* vc = curr.values().data();

    std::size_t count = 0;
    for (std::size_t i = 0; i < n; ++i)
    {
        if (mp[i] && mc[i] && (vp[i] >= signal_threshold || vc[i] >= signal_threshold))
        {
            ++count;
        }
    }
    return static_cast<double>(count) / static_cast<double>(n);
}

MotionField estimate_motion(const FieldGrid& prev, const FieldGrid& curr, const MotionConfig& cfg)
{
    if (!prev.geometry().compatible_with(curr.geometry()))
    {
        throw ConfigurationError("Motion estimation requires matching grids: " +
                                 prev.geometry().describe() + " vs " + curr.geometry().describe());
    }

    const double interval_s = curr.timestamp_s() - prev.timestamp_s();
    if (!(interval_s > 0.0))
    {
        throw ConfigurationError("Motion estimation requires increasing timestamps");
    }

    const double valid_fraction = jointly_valid_fraction(prev, curr, cfg.signal_threshold);
    if (valid_fraction < cfg.min_valid_fraction)
    {
        if (log_debug_enabled())
        {
            std::cout << "[motion] jointly-valid fraction " << valid_fraction
                      << " below " << cfg.min_valid_fraction << ", using zero motion" << std::endl;
        }
        MotionField out = MotionField::zero(prev.rows(), prev.cols(), interval_s);
        out.valid_fraction = valid_fraction;
        return out;
    }

    const auto scheme = create_motion_scheme(cfg.scheme_id);
    DisplacementEstimate est = scheme->estimate_displacement(prev, curr, cfg);

    MotionField out = MotionField::zero(prev.rows(), prev.cols(), interval_s);
    out.valid_fraction = valid_fraction;
    if (!est.any_valid)
    {
        if (log_debug_enabled())
        {
            std::cout << "[motion] " << scheme->name() << " found no reliable block, using zero motion" << std::endl;
        }
        return out;
    }

    const float inv_dt = static_cast<float>(1.0 / interval_s);
    const float* pdx = est.dx.data();
    const float* pdy = est.dy.data();
    float* pu = out.u.data();
    float* pv = out.v.data();
    for (std::size_t i = 0; i < out.u.size(); ++i)
    {
        pu[i] = pdx[i] * inv_dt;
        pv[i] = pdy[i] * inv_dt;
    }
    out.valid = std::move(est.direct);
    out.quality = est.quality;
    out.low_confidence = est.quality < cfg.min_correlation;

    if (log_debug_enabled())
    {
        std::cout << "[motion] " << scheme->name() << ": quality=" << out.quality
                  << " direct=" << out.direct_fraction()
                  << " max_speed=" << out.max_speed_cells_per_s() << " cells/s" << std::endl;
    }
    return out;
}

}
