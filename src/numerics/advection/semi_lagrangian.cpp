/**
 * @file semi_lagrangian.cpp
 * @brief Backward-trajectory advection with bounded hop length.
 *
 * Rows are processed independently. The trajectory of a cell depends only
 * on the read-only motion field, so the output is identical for any thread
 * count.
 */

#include "advection.hpp"
#include "interpolation.hpp"
#include "nowcast_errors.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace nowcast
{

int advection_substeps(const MotionField& motion, double dt_s, const AdvectionConfig& cfg)
{
    const double max_disp = motion.max_speed_cells_per_s() * std::abs(dt_s);
    if (max_disp <= 0.0 || cfg.substep_threshold <= 0.0)
    {
        return 1;
    }
    const double hops = std::ceil(max_disp / cfg.substep_threshold - interpolation::position_tol);
    const double cap = static_cast<double>(std::max(cfg.max_substeps, 1));
    return static_cast<int>(std::clamp(hops, 1.0, cap));
}

FieldGrid advect(const FieldGrid& field,
                 const MotionField& motion,
                 double dt_s,
                 const AdvectionConfig& cfg,
                 AdvectionDiagnostics* diagnostics)
{
    const int rows = field.rows();
    const int cols = field.cols();

    if (!motion.same_shape(rows, cols) || motion.u.rows() != rows || motion.u.cols() != cols ||
        !motion.u.same_shape(motion.v))
    {
        throw ConfigurationError("Advection motion field shape does not match the grid");
    }
    if (!std::isfinite(dt_s) || dt_s < 0.0)
    {
        throw ConfigurationError("Advection step must be finite and non-negative");
    }

    const int substeps = advection_substeps(motion, dt_s, cfg);
    if (diagnostics)
    {
        diagnostics->substeps = substeps;
        diagnostics->cells_out_of_domain = 0;
        diagnostics->max_displacement_cells = motion.max_speed_cells_per_s() * dt_s;
    }
    if (dt_s == 0.0)
    {
        return field;
    }

    const double h = dt_s / static_cast<double>(substeps);
    const Field2D& src = field.values();
    const Mask2D& src_valid = field.valid_mask();

    Field2D out_values(rows, cols, 0.0f);
    Mask2D out_valid(out_values.size(), 0);
    std::vector<std::size_t> row_lost(static_cast<std::size_t>(rows), 0);

    #pragma omp parallel for schedule(static)
    for (int r = 0; r < rows; ++r)
    {
        std::size_t lost = 0;
        for (int c = 0; c < cols; ++c)
        {
            double pr = static_cast<double>(r);
            double pc = static_cast<double>(c);
            bool inside = true;
            for (int k = 0; k < substeps; ++k)
            {
                const double u = interpolation::sample(motion.u, pr, pc);
                const double v = interpolation::sample(motion.v, pr, pc);
                pr -= v * h;
                pc -= u * h;
                if (!interpolation::inside(pr, pc, rows, cols))
                {
                    inside = false;
                    break;
                }
            }
            if (!inside)
            {
                ++lost;
                continue;
            }

            float value = 0.0f;
            if (interpolation::sample_masked(src, src_valid, pr, pc, value))
            {
                out_values(r, c) = value;
                out_valid[static_cast<std::size_t>(r) * static_cast<std::size_t>(cols) +
                          static_cast<std::size_t>(c)] = 1;
            }
        }
        row_lost[static_cast<std::size_t>(r)] = lost;
    }

    if (diagnostics)
    {
        for (std::size_t lost : row_lost)
        {
            diagnostics->cells_out_of_domain += lost;
        }
    }

    return FieldGrid(field.geometry(), field.timestamp_s() + dt_s, std::move(out_values), std::move(out_valid));
}

} // namespace nowcast
