#pragma once

#include "field_grid.hpp"
#include "motion_base.hpp"

/**
 * @file advection.hpp
 * @brief Semi-Lagrangian extrapolation of a reflectivity grid.
 *
 * Each output cell traces its trajectory backward through the motion field
 * and takes the bilinearly interpolated value found at the departure point.
 * Long displacements are split into hops no longer than the configured
 * threshold so that curved flow is followed rather than cut across.
 */

namespace nowcast
{

struct AdvectionConfig
{
    double substep_threshold = 1.0;   // maximum hop length [cells]
    int max_substeps = 64;            // hop count cap; beyond it hops grow longer
};

struct AdvectionDiagnostics
{
    int substeps = 0;
    std::size_t cells_out_of_domain = 0;
    double max_displacement_cells = 0.0;
};

/**
 * @brief Number of backward hops used for a step.
 * @param motion Motion field [cells/s].
 * @param dt_s Step length [s].
 * @param cfg Advection configuration.
 * @return Hop count in [1, cfg.max_substeps].
 */
int advection_substeps(const MotionField& motion, double dt_s, const AdvectionConfig& cfg);

/**
 * @brief Advects a grid along a motion field over `dt_s` seconds.
 * @param field Source grid.
 * @param motion Motion field with the same shape as `field`.
 * @param dt_s Step length [s], non-negative.
 * @param cfg Sub-stepping configuration.
 * @param diagnostics Optional step statistics.
 * @return Advected grid stamped `field.timestamp_s() + dt_s`. Cells whose
 * trajectory leaves the domain, or lands among no-data cells, are no-data.
 */
FieldGrid advect(const FieldGrid& field,
                 const MotionField& motion,
                 double dt_s,
                 const AdvectionConfig& cfg,
                 AdvectionDiagnostics* diagnostics = nullptr);

} // namespace nowcast
