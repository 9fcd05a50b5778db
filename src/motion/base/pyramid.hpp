/**
 * @file pyramid.hpp
 * @brief Masked image pyramid used by coarse-to-fine motion estimation.
 */

#pragma once
#include <vector>

#include "field2d.hpp"
#include "field_grid.hpp"

namespace nowcast
{

/**
 * @brief One pyramid level: matching intensities plus data and echo masks.
 *
 * Matching intensities are the echo excess above the signal threshold;
 * cells without echo carry zero so sub-threshold noise cannot steer the match.
 */
struct PyramidLevel
{
    Field2D values;
    Mask2D data;
    Mask2D echo;

    int rows() const { return values.rows(); }
    int cols() const { return values.cols(); }

    bool has_data(int r, int c) const { return data[index(r, c)] != 0; }
    bool has_echo(int r, int c) const { return echo[index(r, c)] != 0; }

    std::size_t index(int r, int c) const
    {
        return static_cast<std::size_t>(r) * static_cast<std::size_t>(values.cols()) +
               static_cast<std::size_t>(c);
    }
};

namespace pyramid
{

inline constexpr int min_coarse_cells = 4;

/**
 * @brief Caps the requested level count so the coarsest level keeps at
 * least `min_coarse_cells` cells along each axis.
 */
int effective_levels(int rows, int cols, int requested);

/**
 * @brief Builds a pyramid by masked 2x2 mean reduction.
 * @param grid Source grid (level 0).
 * @param signal_threshold Echo threshold applied at level 0.
 * @param levels Level count, already capped by effective_levels.
 * @return Levels ordered fine (index 0) to coarse.
 */
std::vector<PyramidLevel> build(const FieldGrid& grid, float signal_threshold, int levels);

}

}
