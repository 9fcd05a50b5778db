#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>

#include "field2d.hpp"
#include "field_grid.hpp"

/**
 * @file interpolation.hpp
 * @brief Bilinear sampling helpers on row/column raster coordinates.
 *
 * Coordinates are fractional (row, col) positions where integer values
 * address cell centres. Callers are responsible for rejecting positions
 * outside `[0, rows-1] x [0, cols-1]`; the helpers clamp to the raster.
 */

namespace nowcast
{
namespace interpolation
{

// Motion is stored in single precision, so departure points carry
// rounding of order 1e-7 cells. Positions closer than this to a cell
// centre or to the raster edge are treated as lying on it.
inline constexpr double position_tol = 1.0e-6;
inline constexpr double min_valid_weight = 0.5;

/**
 * @brief Snaps a coordinate onto the nearest cell centre when within
 * `position_tol` of it.
 */
inline double snap(double x)
{
    const double nearest = std::round(x);
    return std::abs(x - nearest) < position_tol ? nearest : x;
}

/**
 * @brief Reports whether a fractional position lies inside the raster.
 */
inline bool inside(double r, double c, int rows, int cols, double tol = position_tol)
{
    return r >= -tol && c >= -tol &&
           r <= static_cast<double>(rows - 1) + tol &&
           c <= static_cast<double>(cols - 1) + tol;
}

/**
 * @brief Bilinear sample of a fully valid raster.
 */
inline double sample(const Field2D& field, double r, double c)
{
    const int rows = field.rows();
    const int cols = field.cols();
    r = std::clamp(snap(r), 0.0, static_cast<double>(rows - 1));
    c = std::clamp(snap(c), 0.0, static_cast<double>(cols - 1));

    const int r0 = static_cast<int>(std::floor(r));
    const int c0 = static_cast<int>(std::floor(c));
    const int r1 = std::min(r0 + 1, rows - 1);
    const int c1 = std::min(c0 + 1, cols - 1);
    const double fy = r - static_cast<double>(r0);
    const double fx = c - static_cast<double>(c0);

    if (fy == 0.0 && fx == 0.0)
    {
        return static_cast<double>(field(r0, c0));
    }

    const double w00 = (1.0 - fx) * (1.0 - fy);
    const double w01 = fx * (1.0 - fy);
    const double w10 = (1.0 - fx) * fy;
    const double w11 = fx * fy;

    return w00 * field(r0, c0) + w01 * field(r0, c1) +
           w10 * field(r1, c0) + w11 * field(r1, c1);
}

/**
 * @brief Bilinear sample honouring a validity mask.
 *
 * Invalid neighbours are dropped and the remaining weights renormalized.
 * The sample is rejected when the valid weight falls below one half.
 * Integer positions return the source cell unchanged.
 *
 * @return True when a value was produced.
 */
inline bool sample_masked(const Field2D& field, const Mask2D& valid,
                          double r, double c, float& out)
{
    const int rows = field.rows();
    const int cols = field.cols();
    r = std::clamp(snap(r), 0.0, static_cast<double>(rows - 1));
    c = std::clamp(snap(c), 0.0, static_cast<double>(cols - 1));

    const int r0 = static_cast<int>(std::floor(r));
    const int c0 = static_cast<int>(std::floor(c));
    const int r1 = std::min(r0 + 1, rows - 1);
    const int c1 = std::min(c0 + 1, cols - 1);
    const double fy = r - static_cast<double>(r0);
    const double fx = c - static_cast<double>(c0);

    auto is_valid = [&](int rr, int cc)
    {
        return valid[static_cast<std::size_t>(rr) * static_cast<std::size_t>(cols) +
                     static_cast<std::size_t>(cc)] != 0;
    };

    if (fy == 0.0 && fx == 0.0)
    {
        if (!is_valid(r0, c0))
        {
            return false;
        }
        out = field(r0, c0);
        return true;
    }

    const int rr[4] = {r0, r0, r1, r1};
    const int cc[4] = {c0, c1, c0, c1};
    const double ww[4] = {
        (1.0 - fx) * (1.0 - fy),
        fx * (1.0 - fy),
        (1.0 - fx) * fy,
        fx * fy
    };

    double acc = 0.0;
    double wsum = 0.0;
    for (int k = 0; k < 4; ++k)
    {
        if (ww[k] <= 0.0 || !is_valid(rr[k], cc[k]))
        {
            continue;
        }
        acc += ww[k] * static_cast<double>(field(rr[k], cc[k]));
        wsum += ww[k];
    }

    if (wsum < min_valid_weight)
    {
        return false;
    }
    out = static_cast<float>(acc / wsum);
    return true;
}

} // namespace interpolation
} // namespace nowcast
