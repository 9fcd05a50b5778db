/**
 * @file block_vectors.hpp
 * @brief Block-resolution displacement grids and their regularization.
 *
 * Raw block estimates pass through outlier rejection, gap filling, and
 * smoothing before being interpolated to cell resolution.
 */

#pragma once
#include <cstddef>
#include <string>

#include "field2d.hpp"
#include "field_grid.hpp"

namespace nowcast
{

struct BlockVectors
{
    int nby = 0;
    int nbx = 0;
    int block_size = 1;
    Field2D dx;      // column displacement [cells of the level]
    Field2D dy;      // row displacement [cells of the level]
    Field2D score;   // best matching correlation
    Mask2D valid;

    void resize(int blocks_y, int blocks_x, int size);

    std::size_t index(int by, int bx) const
    {
        return static_cast<std::size_t>(by) * static_cast<std::size_t>(nbx) + static_cast<std::size_t>(bx);
    }

    bool is_valid(int by, int bx) const { return valid[index(by, bx)] != 0; }

    std::size_t valid_count() const;
};

namespace block_vectors
{

/**
 * @brief Invalidates vectors far from the component-wise median of their
 * valid 8-neighbours.
 * @param vectors Block grid updated in place.
 * @param threshold Rejection distance in cells; non-positive disables.
 * @return Number of rejected blocks.
 */
int reject_outliers(BlockVectors& vectors, double threshold);

/**
 * @brief Fills gaps and smooths the block grid.
 *
 * With `interpolate`, invalid blocks take the mean of known neighbours,
 * spreading outward until the grid is covered (all-zero when nothing is
 * valid). Otherwise invalid blocks are held at zero.
 */
void smooth_and_fill(BlockVectors& vectors,
                     const std::string& filter_id,
                     int kernel_size,
                     bool interpolate);

/**
 * @brief Bilinearly interpolates block vectors to a cell raster.
 */
void upsample(const BlockVectors& vectors, int rows, int cols, Field2D& dx, Field2D& dy);

/**
 * @brief Marks cells that belong to a directly estimated block.
 */
Mask2D direct_mask(const BlockVectors& vectors, int rows, int cols);

}

}
