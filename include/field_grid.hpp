#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "field2d.hpp"

/**
 * @file field_grid.hpp
 * @brief Reflectivity raster value type with no-data mask and metadata.
 *
 * A FieldGrid is produced once (by a decoder, the runner, or the engine)
 * and never modified afterwards. All grids of one forecast request share a
 * compatible GridGeometry.
 */

namespace nowcast
{

using Mask2D = std::vector<std::uint8_t>;

/**
 * @brief Shape, cell size, extent origin, and projection of a raster.
 */
struct GridGeometry
{
    int rows = 0;
    int cols = 0;
    double dx_m = 1000.0;     // cell width along columns [m]
    double dy_m = 1000.0;     // cell height along rows [m]
    double x0_m = 0.0;        // extent origin, projected x [m]
    double y0_m = 0.0;        // extent origin, projected y [m]
    std::string projection;   // opaque projection reference (proj string, EPSG code)

    /**
     * @brief Reports whether two geometries describe the same raster layout.
     *
     * Shape and projection must match exactly; cell sizes within a relative
     * tolerance of 1e-9.
     */
    bool compatible_with(const GridGeometry& other) const;

    /**
     * @brief Returns a one-line description for error messages.
     */
    std::string describe() const;
};

class FieldGrid
{
public:
    FieldGrid() = default;

    /**
     * @brief Constructs a grid from values and an explicit validity mask.
     * @param geometry Raster layout; rows/cols must match `values`.
     * @param timestamp_s Observation or valid time, seconds since UNIX epoch.
     * @param values Intensity raster.
     * @param valid Validity mask, rows*cols entries; any non-zero entry marks data
     *        and is stored as 1.
     */
    FieldGrid(GridGeometry geometry, double timestamp_s, Field2D values, Mask2D valid);

    /**
     * @brief Constructs a grid whose cells all carry data.
     */
    FieldGrid(GridGeometry geometry, double timestamp_s, Field2D values);

    /**
     * @brief Builds an all-no-data grid.
     */
    static FieldGrid no_data(const GridGeometry& geometry, double timestamp_s);

    const GridGeometry& geometry() const { return geometry_; }
    int rows() const { return geometry_.rows; }
    int cols() const { return geometry_.cols; }
    double timestamp_s() const { return timestamp_s_; }

    const Field2D& values() const { return values_; }
    const Mask2D& valid_mask() const { return valid_; }

    float value(int r, int c) const { return values_(r, c); }

    bool is_valid(int r, int c) const
    {
        return valid_[static_cast<std::size_t>(r) * static_cast<std::size_t>(geometry_.cols) +
                      static_cast<std::size_t>(c)] != 0;
    }

    std::size_t cell_count() const { return values_.size(); }

    std::size_t valid_count() const;

    /**
     * @brief Fraction of cells flagged no-data.
     */
    double nodata_fraction() const;

    /**
     * @brief Counts valid cells at or above an echo threshold.
     */
    std::size_t echo_count(float threshold) const;

    /**
     * @brief Finds the value range over valid cells.
     * @return False when no cell is valid.
     */
    bool value_range(float& lo, float& hi) const;

    /**
     * @brief Returns a copy stamped with a different time.
     */
    FieldGrid retimed(double timestamp_s) const;

private:
    GridGeometry geometry_;
    double timestamp_s_ = 0.0;
    Field2D values_;
    Mask2D valid_;
};

} // namespace nowcast
