/**
 * @file field_grid.cpp
 * @brief FieldGrid construction checks and cell statistics.
 */

#include "field_grid.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace nowcast
{

namespace
{
constexpr double kCellSizeRelTol = 1.0e-9;

bool nearly_equal_rel(double a, double b)
{
    const double scale = std::max(std::abs(a), std::abs(b));
    return std::abs(a - b) <= kCellSizeRelTol * std::max(scale, 1.0);
}
}

bool GridGeometry::compatible_with(const GridGeometry& other) const
{
    return rows == other.rows &&
           cols == other.cols &&
           nearly_equal_rel(dx_m, other.dx_m) &&
           nearly_equal_rel(dy_m, other.dy_m) &&
           projection == other.projection;
}

std::string GridGeometry::describe() const
{
    std::ostringstream oss;
    oss << rows << "x" << cols << " cells, dx=" << dx_m << " m, dy=" << dy_m
        << " m, projection='" << projection << "'";
    return oss.str();
}

FieldGrid::FieldGrid(GridGeometry geometry, double timestamp_s, Field2D values, Mask2D valid)
    : geometry_(std::move(geometry)),
      timestamp_s_(timestamp_s),
      values_(std::move(values)),
      valid_(std::move(valid))
{
    if (geometry_.rows <= 0 || geometry_.cols <= 0)
    {
        throw std::invalid_argument("FieldGrid requires a positive raster shape");
    }
    if (values_.rows() != geometry_.rows || values_.cols() != geometry_.cols)
    {
        throw std::invalid_argument("FieldGrid values shape does not match geometry");
    }
    if (valid_.size() != values_.size())
    {
        throw std::invalid_argument("FieldGrid validity mask size does not match values");
    }
    for (std::uint8_t& flag : valid_)
    {
        flag = flag != 0 ? 1 : 0;
    }
}

FieldGrid::FieldGrid(GridGeometry geometry, double timestamp_s, Field2D values)
    : FieldGrid(std::move(geometry), timestamp_s, values, Mask2D(values.size(), 1))
{
}

FieldGrid FieldGrid::no_data(const GridGeometry& geometry, double timestamp_s)
{
    Field2D values(geometry.rows, geometry.cols, 0.0f);
    Mask2D valid(values.size(), 0);
    return FieldGrid(geometry, timestamp_s, std::move(values), std::move(valid));
}

std::size_t FieldGrid::valid_count() const
{
    return static_cast<std::size_t>(std::count(valid_.begin(), valid_.end(), std::uint8_t{1}));
}

double FieldGrid::nodata_fraction() const
{
    if (valid_.empty())
    {
        return 1.0;
    }
    return 1.0 - static_cast<double>(valid_count()) / static_cast<double>(valid_.size());
}

std::size_t FieldGrid::echo_count(float threshold) const
{
    std::size_t count = 0;
    const float* v = values_.data();
    for (std::size_t i = 0; i < valid_.size(); ++i)
    {
        if (valid_[i] && v[i] >= threshold)
        {
            ++count;
        }
    }
    return count;
}

bool FieldGrid::value_range(float& lo, float& hi) const
{
    bool found = false;
    const float* v = values_.data();
    for (std::size_t i = 0; i < valid_.size(); ++i)
    {
        if (!valid_[i])
        {
            continue;
        }
        if (!found)
        {
            lo = hi = v[i];
            found = true;
            continue;
        }
        lo = std::min(lo, v[i]);
        hi = std::max(hi, v[i]);
    }
    return found;
}

FieldGrid FieldGrid::retimed(double timestamp_s) const
{
    FieldGrid out(*this);
    out.timestamp_s_ = timestamp_s;
    return out;
}

} // namespace nowcast
