/**
 * @file smoothing_filter.hpp
 * @brief Masked spatial smoothing filters for rasters and vector components.
 *
 * Filters act as normalized convolutions: only cells with a non-zero weight
 * contribute, and each output is the weighted mean of its neighbourhood.
 * Cells whose neighbourhood carries no weight keep their input value.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>

#include "field2d.hpp"
#include "field_grid.hpp"

namespace nowcast
{

/**
 * @brief Base class for spatial smoothing filters
 */
class SmoothingFilter
{
public:
    virtual ~SmoothingFilter() = default;

    /**
     * @brief Apply filter to a 2D field in place
     * @param field Input/output field
     * @param weights Optional contribution mask; null means every cell contributes
     */
    void apply_2d(Field2D& field, const Mask2D* weights = nullptr) const;

    /**
     * @brief Get filter name
     */
    virtual std::string name() const = 0;

protected:
    /**
     * @brief Smooth an unnormalized field in place (no masking).
     */
    virtual void smooth_raw(Field2D& field) const = 0;
};

/**
 * @brief Separable box (moving-average) filter of odd width.
 */
class BoxFilter : public SmoothingFilter
{
public:
    explicit BoxFilter(int kernel_size);
    std::string name() const override { return "box"; }

protected:
    void smooth_raw(Field2D& field) const override;

private:
    int half_width_;
};

/**
 * @brief Recursive filter approximation of a Gaussian
 *
 * Successive forward/backward first-order passes along rows and columns.
 * The e-folding length is half the kernel size, in cells.
 */
class RecursiveGaussianFilter : public SmoothingFilter
{
public:
    explicit RecursiveGaussianFilter(int kernel_size);
    std::string name() const override { return "recursive_gaussian"; }

protected:
    void smooth_raw(Field2D& field) const override;

private:
    double length_cells_;
};

/**
 * @brief Create smoothing filter instance
 * @param filter_id Filter type ("box", "recursive_gaussian")
 * @param kernel_size Kernel width in cells; values below 2 give an identity filter
 * @return Unique pointer to smoothing filter
 */
std::unique_ptr<SmoothingFilter> create_smoothing_filter(const std::string& filter_id, int kernel_size);

/**
 * @brief Names of available smoothing filters.
 */
std::vector<std::string> get_available_smoothing_filters();

}
