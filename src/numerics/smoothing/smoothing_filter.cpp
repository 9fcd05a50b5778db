/**
 * @file smoothing_filter.cpp
 * @brief Implementation of masked box and recursive-Gaussian smoothing.
 *
 * Both filters are separable. Row passes run in parallel over rows and
 * column passes in parallel over columns, so no two threads touch the same
 * cell and results do not depend on the thread count.
 */

#include "smoothing_filter.hpp"
#include "nowcast_errors.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace nowcast
{

namespace
{

constexpr double kMinWeight = 1.0e-12;
constexpr int kRecursivePasses = 3;

}

void SmoothingFilter::apply_2d(Field2D& field, const Mask2D* weights) const
{
    if (field.empty())
    {
        return;
    }

    const std::size_t n = field.size();
    Field2D num(field.rows(), field.cols());
    Field2D den(field.rows(), field.cols());
    const float* in = field.data();
    float* pn = num.data();
    float* pd = den.data();
    for (std::size_t i = 0; i < n; ++i)
    {
        const float w = (weights == nullptr || (*weights)[i] != 0) ? 1.0f : 0.0f;
        pn[i] = w * in[i];
        pd[i] = w;
    }

    smooth_raw(num);
    smooth_raw(den);

    float* out = field.data();
    for (std::size_t i = 0; i < n; ++i)
    {
        if (static_cast<double>(pd[i]) > kMinWeight)
        {
            out[i] = pn[i] / pd[i];
        }
    }
}

BoxFilter::BoxFilter(int kernel_size)
    : half_width_(std::max(0, (kernel_size - 1) / 2))
{
}

/**
 * @brief Applies windowed sums along rows, then along columns.
 */
void BoxFilter::smooth_raw(Field2D& field) const
{
    if (half_width_ == 0)
    {
        return;
    }

    const int rows = field.rows();
    const int cols = field.cols();
    const int h = half_width_;

    #pragma omp parallel
    {
        std::vector<double> prefix(static_cast<std::size_t>(std::max(rows, cols)) + 1, 0.0);

        #pragma omp for schedule(static)
        for (int r = 0; r < rows; ++r)
        {
            float* row = field.row(r);
            prefix[0] = 0.0;
            for (int c = 0; c < cols; ++c)
            {
                prefix[static_cast<std::size_t>(c) + 1] = prefix[static_cast<std::size_t>(c)] + row[c];
            }
            for (int c = 0; c < cols; ++c)
            {
                const int lo = std::max(0, c - h);
                const int hi = std::min(cols - 1, c + h);
                row[c] = static_cast<float>(prefix[static_cast<std::size_t>(hi) + 1] -
                                            prefix[static_cast<std::size_t>(lo)]);
            }
        }

        #pragma omp for schedule(static)
        for (int c = 0; c < cols; ++c)
        {
            prefix[0] = 0.0;
            for (int r = 0; r < rows; ++r)
            {
                prefix[static_cast<std::size_t>(r) + 1] = prefix[static_cast<std::size_t>(r)] + field(r, c);
            }
            for (int r = 0; r < rows; ++r)
            {
                const int lo = std::max(0, r - h);
                const int hi = std::min(rows - 1, r + h);
                field(r, c) = static_cast<float>(prefix[static_cast<std::size_t>(hi) + 1] -
                                                 prefix[static_cast<std::size_t>(lo)]);
            }
        }
    }
}

RecursiveGaussianFilter::RecursiveGaussianFilter(int kernel_size)
    : length_cells_(std::max(0.0, 0.5 * static_cast<double>(kernel_size)))
{
}

/**
 * @brief Applies forward/backward first-order recursive passes.
 */
void RecursiveGaussianFilter::smooth_raw(Field2D& field) const
{
    if (length_cells_ < 1.0)
    {
        return;
    }

    const int rows = field.rows();
    const int cols = field.cols();
    const double w = std::exp(-1.0 / length_cells_);

    for (int pass = 0; pass < kRecursivePasses; ++pass)
    {
        #pragma omp parallel for schedule(static)
        for (int c = 0; c < cols; ++c)
        {
            for (int r = 1; r < rows; ++r)
            {
                field(r, c) = static_cast<float>(w * field(r - 1, c) + (1.0 - w) * field(r, c));
            }
            for (int r = rows - 1; r > 0; --r)
            {
                field(r - 1, c) = static_cast<float>(w * field(r, c) + (1.0 - w) * field(r - 1, c));
            }
        }

        #pragma omp parallel for schedule(static)
        for (int r = 0; r < rows; ++r)
        {
            float* row = field.row(r);
            for (int c = 1; c < cols; ++c)
            {
                row[c] = static_cast<float>(w * row[c - 1] + (1.0 - w) * row[c]);
            }
            for (int c = cols - 1; c > 0; --c)
            {
                row[c - 1] = static_cast<float>(w * row[c] + (1.0 - w) * row[c - 1]);
            }
        }
    }
}

std::unique_ptr<SmoothingFilter> create_smoothing_filter(const std::string& filter_id, int kernel_size)
{
    const std::string canonical = strutil::canonical_id(filter_id);
    if (canonical == "box")
    {
        return std::make_unique<BoxFilter>(kernel_size);
    }
    if (canonical == "recursivegaussian" || canonical == "gaussian")
    {
        return std::make_unique<RecursiveGaussianFilter>(kernel_size);
    }
    throw ConfigurationError("Unknown smoothing filter: " + filter_id);
}

std::vector<std::string> get_available_smoothing_filters()
{
    return {"box", "recursive_gaussian"};
}

}
