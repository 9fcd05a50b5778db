/**
 * @file block_vectors.cpp
 * @brief Implementation of block-grid regularization and up-sampling.
 */

#include "block_vectors.hpp"
#include "interpolation.hpp"
#include "numerics/smoothing/smoothing_filter.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace nowcast
{

void BlockVectors::resize(int blocks_y, int blocks_x, int size)
{
    nby = blocks_y;
    nbx = blocks_x;
    block_size = std::max(size, 1);
    dx.resize(nby, nbx, 0.0f);
    dy.resize(nby, nbx, 0.0f);
    score.resize(nby, nbx, 0.0f);
    valid.assign(dx.size(), 0);
}

std::size_t BlockVectors::valid_count() const
{
    return static_cast<std::size_t>(std::count(valid.begin(), valid.end(), std::uint8_t{1}));
}

namespace block_vectors
{

namespace
{

float median_of(std::vector<float>& values)
{
    const std::size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
    const float upper = values[mid];
    if (values.size() % 2 == 1)
    {
        return upper;
    }
    const float lower = *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid));
    return 0.5f * (lower + upper);
}

void diffusion_fill(BlockVectors& vectors)
{
    Mask2D known = vectors.valid;
    std::size_t unknown = static_cast<std::size_t>(std::count(known.begin(), known.end(), std::uint8_t{0}));
    if (unknown == known.size())
    {
        vectors.dx.fill(0.0f);
        vectors.dy.fill(0.0f);
        return;
    }

    while (unknown > 0)
    {
        Mask2D next_known = known;
        Field2D next_dx = vectors.dx;
        Field2D next_dy = vectors.dy;
        std::size_t filled = 0;

        for (int by = 0; by < vectors.nby; ++by)
        {
            for (int bx = 0; bx < vectors.nbx; ++bx)
            {
                if (known[vectors.index(by, bx)])
                {
                    continue;
                }
                double sx = 0.0;
                double sy = 0.0;
                int count = 0;
                for (int ny = std::max(0, by - 1); ny <= std::min(vectors.nby - 1, by + 1); ++ny)
                {
                    for (int nx = std::max(0, bx - 1); nx <= std::min(vectors.nbx - 1, bx + 1); ++nx)
                    {
                        if (!known[vectors.index(ny, nx)])
                        {
                            continue;
                        }
                        sx += vectors.dx(ny, nx);
                        sy += vectors.dy(ny, nx);
                        ++count;
                    }
                }
                if (count == 0)
                {
                    continue;
                }
                next_dx(by, bx) = static_cast<float>(sx / count);
                next_dy(by, bx) = static_cast<float>(sy / count);
                next_known[vectors.index(by, bx)] = 1;
                ++filled;
            }
        }

        if (filled == 0)
        {
            break;
        }
        known.swap(next_known);
        vectors.dx = std::move(next_dx);
        vectors.dy = std::move(next_dy);
        unknown -= filled;
    }
}

}

int reject_outliers(BlockVectors& vectors, double threshold)
{
    if (threshold <= 0.0)
    {
        return 0;
    }

    Mask2D keep = vectors.valid;
    int rejected = 0;
    std::vector<float> nx_values;
    std::vector<float> ny_values;
    nx_values.reserve(8);
    ny_values.reserve(8);

    for (int by = 0; by < vectors.nby; ++by)
    {
        for (int bx = 0; bx < vectors.nbx; ++bx)
        {
            if (!vectors.is_valid(by, bx))
            {
                continue;
            }
            nx_values.clear();
            ny_values.clear();
            for (int ny = std::max(0, by - 1); ny <= std::min(vectors.nby - 1, by + 1); ++ny)
            {
                for (int nx = std::max(0, bx - 1); nx <= std::min(vectors.nbx - 1, bx + 1); ++nx)
                {
                    if ((ny == by && nx == bx) || !vectors.is_valid(ny, nx))
                    {
                        continue;
                    }
                    nx_values.push_back(vectors.dx(ny, nx));
                    ny_values.push_back(vectors.dy(ny, nx));
                }
            }
            if (nx_values.size() < 3)
            {
                continue;
            }
            const double mx = median_of(nx_values);
            const double my = median_of(ny_values);
            const double dist = std::hypot(vectors.dx(by, bx) - mx, vectors.dy(by, bx) - my);
            if (dist > threshold)
            {
                keep[vectors.index(by, bx)] = 0;
                ++rejected;
            }
        }
    }

    vectors.valid.swap(keep);
    return rejected;
}

void smooth_and_fill(BlockVectors& vectors,
                     const std::string& filter_id,
                     int kernel_size,
                     bool interpolate)
{
    const auto filter = create_smoothing_filter(filter_id, kernel_size);

    if (interpolate)
    {
        diffusion_fill(vectors);
        filter->apply_2d(vectors.dx);
        filter->apply_2d(vectors.dy);
        return;
    }

    for (std::size_t i = 0; i < vectors.valid.size(); ++i)
    {
        if (!vectors.valid[i])
        {
            vectors.dx.data()[i] = 0.0f;
            vectors.dy.data()[i] = 0.0f;
        }
    }
    filter->apply_2d(vectors.dx, &vectors.valid);
    filter->apply_2d(vectors.dy, &vectors.valid);
    for (std::size_t i = 0; i < vectors.valid.size(); ++i)
    {
        if (!vectors.valid[i])
        {
            vectors.dx.data()[i] = 0.0f;
            vectors.dy.data()[i] = 0.0f;
        }
    }
}

void upsample(const BlockVectors& vectors, int rows, int cols, Field2D& dx, Field2D& dy)
{
    dx.resize(rows, cols, 0.0f);
    dy.resize(rows, cols, 0.0f);
    if (vectors.nby == 0 || vectors.nbx == 0)
    {
        return;
    }

    const double b = static_cast<double>(vectors.block_size);
    const double centre = 0.5 * (b - 1.0);
    const double max_by = static_cast<double>(vectors.nby - 1);
    const double max_bx = static_cast<double>(vectors.nbx - 1);

    #pragma omp parallel for schedule(static)
    for (int r = 0; r < rows; ++r)
    {
        const double fb_r = std::clamp((static_cast<double>(r) - centre) / b, 0.0, max_by);
        for (int c = 0; c < cols; ++c)
        {
            const double fb_c = std::clamp((static_cast<double>(c) - centre) / b, 0.0, max_bx);
            dx(r, c) = static_cast<float>(interpolation::sample(vectors.dx, fb_r, fb_c));
            dy(r, c) = static_cast<float>(interpolation::sample(vectors.dy, fb_r, fb_c));
        }
    }
}

Mask2D direct_mask(const BlockVectors& vectors, int rows, int cols)
{
    Mask2D mask(Field2D::checked_size(rows, cols), 0);
    if (vectors.nby == 0 || vectors.nbx == 0)
    {
        return mask;
    }
    for (int r = 0; r < rows; ++r)
    {
        const int by = std::min(r / vectors.block_size, vectors.nby - 1);
        for (int c = 0; c < cols; ++c)
        {
            const int bx = std::min(c / vectors.block_size, vectors.nbx - 1);
            mask[static_cast<std::size_t>(r) * static_cast<std::size_t>(cols) + static_cast<std::size_t>(c)] =
                vectors.valid[vectors.index(by, bx)];
        }
    }
    return mask;
}

}

}
