/**
 * @file pyramid.cpp
 * @brief Implementation of masked pyramid reduction.
 */

#include "pyramid.hpp"

#include <algorithm>

namespace nowcast
{
namespace pyramid
{

namespace
{

PyramidLevel base_level(const FieldGrid& grid, float signal_threshold)
{
    const int rows = grid.rows();
    const int cols = grid.cols();

    PyramidLevel level;
    level.values.resize(rows, cols, 0.0f);
    level.data.assign(level.values.size(), 0);
    level.echo.assign(level.values.size(), 0);

    #pragma omp parallel for schedule(static)
    for (int r = 0; r < rows; ++r)
    {
        for (int c = 0; c < cols; ++c)
        {
            if (!grid.is_valid(r, c))
            {
                continue;
            }
            const std::size_t idx = level.index(r, c);
            level.data[idx] = 1;
            const float value = grid.value(r, c);
            if (value >= signal_threshold)
            {
                level.echo[idx] = 1;
                level.values(r, c) = value - signal_threshold;
            }
        }
    }
    return level;
}

PyramidLevel reduce(const PyramidLevel& fine)
{
    const int rows = (fine.rows() + 1) / 2;
    const int cols = (fine.cols() + 1) / 2;

    PyramidLevel coarse;
    coarse.values.resize(rows, cols, 0.0f);
    coarse.data.assign(coarse.values.size(), 0);
    coarse.echo.assign(coarse.values.size(), 0);

    #pragma omp parallel for schedule(static)
    for (int r = 0; r < rows; ++r)
    {
        for (int c = 0; c < cols; ++c)
        {
            double sum = 0.0;
            int count = 0;
            bool echo = false;
            for (int fr = 2 * r; fr < std::min(2 * r + 2, fine.rows()); ++fr)
            {
                for (int fc = 2 * c; fc < std::min(2 * c + 2, fine.cols()); ++fc)
                {
                    if (!fine.has_data(fr, fc))
                    {
                        continue;
                    }
                    sum += fine.values(fr, fc);
                    ++count;
                    echo = echo || fine.has_echo(fr, fc);
                }
            }
            if (count == 0)
            {
                continue;
            }
            const std::size_t idx = coarse.index(r, c);
            coarse.data[idx] = 1;
            coarse.echo[idx] = echo ? 1 : 0;
            coarse.values(r, c) = static_cast<float>(sum / count);
        }
    }
    return coarse;
}

}

int effective_levels(int rows, int cols, int requested)
{
    const int min_dim = std::min(rows, cols);
    int levels = 1;
    while (levels < requested && (min_dim >> levels) >= min_coarse_cells)
    {
        ++levels;
    }
    return levels;
}

std::vector<PyramidLevel> build(const FieldGrid& grid, float signal_threshold, int levels)
{
    std::vector<PyramidLevel> out;
    out.reserve(static_cast<std::size_t>(std::max(levels, 1)));
    out.push_back(base_level(grid, signal_threshold));
    for (int l = 1; l < levels; ++l)
    {
        out.push_back(reduce(out.back()));
    }
    return out;
}

}
}
