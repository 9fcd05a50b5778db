/**
 * @file block_match.cpp
 * @brief Implementation of the pyramidal ZNCC block-matching scheme.
 */

#include "block_match.hpp"
#include "interpolation.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

namespace nowcast
{

namespace
{

constexpr double kVarianceFloor = 1.0e-9;
constexpr double kExactMatch = 1.0 - 1.0e-6;

struct BlockWindow
{
    int r0 = 0;
    int r1 = 0;
    int c0 = 0;
    int c1 = 0;

    int area() const { return (r1 - r0) * (c1 - c0); }
};

/**
 * @brief ZNCC between a block of `a` and the window of `b` shifted by (dx, dy).
 *
 * Pixels count when both frames carry data. Zero-valued (no echo) pixels
 * participate so that echo edges shape the correlation.
 *
 * @return False when the overlap is too small or either side is flat.
 */
bool zncc(const PyramidLevel& a,
          const PyramidLevel& b,
          const BlockWindow& win,
          int dx,
          int dy,
          double min_overlap,
          double& out)
{
    double sa = 0.0;
    double sb = 0.0;
    double saa = 0.0;
    double sbb = 0.0;
    double sab = 0.0;
    int n = 0;

    for (int r = win.r0; r < win.r1; ++r)
    {
        const int rb = r + dy;
        if (rb < 0 || rb >= b.rows())
        {
            continue;
        }
        for (int c = win.c0; c < win.c1; ++c)
        {
            const int cb = c + dx;
            if (cb < 0 || cb >= b.cols())
            {
                continue;
            }
            if (!a.has_data(r, c) || !b.has_data(rb, cb))
            {
                continue;
            }
            const double va = a.values(r, c);
            const double vb = b.values(rb, cb);
            sa += va;
            sb += vb;
            saa += va * va;
            sbb += vb * vb;
            sab += va * vb;
            ++n;
        }
    }

    if (n < 2 || static_cast<double>(n) < min_overlap * static_cast<double>(win.area()))
    {
        return false;
    }

    const double inv_n = 1.0 / static_cast<double>(n);
    const double var_a = saa - sa * sa * inv_n;
    const double var_b = sbb - sb * sb * inv_n;
    if (var_a <= kVarianceFloor * std::max(1.0, saa) || var_b <= kVarianceFloor * std::max(1.0, sbb))
    {
        return false;
    }
    out = (sab - sa * sb * inv_n) / std::sqrt(var_a * var_b);
    return true;
}

/**
 * @brief ZNCC of three neighbouring shifts along one axis, scored over the
 * pixels that carry data for all three so the samples are comparable.
 *
 * Shifts are (dx + k*ax, dy + k*ay) for k = -1, 0, 1.
 *
 * @return False when the common overlap is too small or any side is flat.
 */
bool zncc_triplet(const PyramidLevel& a,
                  const PyramidLevel& b,
                  const BlockWindow& win,
                  int dx,
                  int dy,
                  int ax,
                  int ay,
                  double min_overlap,
                  double out[3])
{
    double sa = 0.0;
    double saa = 0.0;
    double sb[3] = {0.0, 0.0, 0.0};
    double sbb[3] = {0.0, 0.0, 0.0};
    double sab[3] = {0.0, 0.0, 0.0};
    int n = 0;

    for (int r = win.r0; r < win.r1; ++r)
    {
        for (int c = win.c0; c < win.c1; ++c)
        {
            if (!a.has_data(r, c))
            {
                continue;
            }
            double vb[3];
            bool usable = true;
            for (int k = 0; k < 3 && usable; ++k)
            {
                const int rb = r + dy + (k - 1) * ay;
                const int cb = c + dx + (k - 1) * ax;
                usable = rb >= 0 && rb < b.rows() && cb >= 0 && cb < b.cols() && b.has_data(rb, cb);
                if (usable)
                {
                    vb[k] = b.values(rb, cb);
                }
            }
            if (!usable)
            {
                continue;
            }
            const double va = a.values(r, c);
            sa += va;
            saa += va * va;
            for (int k = 0; k < 3; ++k)
            {
                sb[k] += vb[k];
                sbb[k] += vb[k] * vb[k];
                sab[k] += va * vb[k];
            }
            ++n;
        }
    }

    if (n < 2 || static_cast<double>(n) < min_overlap * static_cast<double>(win.area()))
    {
        return false;
    }

    const double inv_n = 1.0 / static_cast<double>(n);
    const double var_a = saa - sa * sa * inv_n;
    if (var_a <= kVarianceFloor * std::max(1.0, saa))
    {
        return false;
    }
    for (int k = 0; k < 3; ++k)
    {
        const double var_b = sbb[k] - sb[k] * sb[k] * inv_n;
        if (var_b <= kVarianceFloor * std::max(1.0, sbb[k]))
        {
            return false;
        }
        out[k] = (sab[k] - sa * sb[k] * inv_n) / std::sqrt(var_a * var_b);
    }
    return true;
}

bool block_has_echo(const PyramidLevel& level, const BlockWindow& win)
{
    for (int r = win.r0; r < win.r1; ++r)
    {
        for (int c = win.c0; c < win.c1; ++c)
        {
            if (level.has_echo(r, c))
            {
                return true;
            }
        }
    }
    return false;
}

/**
 * @brief Vertex offset of the parabola through three samples, in [-0.5, 0.5].
 */
double parabolic_offset(double minus, double centre, double plus)
{
    const double denom = minus - 2.0 * centre + plus;
    if (denom >= -1.0e-12)
    {
        return 0.0;
    }
    const double offset = 0.5 * (minus - plus) / denom;
    return std::clamp(offset, -0.5, 0.5);
}

void upsample_guess(const Field2D& coarse, int rows, int cols, Field2D& fine)
{
    fine.resize(rows, cols, 0.0f);
    #pragma omp parallel for schedule(static)
    for (int r = 0; r < rows; ++r)
    {
        for (int c = 0; c < cols; ++c)
        {
            const double cr = 0.5 * static_cast<double>(r) - 0.25;
            const double cc = 0.5 * static_cast<double>(c) - 0.25;
            fine(r, c) = static_cast<float>(2.0 * interpolation::sample(coarse, cr, cc));
        }
    }
}

}

int BlockMatchScheme::block_size_for(int /*rows*/, int /*cols*/, const MotionConfig& cfg) const
{
    return std::max(cfg.block_size, 2);
}

BlockVectors BlockMatchScheme::match_level(const PyramidLevel& prev,
                                           const PyramidLevel& curr,
                                           const Field2D& guess_dx,
                                           const Field2D& guess_dy,
                                           const MotionConfig& cfg,
                                           bool refine) const
{
    const int rows = prev.rows();
    const int cols = prev.cols();
    const int block = std::min(block_size_for(rows, cols, cfg), std::max(rows, cols));
    const int nby = (rows + block - 1) / block;
    const int nbx = (cols + block - 1) / block;
    const int radius = std::max(cfg.search_radius, 0);

    BlockVectors vectors;
    vectors.resize(nby, nbx, block);

    #pragma omp parallel for schedule(dynamic)
    for (int b = 0; b < nby * nbx; ++b)
    {
        const int by = b / nbx;
        const int bx = b % nbx;
        BlockWindow win;
        win.r0 = by * block;
        win.r1 = std::min(rows, win.r0 + block);
        win.c0 = bx * block;
        win.c1 = std::min(cols, win.c0 + block);

        if (!block_has_echo(prev, win))
        {
            continue;
        }

        const double centre_r = 0.5 * static_cast<double>(win.r0 + win.r1 - 1);
        const double centre_c = 0.5 * static_cast<double>(win.c0 + win.c1 - 1);
        const double gx = interpolation::sample(guess_dx, centre_r, centre_c);
        const double gy = interpolation::sample(guess_dy, centre_r, centre_c);
        const int gxi = static_cast<int>(std::lround(gx));
        const int gyi = static_cast<int>(std::lround(gy));

        const double unset = -std::numeric_limits<double>::infinity();
        double best_score = unset;
        double best_corr = 0.0;
        int best_sx = 0;
        int best_sy = 0;

        for (int sy = -radius; sy <= radius; ++sy)
        {
            for (int sx = -radius; sx <= radius; ++sx)
            {
                const int dx = gxi + sx;
                const int dy = gyi + sy;
                double corr = 0.0;
                if (!zncc(prev, curr, win, dx, dy, cfg.min_overlap_fraction, corr))
                {
                    continue;
                }
                const double ex = static_cast<double>(dx) - gx;
                const double ey = static_cast<double>(dy) - gy;
                const double score = corr - cfg.displacement_penalty * (ex * ex + ey * ey);
                if (score > best_score)
                {
                    best_score = score;
                    best_corr = corr;
                    best_sx = sx;
                    best_sy = sy;
                }
            }
        }

        if (best_score == unset || best_corr < cfg.min_correlation)
        {
            continue;
        }

        const int bdx = gxi + best_sx;
        const int bdy = gyi + best_sy;
        double fx = 0.0;
        double fy = 0.0;
        if (refine && best_corr < kExactMatch)
        {
            auto refine_axis = [&](int ax, int ay, double& offset)
            {
                double corr3[3];
                if (!zncc_triplet(prev, curr, win, bdx, bdy, ax, ay, cfg.min_overlap_fraction, corr3))
                {
                    return;
                }
                double score3[3];
                for (int k = 0; k < 3; ++k)
                {
                    const double ex = static_cast<double>(bdx + (k - 1) * ax) - gx;
                    const double ey = static_cast<double>(bdy + (k - 1) * ay) - gy;
                    score3[k] = corr3[k] - cfg.displacement_penalty * (ex * ex + ey * ey);
                }
                if (score3[1] >= score3[0] && score3[1] >= score3[2])
                {
                    offset = parabolic_offset(score3[0], score3[1], score3[2]);
                }
            };
            refine_axis(1, 0, fx);
            refine_axis(0, 1, fy);
        }

        const std::size_t idx = vectors.index(by, bx);
        vectors.dx(by, bx) = static_cast<float>(bdx + fx);
        vectors.dy(by, bx) = static_cast<float>(bdy + fy);
        vectors.score(by, bx) = static_cast<float>(best_corr);
        vectors.valid[idx] = 1;
    }

    return vectors;
}

DisplacementEstimate BlockMatchScheme::estimate_displacement(
    const FieldGrid& prev,
    const FieldGrid& curr,
    const MotionConfig& cfg) const
{
    const int levels = pyramid::effective_levels(prev.rows(), prev.cols(), cfg.pyramid_levels);
    const std::vector<PyramidLevel> prev_pyr = pyramid::build(prev, cfg.signal_threshold, levels);
    const std::vector<PyramidLevel> curr_pyr = pyramid::build(curr, cfg.signal_threshold, levels);
    const bool interpolate = strutil::canonical_id(cfg.fill_mode) != "zero";

    DisplacementEstimate out;
    Field2D guess_dx(prev_pyr.back().rows(), prev_pyr.back().cols(), 0.0f);
    Field2D guess_dy(prev_pyr.back().rows(), prev_pyr.back().cols(), 0.0f);

    for (int l = levels - 1; l >= 0; --l)
    {
        const PyramidLevel& p = prev_pyr[static_cast<std::size_t>(l)];
        const PyramidLevel& c = curr_pyr[static_cast<std::size_t>(l)];
        const bool is_finest = (l == 0);

        BlockVectors vectors = match_level(p, c, guess_dx, guess_dy, cfg, is_finest && cfg.subpixel);
        const std::size_t matched = vectors.valid_count();
        const int rejected = block_vectors::reject_outliers(vectors, cfg.outlier_threshold);
        const std::size_t kept = vectors.valid_count();

        if (log_debug_enabled())
        {
            std::cout << "[motion] " << name() << " level " << l << " (" << p.rows() << "x" << p.cols()
                      << "): blocks=" << vectors.nby * vectors.nbx << " matched=" << matched
                      << " outliers=" << rejected << std::endl;
        }

        Field2D dense_dx;
        Field2D dense_dy;
        if (kept > 0)
        {
            out.any_valid = true;
            double score_sum = 0.0;
            for (int by = 0; by < vectors.nby; ++by)
            {
                for (int bx = 0; bx < vectors.nbx; ++bx)
                {
                    if (vectors.is_valid(by, bx))
                    {
                        score_sum += vectors.score(by, bx);
                    }
                }
            }
            const double coverage = matched > 0 ? static_cast<double>(kept) / static_cast<double>(matched) : 0.0;
            out.quality = std::clamp(score_sum / static_cast<double>(kept) * coverage, 0.0, 1.0);

            block_vectors::smooth_and_fill(vectors, cfg.smoothing_filter, cfg.smoothing_kernel, interpolate);
            block_vectors::upsample(vectors, p.rows(), p.cols(), dense_dx, dense_dy);
        }
        else
        {
            dense_dx = guess_dx;
            dense_dy = guess_dy;
        }

        if (is_finest)
        {
            out.direct = block_vectors::direct_mask(vectors, p.rows(), p.cols());
            out.dx = std::move(dense_dx);
            out.dy = std::move(dense_dy);
            break;
        }

        const PyramidLevel& next = prev_pyr[static_cast<std::size_t>(l - 1)];
        upsample_guess(dense_dx, next.rows(), next.cols(), guess_dx);
        upsample_guess(dense_dy, next.rows(), next.cols(), guess_dy);
    }

    return out;
}

}
