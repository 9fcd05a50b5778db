#include "field_grid.hpp"
#include "motion_base.hpp"
#include "nowcast_errors.hpp"
#include "numerics/smoothing/smoothing_filter.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace nowcast;

namespace
{

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[motion-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int expect_close(double actual, double expected, const std::string& label, double tol = 1.0e-9)
{
    if (!(std::abs(actual - expected) <= tol))
    {
        std::cerr << "[motion-regression] FAIL: " << label
                  << " actual=" << actual
                  << " expected=" << expected
                  << " tol=" << tol << std::endl;
        return 1;
    }
    return 0;
}

GridGeometry geometry(int rows, int cols)
{
    GridGeometry g;
    g.rows = rows;
    g.cols = cols;
    return g;
}

FieldGrid gaussian_echo(int n, double centre_r, double centre_c, double timestamp_s)
{
    Field2D values(n, n, 0.0f);
    for (int r = 0; r < n; ++r)
    {
        for (int c = 0; c < n; ++c)
        {
            const double d2 = (r - centre_r) * (r - centre_r) + (c - centre_c) * (c - centre_c);
            values(r, c) = static_cast<float>(40.0 * std::exp(-d2 / 18.0));
        }
    }
    return FieldGrid(geometry(n, n), timestamp_s, std::move(values));
}

int test_smoothing_filters()
{
    int failures = 0;

    for (const std::string& id : get_available_smoothing_filters())
    {
        Field2D flat(8, 8, 5.0f);
        create_smoothing_filter(id, 5)->apply_2d(flat);
        bool constant = true;
        for (int r = 0; r < 8; ++r)
        {
            for (int c = 0; c < 8; ++c)
            {
                constant = constant && std::abs(flat(r, c) - 5.0f) < 1.0e-4f;
            }
        }
        failures += expect_true(constant, id + " filter preserves a constant field");
    }

    Field2D spiked(5, 5, 5.0f);
    spiked(2, 2) = 1000.0f;
    Mask2D weights(spiked.size(), 1);
    weights[2 * 5 + 2] = 0;
    create_smoothing_filter("box", 3)->apply_2d(spiked, &weights);
    failures += expect_close(spiked(1, 1), 5.0, "masked cell does not leak into neighbours", 1.0e-4);
    failures += expect_close(spiked(2, 2), 5.0, "masked cell filled from neighbours", 1.0e-4);

    bool threw = false;
    try
    {
        (void)create_smoothing_filter("median", 3);
    }
    catch (const ConfigurationError&)
    {
        threw = true;
    }
    failures += expect_true(threw, "unknown smoothing filter rejected");

    return failures;
}

int test_small_block_shift()
{
    int failures = 0;

    Field2D first(4, 4, 0.0f);
    Field2D second(4, 4, 0.0f);
    for (int r = 1; r <= 2; ++r)
    {
        first(r, 0) = first(r, 1) = 10.0f;
        second(r, 1) = second(r, 2) = 10.0f;
    }
    const double interval = 300.0;
    const FieldGrid prev(geometry(4, 4), 0.0, first);
    const FieldGrid curr(geometry(4, 4), interval, second);

    MotionConfig cfg;
    const MotionField motion = estimate_motion(prev, curr, cfg);

    failures += expect_true(motion.same_shape(4, 4), "motion shape");
    failures += expect_true(!motion.low_confidence, "clean shift is confident");
    failures += expect_close(motion.interval_s, interval, "motion interval");
    for (int r = 0; r < 4; ++r)
    {
        for (int c = 0; c < 4; ++c)
        {
            failures += expect_close(motion.u(r, c) * interval, 1.0, "exact one-cell eastward displacement", 1.0e-5);
            failures += expect_close(motion.v(r, c) * interval, 0.0, "no north-south displacement", 1.0e-9);
        }
    }
    failures += expect_close(motion.quality, 1.0, "perfect match quality", 1.0e-6);
    failures += expect_close(motion.direct_fraction(), 1.0, "single block covers the grid");

    return failures;
}

int test_translated_echo()
{
    int failures = 0;

    const double interval = 600.0;
    const FieldGrid prev = gaussian_echo(48, 22.0, 20.0, 0.0);
    const FieldGrid curr = gaussian_echo(48, 23.0, 22.0, interval);

    MotionConfig cfg;
    cfg.displacement_penalty = 0.0;

    cfg.scheme_id = "global_translation";
    const MotionField global = estimate_motion(prev, curr, cfg);
    failures += expect_true(!global.low_confidence, "global translation confident");
    failures += expect_close(global.u(22, 20) * interval, 2.0, "global column displacement", 1.0e-4);
    failures += expect_close(global.v(22, 20) * interval, 1.0, "global row displacement", 1.0e-4);
    failures += expect_close(global.u(0, 0), global.u(47, 47), "global field is uniform", 1.0e-6);

    cfg.scheme_id = "Block-Match";
    const MotionField local = estimate_motion(prev, curr, cfg);
    failures += expect_true(!local.low_confidence, "block matching confident");
    failures += expect_close(local.u(22, 20) * interval, 2.0, "block column displacement", 1.0e-4);
    failures += expect_close(local.v(22, 20) * interval, 1.0, "block row displacement", 1.0e-4);
    failures += expect_true(local.valid[22 * 48 + 20] != 0, "echo block is a direct estimate");
    failures += expect_true(local.direct_fraction() < 1.0, "blocks without echo are filled, not direct");
    failures += expect_true(std::abs(local.u(0, 47)) > 0.0f, "filled vectors extend to echo-free blocks");

    cfg.scheme_id = "persistence";
    const MotionField still = estimate_motion(prev, curr, cfg);
    failures += expect_close(still.max_speed_cells_per_s(), 0.0, "persistence motion is zero");
    failures += expect_true(still.low_confidence, "persistence motion is flagged low confidence");

    return failures;
}

int test_sparse_and_invalid_inputs()
{
    int failures = 0;
    MotionConfig cfg;

    Field2D a(48, 48, 0.0f);
    Field2D b(48, 48, 0.0f);
    a(10, 10) = 30.0f;
    b(10, 11) = 30.0f;
    const MotionField sparse = estimate_motion(FieldGrid(geometry(48, 48), 0.0, a),
                                               FieldGrid(geometry(48, 48), 300.0, b), cfg);
    failures += expect_true(sparse.low_confidence, "sparse echo gives low confidence");
    failures += expect_close(sparse.max_speed_cells_per_s(), 0.0, "sparse echo gives zero motion");
    failures += expect_true(sparse.valid_fraction < cfg.min_valid_fraction, "sparse valid fraction reported");

    const FieldGrid clear0(geometry(16, 16), 0.0, Field2D(16, 16, 0.0f));
    const FieldGrid clear1(geometry(16, 16), 300.0, Field2D(16, 16, 0.0f));
    const MotionField none = estimate_motion(clear0, clear1, cfg);
    failures += expect_close(none.max_speed_cells_per_s(), 0.0, "no echo gives zero motion");

    bool threw = false;
    try
    {
        (void)estimate_motion(clear0, FieldGrid(geometry(16, 8), 300.0, Field2D(16, 8, 0.0f)), cfg);
    }
    catch (const ConfigurationError&)
    {
        threw = true;
    }
    failures += expect_true(threw, "geometry mismatch rejected");

    threw = false;
    try
    {
        (void)estimate_motion(clear1, clear0, cfg);
    }
    catch (const ConfigurationError&)
    {
        threw = true;
    }
    failures += expect_true(threw, "reversed timestamps rejected");

    threw = false;
    try
    {
        (void)create_motion_scheme("optical_flow");
    }
    catch (const ConfigurationError&)
    {
        threw = true;
    }
    failures += expect_true(threw, "unknown motion scheme rejected");
    failures += expect_true(create_motion_scheme("blockmatch")->name() == "block_match", "scheme alias resolves");
    for (const std::string& id : get_available_motion_schemes())
    {
        failures += expect_true(create_motion_scheme(id)->name() == id, id + " scheme resolves to itself");
    }

    return failures;
}

int test_motion_field_helpers()
{
    int failures = 0;

    MotionField m = MotionField::zero(2, 2, 300.0);
    failures += expect_true(m.low_confidence, "zero motion is low confidence");
    m.u.fill(3.0f);
    m.v.fill(4.0f);
    failures += expect_close(m.max_speed_cells_per_s(), 5.0, "max speed");
    failures += expect_close(m.mean_speed_cells_per_s(), 5.0, "mean speed", 1.0e-6);
    const MotionField half = m.scaled(0.5);
    failures += expect_close(half.max_speed_cells_per_s(), 2.5, "scaled speed", 1.0e-6);
    failures += expect_close(m.u(0, 0), 3.0, "scaling leaves source untouched");

    return failures;
}

} // namespace

int main()
{
    int failures = 0;
    failures += test_smoothing_filters();
    failures += test_small_block_shift();
    failures += test_translated_echo();
    failures += test_sparse_and_invalid_inputs();
    failures += test_motion_field_helpers();

    if (failures > 0)
    {
        std::cerr << "[motion-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[motion-regression] all checks passed" << std::endl;
    return 0;
}
