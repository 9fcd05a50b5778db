#include "field_grid.hpp"
#include "nowcast_config.hpp"
#include "nowcast_errors.hpp"
#include "sequencer_base.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace nowcast;

namespace
{

constexpr int kSize = 48;
constexpr double kInterval = 600.0;

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[sequencer-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int expect_close(double actual, double expected, const std::string& label, double tol = 1.0e-9)
{
    if (!(std::abs(actual - expected) <= tol))
    {
        std::cerr << "[sequencer-regression] FAIL: " << label
                  << " actual=" << actual
                  << " expected=" << expected
                  << " tol=" << tol << std::endl;
        return 1;
    }
    return 0;
}

GridGeometry geometry()
{
    GridGeometry g;
    g.rows = kSize;
    g.cols = kSize;
    return g;
}

FieldGrid echo_at(double centre_r, double centre_c, double timestamp_s)
{
    Field2D values(kSize, kSize, 0.0f);
    for (int r = 0; r < kSize; ++r)
    {
        for (int c = 0; c < kSize; ++c)
        {
            const double d2 = (r - centre_r) * (r - centre_r) + (c - centre_c) * (c - centre_c);
            values(r, c) = static_cast<float>(40.0 * std::exp(-d2 / 18.0));
        }
    }
    return FieldGrid(geometry(), timestamp_s, std::move(values));
}

// Echo moving two columns east and one row south per interval.
std::vector<FieldGrid> moving_history()
{
    return {
        echo_at(21.0, 18.0, 0.0),
        echo_at(22.0, 20.0, kInterval),
        echo_at(23.0, 22.0, 2.0 * kInterval),
    };
}

NowcastConfig test_config(const std::string& strategy)
{
    NowcastConfig cfg;
    cfg.motion.displacement_penalty = 0.0;
    cfg.sequencer.strategy = strategy;
    return cfg;
}

void argmax(const FieldGrid& grid, int& best_r, int& best_c)
{
    float best = -1.0f;
    best_r = best_c = -1;
    for (int r = 0; r < grid.rows(); ++r)
    {
        for (int c = 0; c < grid.cols(); ++c)
        {
            if (grid.is_valid(r, c) && grid.value(r, c) > best)
            {
                best = grid.value(r, c);
                best_r = r;
                best_c = c;
            }
        }
    }
}

int test_frames_follow_the_echo()
{
    int failures = 0;

    const std::vector<FieldGrid> history = moving_history();
    const NowcastConfig cfg = test_config("basic");
    const auto sequencer = create_sequencer(cfg.sequencer.strategy);
    SequencerDiagnostics diag;
    const std::vector<ForecastFrame> frames =
        sequencer->forecast(history, {600.0, 1200.0, 1800.0}, cfg, FrameObserver(), &diag);

    failures += expect_true(frames.size() == 3, "one frame per lead time");
    failures += expect_true(!diag.low_confidence, "clean translation is confident");
    failures += expect_true(diag.frames_used == 2, "basic strategy uses the last pair");
    failures += expect_close(diag.mean_interval_s, kInterval, "mean interval");
    failures += expect_true(diag.max_substeps > 1, "multi-cell steps are substepped");

    const double last_t = history.back().timestamp_s();
    double previous_confidence = 1.0;
    for (std::size_t i = 0; i < frames.size(); ++i)
    {
        const ForecastFrame& frame = frames[i];
        const double lead = 600.0 * static_cast<double>(i + 1);
        failures += expect_close(frame.lead_time_s, lead, "frame lead time");
        failures += expect_close(frame.grid.timestamp_s(), last_t + lead, "frame valid time");
        failures += expect_true(frame.confidence >= 0.0 && frame.confidence <= previous_confidence,
                                "confidence bounded and non-increasing");
        previous_confidence = frame.confidence;

        float lo = 0.0f;
        float hi = 0.0f;
        failures += expect_true(frame.grid.value_range(lo, hi), "frame carries data");
        failures += expect_true(lo >= 0.0f && hi <= 40.0f, "frame stays within the observed range");
    }
    failures += expect_close(frames[0].confidence, std::exp2(-600.0 / 1800.0), "first-step confidence", 1.0e-3);

    int r = 0;
    int c = 0;
    argmax(frames[0].grid, r, c);
    failures += expect_true(std::abs(r - 24) <= 1 && std::abs(c - 24) <= 1, "echo core advanced one interval");
    argmax(frames[2].grid, r, c);
    failures += expect_true(std::abs(r - 26) <= 1 && std::abs(c - 28) <= 1, "echo core advanced three intervals");

    return failures;
}

int test_lead_order_and_duplicates()
{
    int failures = 0;

    const NowcastConfig cfg = test_config("advanced");
    const auto sequencer = create_sequencer(cfg.sequencer.strategy);
    const std::vector<ForecastFrame> frames = sequencer->forecast(moving_history(), {1200.0, 600.0, 1200.0}, cfg);

    failures += expect_true(frames.size() == 3, "duplicate leads each produce a frame");
    if (frames.size() == 3)
    {
        failures += expect_close(frames[0].lead_time_s, 1200.0, "requested order kept [0]");
        failures += expect_close(frames[1].lead_time_s, 600.0, "requested order kept [1]");
        failures += expect_close(frames[2].lead_time_s, 1200.0, "requested order kept [2]");
        failures += expect_true(frames[0].grid.values() == frames[2].grid.values(), "duplicate leads share one frame");
        failures += expect_true(frames[1].confidence >= frames[0].confidence, "shorter lead at least as confident");
    }

    return failures;
}

int test_deterministic_and_strategies_differ()
{
    int failures = 0;

    const std::vector<FieldGrid> history = moving_history();
    const std::vector<double> leads = {900.0, 2700.0};

    const NowcastConfig advanced_cfg = test_config("advanced");
    const auto advanced = create_sequencer("advanced");
    const std::vector<ForecastFrame> a1 = advanced->forecast(history, leads, advanced_cfg);
    const std::vector<ForecastFrame> a2 = advanced->forecast(history, leads, advanced_cfg);
    bool same = a1.size() == a2.size();
    for (std::size_t i = 0; same && i < a1.size(); ++i)
    {
        same = a1[i].grid.values() == a2[i].grid.values() &&
               a1[i].grid.valid_mask() == a2[i].grid.valid_mask() &&
               a1[i].confidence == a2[i].confidence;
    }
    failures += expect_true(same, "repeated runs are identical");

    const NowcastConfig basic_cfg = test_config("basic");
    const std::vector<ForecastFrame> b = create_sequencer("basic")->forecast(history, leads, basic_cfg);
    failures += expect_true(b.size() == a1.size(), "strategies produce the same frame count");
    if (b.size() == 2 && a1.size() == 2)
    {
        failures += expect_true(b[1].grid.values() != a1[1].grid.values(), "advanced frames differ from basic");
        failures += expect_true(b[1].grid.geometry().compatible_with(a1[1].grid.geometry()), "shared geometry");
    }

    SequencerDiagnostics diag;
    (void)advanced->forecast(history, leads, advanced_cfg, FrameObserver(), &diag);
    failures += expect_true(diag.frames_used == 3, "advanced strategy uses the whole short history");

    const MotionField blended = ForecastSequencer::temporal_motion(history, advanced_cfg.motion, 0.5);
    failures += expect_true(!blended.low_confidence, "temporal motion confident");
    failures += expect_close(blended.u(22, 20) * kInterval, 2.0, "temporal motion east", 1.0e-3);
    failures += expect_close(blended.v(22, 20) * kInterval, 1.0, "temporal motion south", 1.0e-3);

    return failures;
}

int test_degenerate_histories()
{
    int failures = 0;
    const std::vector<double> leads = {600.0, 1200.0};

    for (const std::string& strategy : get_available_sequencers())
    {
        const NowcastConfig cfg = test_config(strategy);
        const auto sequencer = create_sequencer(strategy);

        std::vector<FieldGrid> masked = moving_history();
        masked.back() = FieldGrid::no_data(geometry(), masked.back().timestamp_s());
        const std::vector<ForecastFrame> blank = sequencer->forecast(masked, leads, cfg);
        bool all_blank = blank.size() == leads.size();
        for (const ForecastFrame& frame : blank)
        {
            all_blank = all_blank && frame.grid.valid_count() == 0 && frame.confidence == 0.0;
        }
        failures += expect_true(all_blank, strategy + ": fully masked input gives no-data frames");

        const std::vector<FieldGrid> clear = {
            FieldGrid(geometry(), 0.0, Field2D(kSize, kSize, 0.0f)),
            FieldGrid(geometry(), kInterval, Field2D(kSize, kSize, 0.0f)),
        };
        SequencerDiagnostics diag;
        const std::vector<ForecastFrame> dry = sequencer->forecast(clear, leads, cfg, FrameObserver(), &diag);
        bool all_dry = dry.size() == leads.size();
        for (const ForecastFrame& frame : dry)
        {
            float lo = 0.0f;
            float hi = 0.0f;
            all_dry = all_dry && frame.confidence == 0.0 && frame.grid.value_range(lo, hi) && lo == 0.0f && hi == 0.0f;
        }
        failures += expect_true(all_dry, strategy + ": zero precipitation stays zero with zero confidence");
        failures += expect_true(diag.low_confidence, strategy + ": zero precipitation flagged low confidence");

        const std::vector<FieldGrid> single = {echo_at(22.0, 20.0, 0.0)};
        const std::vector<ForecastFrame> held = sequencer->forecast(single, leads, cfg);
        failures += expect_true(held.size() == leads.size(), strategy + ": single frame still forecasts");
        if (!held.empty())
        {
            failures += expect_close(held[0].confidence, 0.2 * std::exp2(-600.0 / 1800.0),
                                     strategy + ": single frame confidence", 1.0e-9);
            int r = 0;
            int c = 0;
            argmax(held[0].grid, r, c);
            failures += expect_true(r == 22 && c == 20, strategy + ": single frame persists in place");
        }
    }

    return failures;
}

int test_irregular_spacing_and_cancellation()
{
    int failures = 0;

    const NowcastConfig cfg = test_config("advanced");
    const auto sequencer = create_sequencer(cfg.sequencer.strategy);

    std::vector<FieldGrid> history = moving_history();
    history.back() = history.back().retimed(2.5 * kInterval);
    SequencerDiagnostics diag;
    (void)sequencer->forecast(history, {600.0}, cfg, FrameObserver(), &diag);
    failures += expect_true(diag.irregular_spacing, "uneven intervals flagged");
    failures += expect_close(diag.relative_spacing_spread, 0.4, "relative spacing spread", 1.0e-9);
    failures += expect_close(diag.base_confidence, diag.motion_quality / 1.4, "irregular spacing lowers confidence", 1.0e-9);

    int calls = 0;
    const FrameObserver stop_after_first = [&calls](const ForecastFrame&)
    {
        ++calls;
        return false;
    };
    const std::vector<ForecastFrame> partial =
        sequencer->forecast(moving_history(), {600.0, 1200.0, 1800.0}, cfg, stop_after_first, &diag);
    failures += expect_true(calls == 1, "observer called once before cancellation");
    failures += expect_true(partial.size() == 1, "cancelled run returns produced frames only");
    failures += expect_true(diag.cancelled, "cancellation reported");

    bool threw = false;
    try
    {
        (void)create_sequencer("ensemble");
    }
    catch (const ConfigurationError&)
    {
        threw = true;
    }
    failures += expect_true(threw, "unknown strategy rejected");
    failures += expect_true(create_sequencer("Simple")->name() == "basic", "strategy alias resolves");

    return failures;
}

} // namespace

int main()
{
    int failures = 0;
    failures += test_frames_follow_the_echo();
    failures += test_lead_order_and_duplicates();
    failures += test_deterministic_and_strategies_differ();
    failures += test_degenerate_histories();
    failures += test_irregular_spacing_and_cancellation();

    if (failures > 0)
    {
        std::cerr << "[sequencer-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[sequencer-regression] all checks passed" << std::endl;
    return 0;
}
