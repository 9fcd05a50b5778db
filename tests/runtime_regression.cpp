#include "logging.hpp"
#include "npy_io.hpp"
#include "nowcast_runtime.hpp"
#include "runtime_config.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace nowcast;

namespace
{

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[runtime-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int expect_close(double actual, double expected, const std::string& label, double tol = 1.0e-9)
{
    if (!(std::abs(actual - expected) <= tol))
    {
        std::cerr << "[runtime-regression] FAIL: " << label
                  << " actual=" << actual
                  << " expected=" << expected
                  << " tol=" << tol << std::endl;
        return 1;
    }
    return 0;
}

std::filesystem::path scratch_dir(const std::string& name)
{
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / ("nowcast_runtime_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

Field2D echo_at(int n, double centre_r, double centre_c)
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
    return values;
}

int test_yaml_configuration()
{
    int failures = 0;
    const std::filesystem::path dir = scratch_dir("yaml");
    const std::filesystem::path path = dir / "nowcast.yaml";
    {
        std::ofstream out(path);
        out << "# test configuration\n"
            << "logging:\n"
            << "  profile: quiet\n"
            << "motion:\n"
            << "  scheme: global_translation   # whole-domain match\n"
            << "  block_size: 8\n"
            << "  displacement_penalty: bogus\n"
            << "  subpixel: false\n"
            << "blend:\n"
            << "  half_life_s: 900\n"
            << "  fallback: \"zero\"\n"
            << "sequencer:\n"
            << "  strategy: basic\n"
            << "input:\n"
            << "  nodata_value: none\n"
            << "  zero_below: 2.5\n"
            << "  max_history: 6\n"
            << "validation:\n"
            << "  guard_mode: strict\n"
            << "grid:\n"
            << "  dx_m: 500\n"
            << "  projection: \"EPSG:3067\"\n"
            << "forecast:\n"
            << "  lead_times_s: [300, 900]\n"
            << "output:\n"
            << "  prune_stale: false\n"
            << "  nodata_value: -1\n";
    }

    std::string error;
    const ConfigMap map = parse_yaml_simple(path.string(), &error);
    failures += expect_true(error.empty(), "yaml parsed: " + error);
    failures += expect_true(map.count("motion.scheme") == 1, "nested keys flattened");
    failures += expect_true(map.count("motion.scheme") && map.at("motion.scheme") == "global_translation",
                            "inline comment stripped");
    failures += expect_true(is_known_config_key("motion.scheme") && !is_known_config_key("motion.colour"),
                            "known key table");

    RuntimeSettings settings;
    failures += expect_true(load_runtime_settings(path.string(), settings, error), "settings loaded: " + error);
    failures += expect_true(global_log_profile == LogProfile::quiet, "logging profile applied");

    const NowcastConfig& cfg = settings.engine;
    failures += expect_true(cfg.motion.scheme_id == "global_translation", "motion scheme");
    failures += expect_true(cfg.motion.block_size == 8, "block size");
    failures += expect_close(cfg.motion.displacement_penalty, 0.01, "invalid value keeps default");
    failures += expect_true(!cfg.motion.subpixel, "subpixel flag");
    failures += expect_close(cfg.blend.half_life_s, 900.0, "half-life");
    failures += expect_true(cfg.blend.fallback == "zero", "quoted value unwrapped");
    failures += expect_true(cfg.sequencer.strategy == "basic", "strategy");
    failures += expect_true(!cfg.input.has_nodata_value, "nodata sentinel disabled");
    failures += expect_true(cfg.input.has_zero_below && cfg.input.zero_below == 2.5f, "zero floor enabled");
    failures += expect_true(cfg.input.max_history == 6, "max history");
    failures += expect_true(cfg.validation.mode == GuardMode::Strict, "guard mode");
    failures += expect_close(settings.grid.dx_m, 500.0, "grid dx");
    failures += expect_close(settings.grid.dy_m, 1000.0, "grid dy default");
    failures += expect_true(settings.grid.projection == "EPSG:3067", "projection");
    failures += expect_true(!settings.output.prune_stale, "prune flag");
    failures += expect_close(settings.output.nodata_value, -1.0, "output nodata value");

    const std::vector<double> leads = resolve_lead_times(settings.forecast);
    failures += expect_true(leads.size() == 2 && leads[0] == 300.0 && leads[1] == 900.0, "explicit lead list");

    ForecastSchedule schedule;
    schedule.steps = 3;
    schedule.interval_s = 300.0;
    const std::vector<double> stepped = resolve_lead_times(schedule);
    failures += expect_true(stepped.size() == 3 && stepped[2] == 900.0, "lead times from steps");

    failures += expect_true(!load_runtime_settings((dir / "missing.yaml").string(), settings, error),
                            "missing config reported");

    global_log_profile = LogProfile::quiet;
    std::filesystem::remove_all(dir);
    return failures;
}

int test_frame_names()
{
    int failures = 0;

    double ts = 0.0;
    failures += expect_true(parse_frame_timestamp("2024-06-01T12-00-00Z.npy", ts), "timestamp name parsed");
    failures += expect_close(ts, 1717243200.0, "timestamp value");
    failures += expect_true(format_frame_timestamp(ts + 600.0) == "2024-06-01T12-10-00Z", "timestamp formatted");
    failures += expect_true(parse_frame_timestamp("2024-06-01T12-00-00Z", ts), "bare timestamp parsed");
    failures += expect_true(!parse_frame_timestamp("radar_latest.npy", ts), "non-timestamp name rejected");
    failures += expect_true(!parse_frame_timestamp("2024-13-01T12-00-00Z.npy", ts), "invalid month rejected");

    return failures;
}

int test_file_based_run()
{
    int failures = 0;
    const std::filesystem::path input = scratch_dir("input");
    const std::filesystem::path output = scratch_dir("output");
    std::string error;

    const int n = 32;
    failures += expect_true(save_npy_field(input / "2024-06-01T12-00-00Z.npy", echo_at(n, 14.0, 10.0), error), error);
    failures += expect_true(save_npy_field(input / "2024-06-01T12-10-00Z.npy", echo_at(n, 15.0, 12.0), error), error);
    failures += expect_true(save_npy_field(input / "2024-06-01T12-20-00Z.npy", echo_at(n, 16.0, 14.0), error), error);
    failures += expect_true(save_npy_field(input / "background.npy", Field2D(n, n, 99.0f), error), error);
    failures += expect_true(save_npy_field(output / "2020-01-01T00-00-00Z.npy", Field2D(n, n, 0.0f), error), error);
    failures += expect_true(save_npy_field(output / "notes.npy", Field2D(n, n, 0.0f), error), error);

    GridSettings grid;
    std::vector<FieldGrid> history;
    failures += expect_true(load_history(input, grid, 2, history, error), "history loaded: " + error);
    failures += expect_true(history.size() == 2, "history limited to the most recent frames");
    if (history.size() == 2)
    {
        failures += expect_close(history.back().timestamp_s(), 1717243200.0 + 1200.0, "history sorted by time");
        failures += expect_true(history.back().rows() == n && history.back().cols() == n, "history shape");
    }

    NowcastRunOptions options;
    options.input_dir = input.string();
    options.output_dir = output.string();
    options.lead_times_s = {600.0, 1200.0};
    options.log_profile = "quiet";
    failures += expect_true(run_nowcast(options) == 0, "file-based run succeeds");

    const std::filesystem::path first = output / "2024-06-01T12-30-00Z.npy";
    const std::filesystem::path second = output / "2024-06-01T12-40-00Z.npy";
    failures += expect_true(std::filesystem::exists(first) && std::filesystem::exists(second), "forecast frames written");
    failures += expect_true(std::filesystem::exists(output / "forecast_report.json"), "report written");
    failures += expect_true(!std::filesystem::exists(output / "2020-01-01T00-00-00Z.npy"), "stale frame pruned");
    failures += expect_true(std::filesystem::exists(output / "notes.npy"), "unrelated files kept");

    Field2D written;
    failures += expect_true(load_npy_field(first, written, error), "forecast frame readable: " + error);
    if (written.rows() == n)
    {
        failures += expect_close(written(16, 0), 255.0, "no-data cells written with the output sentinel");
        failures += expect_true(written(17, 16) > 5.0f, "echo present near its advected position");
    }

    std::ifstream report(output / "forecast_report.json");
    const std::string json((std::istreambuf_iterator<char>(report)), std::istreambuf_iterator<char>());
    failures += expect_true(json.find("\"strategy\": \"advanced\"") != std::string::npos, "report strategy");
    failures += expect_true(json.find("2024-06-01T12-20-00Z") != std::string::npos, "report latest observation");
    failures += expect_true(json.find("\"lead_time_s\"") != std::string::npos, "report frame entries");

    NowcastRunOptions bad = options;
    bad.strategy = "ensemble";
    failures += expect_true(run_nowcast(bad) == 2, "invalid strategy is a configuration error");

    NowcastRunOptions missing = options;
    missing.input_dir = (input / "absent").string();
    failures += expect_true(run_nowcast(missing) == 1, "missing input directory is an I/O error");

    std::filesystem::remove_all(input);
    std::filesystem::remove_all(output);
    return failures;
}

int test_output_into_input_directory()
{
    int failures = 0;
    const std::filesystem::path dir = scratch_dir("shared");
    std::string error;

    const int n = 32;
    const std::vector<std::string> observed = {
        "2024-06-01T12-00-00Z.npy",
        "2024-06-01T12-10-00Z.npy",
        "2024-06-01T12-20-00Z.npy",
    };
    for (std::size_t i = 0; i < observed.size(); ++i)
    {
        const double shift = static_cast<double>(i);
        failures += expect_true(save_npy_field(dir / observed[i], echo_at(n, 14.0 + shift, 10.0 + 2.0 * shift), error), error);
    }

    NowcastRunOptions options;
    options.input_dir = dir.string();
    options.output_dir = (dir / ".").string();
    options.lead_times_s = {600.0};
    options.log_profile = "quiet";
    failures += expect_true(run_nowcast(options) == 0, "run into the input directory succeeds");

    for (const std::string& name : observed)
    {
        failures += expect_true(std::filesystem::exists(dir / name), "observation kept: " + name);
    }
    failures += expect_true(std::filesystem::exists(dir / "2024-06-01T12-30-00Z.npy"), "forecast written beside observations");

    std::filesystem::remove_all(dir);
    return failures;
}

} // namespace

int main()
{
    global_log_profile = LogProfile::quiet;

    int failures = 0;
    failures += test_yaml_configuration();
    failures += test_frame_names();
    failures += test_file_based_run();
    failures += test_output_into_input_directory();

    if (failures > 0)
    {
        std::cerr << "[runtime-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[runtime-regression] all checks passed" << std::endl;
    return 0;
}
