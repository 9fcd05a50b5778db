#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "forecast_types.hpp"
#include "nowcast_config.hpp"
#include "runtime_config.hpp"

/**
 * @file nowcast_runtime.hpp
 * @brief File-based nowcast run used by the command-line runner.
 *
 * Loads a timestamp-named history of `.npy` frames, runs the forecast
 * engine, and writes one `.npy` per forecast frame plus a JSON report.
 * Frame files are named `%Y-%m-%dT%H-%M-%SZ.npy` (UTC).
 */

namespace nowcast
{

/**
 * @brief Georeferencing applied to every loaded frame.
 */
struct GridSettings
{
    double dx_m = 1000.0;
    double dy_m = 1000.0;
    double x0_m = 0.0;
    double y0_m = 0.0;
    std::string projection;
};

/**
 * @brief Lead-time schedule; an explicit list overrides steps x interval.
 */
struct ForecastSchedule
{
    int steps = 6;
    double interval_s = 600.0;
    std::vector<double> lead_times_s;
};

struct OutputSettings
{
    std::string dir = "data/forecast";
    std::string report = "forecast_report.json";   // relative to dir unless absolute
    float nodata_value = 255.0f;                   // written for no-data cells
    bool prune_stale = true;                       // delete frame files not produced by this run
    bool write_stats = false;                      // include per-frame statistics in the report
};

struct RuntimeSettings
{
    NowcastConfig engine;
    std::string input_dir = "data/radar";
    GridSettings grid;
    ForecastSchedule forecast;
    OutputSettings output;
};

/**
 * @brief Command-line overrides applied on top of the configuration file.
 */
struct NowcastRunOptions
{
    std::string config_path;
    std::string input_dir;
    std::string output_dir;
    std::string strategy;
    std::vector<double> lead_times_s;
    std::string json_path;
    std::string log_profile;   // overrides logging.profile when set
};

/**
 * @brief Applies runner keys (input, grid, forecast, output) to settings.
 */
void apply_runtime_config(const ConfigMap& config, RuntimeSettings& out);

/**
 * @brief Loads a configuration file into runtime settings.
 * @return False with `error` set when the file cannot be read.
 */
bool load_runtime_settings(const std::string& config_path, RuntimeSettings& out, std::string& error);

/**
 * @brief Returns the lead times implied by a schedule, in seconds.
 */
std::vector<double> resolve_lead_times(const ForecastSchedule& schedule);

/**
 * @brief Parses a `%Y-%m-%dT%H-%M-%SZ` stem (extension ignored) as UTC.
 */
bool parse_frame_timestamp(const std::string& filename, double& timestamp_s);

/**
 * @brief Formats UTC seconds as `%Y-%m-%dT%H-%M-%SZ`.
 */
std::string format_frame_timestamp(double timestamp_s);

/**
 * @brief Loads the most recent `max_history` frames of a directory.
 *
 * Cells equal to `input.nodata_value` are left in place; the engine maps
 * them to no-data during preparation.
 */
bool load_history(const std::filesystem::path& dir,
                  const GridSettings& grid,
                  int max_history,
                  std::vector<FieldGrid>& out,
                  std::string& error);

/**
 * @brief Writes each frame as `<valid time>.npy`.
 */
bool write_forecast_frames(const ForecastResult& result,
                           const OutputSettings& output,
                           std::vector<std::filesystem::path>& written,
                           std::string& error);

/**
 * @brief Deletes timestamp-named `.npy` files of `dir` not listed in `keep`.
 * @return Number of removed files.
 */
std::size_t prune_stale_outputs(const std::filesystem::path& dir,
                                const std::vector<std::filesystem::path>& keep);

/**
 * @brief Serializes a forecast result with its diagnostics to JSON.
 */
std::string forecast_report_to_json(const ForecastResult& result,
                                    const RuntimeSettings& settings,
                                    double latest_observation_s);

/**
 * @brief Runs one file-based nowcast.
 * @return Zero on success, 1 on I/O failure, 2 on configuration errors.
 */
int run_nowcast(const NowcastRunOptions& options);

} // namespace nowcast
