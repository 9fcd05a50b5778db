/**
 * @file nowcast_runtime.cpp
 * @brief File-based nowcast execution for the runner.
 */

#include "nowcast_runtime.hpp"
#include "field_validation.hpp"
#include "forecast_engine.hpp"
#include "logging.hpp"
#include "npy_io.hpp"
#include "nowcast_errors.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <regex>
#include <set>
#include <sstream>

namespace nowcast
{

namespace
{

const std::regex& frame_name_re()
{
    static const std::regex re("^([0-9]{4})-([0-9]{2})-([0-9]{2})T([0-9]{2})-([0-9]{2})-([0-9]{2})Z(\\..*)?$");
    return re;
}

std::filesystem::path report_path(const OutputSettings& output)
{
    const std::filesystem::path report(output.report);
    if (report.is_absolute())
    {
        return report;
    }
    return std::filesystem::path(output.dir) / report;
}

bool same_directory(const std::filesystem::path& a, const std::filesystem::path& b)
{
    std::error_code ec;
    const bool equivalent = std::filesystem::equivalent(a, b, ec);
    if (!ec)
    {
        return equivalent;
    }
    return std::filesystem::weakly_canonical(a, ec) == std::filesystem::weakly_canonical(b, ec);
}

}

void apply_runtime_config(const ConfigMap& config, RuntimeSettings& out)
{
    auto read_double = [&](const char* key, double& target)
    {
        const auto it = config.find(key);
        if (it != config.end() && !try_parse_double_value(it->second, target))
        {
            warn_invalid_config_value(key, it->second, "a finite number");
        }
    };
    auto read_string = [&](const char* key, std::string& target)
    {
        const auto it = config.find(key);
        if (it != config.end() && !it->second.empty())
        {
            target = it->second;
        }
    };

    read_string("input.dir", out.input_dir);

    read_double("grid.dx_m", out.grid.dx_m);
    read_double("grid.dy_m", out.grid.dy_m);
    read_double("grid.x0_m", out.grid.x0_m);
    read_double("grid.y0_m", out.grid.y0_m);
    read_string("grid.projection", out.grid.projection);

    if (config.count("forecast.steps"))
    {
        const std::string& value = config.at("forecast.steps");
        if (!try_parse_positive_int_value(value, out.forecast.steps))
        {
            warn_invalid_config_value("forecast.steps", value, "a positive integer");
        }
    }
    read_double("forecast.interval_s", out.forecast.interval_s);
    if (config.count("forecast.lead_times_s"))
    {
        std::vector<double> leads;
        bool ok = true;
        for (const std::string& item : parse_string_list(config.at("forecast.lead_times_s")))
        {
            double lead = 0.0;
            if (!try_parse_double_value(item, lead))
            {
                ok = false;
                break;
            }
            leads.push_back(lead);
        }
        if (ok)
        {
            out.forecast.lead_times_s = std::move(leads);
        }
        else
        {
            warn_invalid_config_value("forecast.lead_times_s", config.at("forecast.lead_times_s"),
                                      "a list of numbers");
        }
    }

    read_string("output.dir", out.output.dir);
    read_string("output.report", out.output.report);
    if (config.count("output.nodata_value"))
    {
        double parsed = out.output.nodata_value;
        if (try_parse_double_value(config.at("output.nodata_value"), parsed))
        {
            out.output.nodata_value = static_cast<float>(parsed);
        }
        else
        {
            warn_invalid_config_value("output.nodata_value", config.at("output.nodata_value"), "a finite number");
        }
    }
    if (config.count("output.prune_stale"))
    {
        out.output.prune_stale = parse_bool_value(config.at("output.prune_stale"));
    }
    if (config.count("output.write_stats"))
    {
        out.output.write_stats = parse_bool_value(config.at("output.write_stats"));
    }
}

bool load_runtime_settings(const std::string& config_path, RuntimeSettings& out, std::string& error)
{
    error.clear();
    const ConfigMap config = parse_yaml_simple(config_path, &error);
    if (!error.empty())
    {
        return false;
    }

    apply_logging_config(config);
    const int consumed = apply_nowcast_config(config, out.engine);
    apply_runtime_config(config, out);

    if (log_normal_enabled())
    {
        std::cout << "[config] loaded " << config_path << " (" << config.size() << " keys, "
                  << consumed << " engine keys)" << std::endl;
    }
    return true;
}

std::vector<double> resolve_lead_times(const ForecastSchedule& schedule)
{
    if (!schedule.lead_times_s.empty())
    {
        return schedule.lead_times_s;
    }
    std::vector<double> leads;
    leads.reserve(static_cast<std::size_t>(std::max(schedule.steps, 0)));
    for (int i = 1; i <= schedule.steps; ++i)
    {
        leads.push_back(static_cast<double>(i) * schedule.interval_s);
    }
    return leads;
}

bool parse_frame_timestamp(const std::string& filename, double& timestamp_s)
{
    std::smatch match;
    if (!std::regex_match(filename, match, frame_name_re()))
    {
        return false;
    }

    std::tm tm{};
    tm.tm_year = std::stoi(match[1].str()) - 1900;
    tm.tm_mon = std::stoi(match[2].str()) - 1;
    tm.tm_mday = std::stoi(match[3].str());
    tm.tm_hour = std::stoi(match[4].str());
    tm.tm_min = std::stoi(match[5].str());
    tm.tm_sec = std::stoi(match[6].str());
    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60)
    {
        return false;
    }

    timestamp_s = static_cast<double>(timegm(&tm));
    return true;
}

std::string format_frame_timestamp(double timestamp_s)
{
    const std::time_t t = static_cast<std::time_t>(std::llround(timestamp_s));
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H-%M-%SZ");
    return oss.str();
}

bool load_history(const std::filesystem::path& dir,
                  const GridSettings& grid,
                  int max_history,
                  std::vector<FieldGrid>& out,
                  std::string& error)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec))
    {
        error = "Input path is not a directory: " + dir.string();
        return false;
    }

    std::vector<std::pair<double, std::filesystem::path>> frames;
    for (const auto& entry : std::filesystem::directory_iterator(dir))
    {
        if (!entry.is_regular_file() || entry.path().extension() != ".npy")
        {
            continue;
        }
        double ts = 0.0;
        if (!parse_frame_timestamp(entry.path().filename().string(), ts))
        {
            if (log_debug_enabled())
            {
                std::cout << "[runtime] skipping " << entry.path().filename().string()
                          << " (name is not a timestamp)" << std::endl;
            }
            continue;
        }
        frames.emplace_back(ts, entry.path());
    }

    if (frames.empty())
    {
        error = "No timestamp-named .npy frames found in " + dir.string();
        return false;
    }

    std::sort(frames.begin(), frames.end(), [](const auto& a, const auto& b)
    {
        return a.first < b.first;
    });
    const std::size_t keep = std::min(frames.size(), static_cast<std::size_t>(std::max(max_history, 1)));
    frames.erase(frames.begin(), frames.end() - static_cast<std::ptrdiff_t>(keep));

    out.clear();
    out.reserve(frames.size());
    for (const auto& frame : frames)
    {
        Field2D values;
        if (!load_npy_field(frame.second, values, error))
        {
            error = "Failed to load " + frame.second.string() + ": " + error;
            return false;
        }

        GridGeometry geometry;
        geometry.rows = values.rows();
        geometry.cols = values.cols();
        geometry.dx_m = grid.dx_m;
        geometry.dy_m = grid.dy_m;
        geometry.x0_m = grid.x0_m;
        geometry.y0_m = grid.y0_m;
        geometry.projection = grid.projection;
        out.emplace_back(std::move(geometry), frame.first, std::move(values));

        if (log_debug_enabled())
        {
            std::cout << "[runtime] loaded " << frame.second.filename().string() << " ("
                      << out.back().rows() << "x" << out.back().cols() << ")" << std::endl;
        }
    }
    return true;
}

bool write_forecast_frames(const ForecastResult& result,
                           const OutputSettings& output,
                           std::vector<std::filesystem::path>& written,
                           std::string& error)
{
    const std::filesystem::path dir(output.dir);
    for (const ForecastFrame& frame : result.frames)
    {
        const std::filesystem::path path = dir / (format_frame_timestamp(frame.grid.timestamp_s()) + ".npy");
        if (std::find(written.begin(), written.end(), path) != written.end())
        {
            continue;
        }

        std::vector<float> buffer = frame.grid.values().values();
        const Mask2D& mask = frame.grid.valid_mask();
        for (std::size_t i = 0; i < buffer.size(); ++i)
        {
            if (!mask[i])
            {
                buffer[i] = output.nodata_value;
            }
        }

        if (!save_npy_float32_2d(path, frame.grid.rows(), frame.grid.cols(), buffer, error))
        {
            return false;
        }
        written.push_back(path);
    }
    return true;
}

std::size_t prune_stale_outputs(const std::filesystem::path& dir,
                                const std::vector<std::filesystem::path>& keep)
{
    std::set<std::string> keep_names;
    for (const auto& path : keep)
    {
        keep_names.insert(path.filename().string());
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec))
    {
        return 0;
    }

    std::size_t removed = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir))
    {
        if (!entry.is_regular_file() || entry.path().extension() != ".npy")
        {
            continue;
        }
        const std::string name = entry.path().filename().string();
        double ts = 0.0;
        if (!parse_frame_timestamp(name, ts) || keep_names.count(name))
        {
            continue;
        }
        std::error_code remove_ec;
        if (std::filesystem::remove(entry.path(), remove_ec))
        {
            ++removed;
        }
        else if (remove_ec)
        {
            std::cerr << "[runtime] warning: could not remove stale " << name << ": "
                      << remove_ec.message() << std::endl;
        }
    }
    return removed;
}

std::string forecast_report_to_json(const ForecastResult& result,
                                    const RuntimeSettings& settings,
                                    double latest_observation_s)
{
    const ForecastDiagnostics& d = result.diagnostics;
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"strategy\": \"" << strutil::json_escape(d.strategy) << "\",\n";
    oss << "  \"motion_scheme\": \"" << strutil::json_escape(settings.engine.motion.scheme_id) << "\",\n";
    oss << "  \"latest_observation\": \"" << format_frame_timestamp(latest_observation_s) << "\",\n";
    oss << "  \"cancelled\": " << (d.cancelled ? "true" : "false") << ",\n";
    oss << "  \"low_confidence\": " << (d.low_confidence ? "true" : "false") << ",\n";
    oss << "  \"irregular_spacing\": " << (d.irregular_spacing ? "true" : "false") << ",\n";
    oss << "  \"history_frames_used\": " << d.history_frames_used << ",\n";
    oss << "  \"max_substeps\": " << d.max_substeps << ",\n";
    oss << "  \"sanitized_cells\": " << d.sanitized_cells << ",\n";
    oss << std::fixed << std::setprecision(6);
    oss << "  \"mean_flow_cells_per_s\": " << d.mean_flow_cells_per_s << ",\n";
    oss << "  \"mean_flow_m_per_s\": " << d.mean_flow_m_per_s << ",\n";
    oss << "  \"max_flow_cells_per_s\": " << d.max_flow_cells_per_s << ",\n";
    oss << "  \"masked_fraction\": " << d.masked_fraction << ",\n";
    oss << "  \"nodata_fraction\": " << d.nodata_fraction << ",\n";
    oss << "  \"motion_valid_fraction\": " << d.motion_valid_fraction << ",\n";
    oss << "  \"motion_quality\": " << d.motion_quality << ",\n";
    oss << "  \"confidence\": " << d.confidence << ",\n";
    oss << "  \"relative_spacing_spread\": " << d.relative_spacing_spread << ",\n";
    oss << "  \"mean_interval_s\": " << d.mean_interval_s << ",\n";
    oss << "  \"duration_ms\": " << d.duration_ms << ",\n";
    oss << "  \"frames\": [\n";
    for (std::size_t i = 0; i < result.frames.size(); ++i)
    {
        const ForecastFrame& frame = result.frames[i];
        oss << "    {\"lead_time_s\": " << frame.lead_time_s
            << ", \"valid_time\": \"" << format_frame_timestamp(frame.grid.timestamp_s()) << "\""
            << ", \"confidence\": " << frame.confidence
            << ", \"nodata_fraction\": " << frame.grid.nodata_fraction();
        if (settings.output.write_stats)
        {
            oss << ", \"stats\": " << field_stats_to_json(compute_grid_stats(frame.grid, false), 6);
        }
        oss << "}";
        if (i + 1 < result.frames.size())
        {
            oss << ",";
        }
        oss << "\n";
    }
    oss << "  ]\n";
    oss << "}\n";
    return oss.str();
}

int run_nowcast(const NowcastRunOptions& options)
{
    RuntimeSettings settings;
    if (!options.config_path.empty())
    {
        std::string error;
        if (!load_runtime_settings(options.config_path, settings, error))
        {
            std::cerr << "[runtime] " << error << std::endl;
            return 1;
        }
    }

    if (!options.log_profile.empty()) global_log_profile = parse_log_profile(options.log_profile);
    if (!options.input_dir.empty()) settings.input_dir = options.input_dir;
    if (!options.output_dir.empty()) settings.output.dir = options.output_dir;
    if (!options.strategy.empty()) settings.engine.sequencer.strategy = options.strategy;
    if (!options.lead_times_s.empty()) settings.forecast.lead_times_s = options.lead_times_s;
    if (!options.json_path.empty()) settings.output.report = options.json_path;

    std::vector<FieldGrid> history;
    std::string error;
    if (!load_history(settings.input_dir, settings.grid, settings.engine.input.max_history, history, error))
    {
        std::cerr << "[runtime] " << error << std::endl;
        return 1;
    }

    ForecastResult result;
    try
    {
        const ForecastEngine engine(settings.engine);
        ForecastRequest request;
        request.history = history;
        request.lead_times_s = resolve_lead_times(settings.forecast);

        if (log_normal_enabled())
        {
            std::cout << "[runtime] " << history.size() << " frames, latest "
                      << format_frame_timestamp(history.back().timestamp_s())
                      << ", strategy " << engine.strategy()
                      << ", " << request.lead_times_s.size() << " lead times" << std::endl;
        }
        result = engine.run(request);
    }
    catch (const ConfigurationError& e)
    {
        std::cerr << "[runtime] configuration error: " << e.what() << std::endl;
        return 2;
    }

    std::vector<std::filesystem::path> written;
    if (!write_forecast_frames(result, settings.output, written, error))
    {
        std::cerr << "[runtime] " << error << std::endl;
        return 1;
    }

    const std::filesystem::path report = report_path(settings.output);
    {
        std::error_code ec;
        if (!report.parent_path().empty())
        {
            std::filesystem::create_directories(report.parent_path(), ec);
        }
        std::ofstream out(report);
        if (!out)
        {
            std::cerr << "[runtime] failed opening report path: " << report.string() << std::endl;
            return 1;
        }
        out << forecast_report_to_json(result, settings, history.back().timestamp_s());
        if (!out.good())
        {
            std::cerr << "[runtime] failed writing report: " << report.string() << std::endl;
            return 1;
        }
    }

    std::size_t pruned = 0;
    if (settings.output.prune_stale)
    {
        if (same_directory(settings.output.dir, settings.input_dir))
        {
            std::cerr << "[runtime] warning: output.dir is the input directory, not pruning stale files" << std::endl;
        }
        else
        {
            pruned = prune_stale_outputs(settings.output.dir, written);
        }
    }

    if (log_normal_enabled())
    {
        std::cout << "[runtime] wrote " << written.size() << " frames to " << settings.output.dir
                  << " (pruned " << pruned << " stale), report " << report.string() << std::endl;
    }
    return 0;
}

} // namespace nowcast
