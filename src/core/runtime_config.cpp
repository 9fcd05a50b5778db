/**
 * @file runtime_config.cpp
 * @brief Configuration parsing for the nowcast engine and runner.
 */

#include "runtime_config.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

namespace nowcast
{

namespace
{

// Keys consumed outside apply_nowcast_config (runner settings).
const char* const kRunnerKeys[] = {
    "logging.profile",
    "input.dir",
    "grid.dx_m",
    "grid.dy_m",
    "grid.x0_m",
    "grid.y0_m",
    "grid.projection",
    "forecast.steps",
    "forecast.interval_s",
    "forecast.lead_times_s",
    "output.dir",
    "output.report",
    "output.nodata_value",
    "output.prune_stale",
    "output.write_stats",
};

const char* const kEngineKeys[] = {
    "motion.scheme",
    "motion.pyramid_levels",
    "motion.block_size",
    "motion.search_radius",
    "motion.smoothing_filter",
    "motion.smoothing_kernel",
    "motion.signal_threshold",
    "motion.min_valid_fraction",
    "motion.min_overlap_fraction",
    "motion.min_correlation",
    "motion.displacement_penalty",
    "motion.outlier_threshold",
    "motion.subpixel",
    "motion.fill_mode",
    "advection.substep_threshold",
    "advection.max_substeps",
    "blend.scheme",
    "blend.half_life_s",
    "blend.fallback",
    "blend.fallback_kernel",
    "blend.max_weight",
    "sequencer.strategy",
    "sequencer.history_window",
    "sequencer.temporal_decay",
    "sequencer.motion_decay_timescale_s",
    "sequencer.scale_kernel",
    "sequencer.small_scale_lifetime_s",
    "sequencer.clamp_to_observed_range",
    "validation.guard_mode",
    "validation.percentiles",
    "input.nodata_value",
    "input.zero_below",
    "input.max_history",
};

std::string trim_line(const std::string& value)
{
    return strutil::trim_copy(value);
}

/**
 * @brief Typed readers; each counts the key when present and keeps the
 * default on an invalid literal.
 */
class ConfigReader
{
public:
    explicit ConfigReader(const ConfigMap& config) : config_(config) {}

    int consumed() const { return consumed_; }

    void read_int(const char* key, int& target)
    {
        const std::string* value = find(key);
        if (value == nullptr)
        {
            return;
        }
        if (!try_parse_int_value(*value, target))
        {
            warn_invalid_config_value(key, *value, "an integer");
        }
    }

    void read_double(const char* key, double& target)
    {
        const std::string* value = find(key);
        if (value == nullptr)
        {
            return;
        }
        if (!try_parse_double_value(*value, target))
        {
            warn_invalid_config_value(key, *value, "a finite number");
        }
    }

    void read_float(const char* key, float& target)
    {
        double parsed = static_cast<double>(target);
        const std::string* value = find(key);
        if (value == nullptr)
        {
            return;
        }
        if (try_parse_double_value(*value, parsed))
        {
            target = static_cast<float>(parsed);
        }
        else
        {
            warn_invalid_config_value(key, *value, "a finite number");
        }
    }

    // Optional float: "none", "off" or an empty value disables it.
    void read_optional_float(const char* key, bool& enabled, float& target)
    {
        const std::string* value = find(key);
        if (value == nullptr)
        {
            return;
        }
        const std::string lowered = strutil::lower_copy(*value);
        if (lowered.empty() || lowered == "none" || lowered == "off" || lowered == "null")
        {
            enabled = false;
            return;
        }
        double parsed = 0.0;
        if (try_parse_double_value(*value, parsed))
        {
            enabled = true;
            target = static_cast<float>(parsed);
        }
        else
        {
            warn_invalid_config_value(key, *value, "a finite number or none");
        }
    }

    void read_bool(const char* key, bool& target)
    {
        const std::string* value = find(key);
        if (value != nullptr)
        {
            target = parse_bool_value(*value);
        }
    }

    void read_string(const char* key, std::string& target)
    {
        const std::string* value = find(key);
        if (value != nullptr && !value->empty())
        {
            target = *value;
        }
    }

    const std::string* find(const char* key)
    {
        const auto it = config_.find(key);
        if (it == config_.end())
        {
            return nullptr;
        }
        ++consumed_;
        return &it->second;
    }

private:
    const ConfigMap& config_;
    int consumed_ = 0;
};

}

std::string strip_wrapping_quotes(std::string value)
{
    if (value.size() >= 2)
    {
        const char first = value.front();
        const char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\''))
        {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

bool parse_bool_value(const std::string& value)
{
    return strutil::parse_bool(value);
}

/**
 * @brief Parses an integer value.
 */
bool try_parse_int_value(const std::string& value, int& out)
{
    try
    {
        size_t consumed = 0;
        const long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size() ||
            parsed < static_cast<long long>(std::numeric_limits<int>::min()) ||
            parsed > static_cast<long long>(std::numeric_limits<int>::max()))
        {
            return false;
        }
        out = static_cast<int>(parsed);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

bool try_parse_positive_int_value(const std::string& value, int& out)
{
    int parsed = 0;
    if (!try_parse_int_value(value, parsed) || parsed <= 0)
    {
        return false;
    }
    out = parsed;
    return true;
}

/**
 * @brief Parses a finite floating-point value.
 */
bool try_parse_double_value(const std::string& value, double& out)
{
    try
    {
        size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed))
        {
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

void warn_invalid_config_value(const std::string& key,
                               const std::string& value,
                               const char* expected)
{
    std::cerr << "Warning: Invalid " << key << " '" << value
              << "'; expected " << expected
              << ". Keeping previous/default value." << std::endl;
}

std::vector<std::string> parse_string_list(const std::string& value)
{
    std::string cleaned = value;
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '['), cleaned.end());
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), ']'), cleaned.end());
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '"'), cleaned.end());
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '\''), cleaned.end());

    std::vector<std::string> out;
    std::stringstream ss(cleaned);
    std::string item;
    while (std::getline(ss, item, ','))
    {
        item = trim_line(item);
        if (!item.empty())
        {
            out.push_back(item);
        }
    }
    return out;
}

ConfigMap parse_yaml_simple(const std::string& filename, std::string* error)
{
    ConfigMap config;
    std::ifstream file(filename);
    if (!file.is_open())
    {
        if (error)
        {
            *error = "Could not open config file: " + filename;
        }
        return config;
    }

    std::string line;
    std::vector<std::string> section_stack;

    while (std::getline(file, line))
    {
        const size_t comment_pos = line.find('#');
        if (comment_pos != std::string::npos)
        {
            line = line.substr(0, comment_pos);
        }

        size_t indent = 0;
        while (indent < line.size() && line[indent] == ' ') indent++;
        const size_t indent_level = indent / 2;

        line = trim_line(line);
        if (line.empty()) continue;

        if (line.back() == ':')
        {
            const std::string section_name = line.substr(0, line.size() - 1);
            while (section_stack.size() > indent_level)
            {
                section_stack.pop_back();
            }
            if (section_stack.size() == indent_level)
            {
                section_stack.push_back(section_name);
            }
            else
            {
                section_stack[indent_level] = section_name;
            }
            continue;
        }

        const size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos)
        {
            continue;
        }

        while (section_stack.size() > indent_level)
        {
            section_stack.pop_back();
        }

        const std::string key = trim_line(line.substr(0, colon_pos));
        const std::string value = strip_wrapping_quotes(trim_line(line.substr(colon_pos + 1)));

        std::string full_key;
        for (const auto& section : section_stack)
        {
            if (!full_key.empty()) full_key += ".";
            full_key += section;
        }
        if (!full_key.empty()) full_key += ".";
        full_key += key;
        config[full_key] = value;
    }

    return config;
}

void apply_logging_config(const ConfigMap& config)
{
    const auto it = config.find("logging.profile");
    if (it == config.end())
    {
        return;
    }

    bool valid = false;
    const LogProfile parsed = parse_log_profile(it->second, &valid);
    if (valid)
    {
        global_log_profile = parsed;
    }
    else
    {
        std::cerr << "Warning: Invalid logging.profile '" << it->second
                  << "'. Valid values: quiet, normal, debug. Using normal." << std::endl;
        global_log_profile = LogProfile::normal;
    }
}

int apply_nowcast_config(const ConfigMap& config, NowcastConfig& out)
{
    ConfigReader reader(config);

    MotionConfig& m = out.motion;
    reader.read_string("motion.scheme", m.scheme_id);
    reader.read_int("motion.pyramid_levels", m.pyramid_levels);
    reader.read_int("motion.block_size", m.block_size);
    reader.read_int("motion.search_radius", m.search_radius);
    reader.read_string("motion.smoothing_filter", m.smoothing_filter);
    reader.read_int("motion.smoothing_kernel", m.smoothing_kernel);
    reader.read_float("motion.signal_threshold", m.signal_threshold);
    reader.read_double("motion.min_valid_fraction", m.min_valid_fraction);
    reader.read_double("motion.min_overlap_fraction", m.min_overlap_fraction);
    reader.read_double("motion.min_correlation", m.min_correlation);
    reader.read_double("motion.displacement_penalty", m.displacement_penalty);
    reader.read_double("motion.outlier_threshold", m.outlier_threshold);
    reader.read_bool("motion.subpixel", m.subpixel);
    reader.read_string("motion.fill_mode", m.fill_mode);

    reader.read_double("advection.substep_threshold", out.advection.substep_threshold);
    reader.read_int("advection.max_substeps", out.advection.max_substeps);

    BlendConfig& b = out.blend;
    reader.read_string("blend.scheme", b.scheme_id);
    reader.read_double("blend.half_life_s", b.half_life_s);
    reader.read_string("blend.fallback", b.fallback);
    reader.read_int("blend.fallback_kernel", b.fallback_kernel);
    reader.read_double("blend.max_weight", b.max_weight);

    SequencerConfig& s = out.sequencer;
    reader.read_string("sequencer.strategy", s.strategy);
    reader.read_int("sequencer.history_window", s.history_window);
    reader.read_double("sequencer.temporal_decay", s.temporal_decay);
    reader.read_double("sequencer.motion_decay_timescale_s", s.motion_decay_timescale_s);
    reader.read_int("sequencer.scale_kernel", s.scale_kernel);
    reader.read_double("sequencer.small_scale_lifetime_s", s.small_scale_lifetime_s);
    reader.read_bool("sequencer.clamp_to_observed_range", s.clamp_to_observed_range);

    if (const std::string* mode = reader.find("validation.guard_mode"))
    {
        GuardMode parsed = out.validation.mode;
        if (parse_guard_mode(*mode, parsed))
        {
            out.validation.mode = parsed;
        }
        else
        {
            std::cerr << "Warning: Invalid validation.guard_mode '" << *mode
                      << "'. Valid values: off, sanitize, strict." << std::endl;
        }
    }
    reader.read_bool("validation.percentiles", out.validation.include_percentiles);

    InputConfig& in = out.input;
    reader.read_optional_float("input.nodata_value", in.has_nodata_value, in.nodata_value);
    reader.read_optional_float("input.zero_below", in.has_zero_below, in.zero_below);
    if (const std::string* value = reader.find("input.max_history"))
    {
        if (!try_parse_positive_int_value(*value, in.max_history))
        {
            warn_invalid_config_value("input.max_history", *value, "a positive integer");
        }
    }

    if (log_debug_enabled())
    {
        for (const auto& kv : config)
        {
            if (!is_known_config_key(kv.first))
            {
                std::cout << "[config] ignoring unknown key " << kv.first << std::endl;
            }
        }
    }

    return reader.consumed();
}

bool is_known_config_key(const std::string& key)
{
    for (const char* known : kRunnerKeys)
    {
        if (key == known)
        {
            return true;
        }
    }
    for (const char* known : kEngineKeys)
    {
        if (key == known)
        {
            return true;
        }
    }
    return false;
}

} // namespace nowcast
