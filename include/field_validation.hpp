#pragma once

#include <cstddef>
#include <string>

#include "field_grid.hpp"

/**
 * @file field_validation.hpp
 * @brief Input guard and preprocessing for reflectivity grids.
 *
 * Defines guard policy, per-grid statistics, and the preprocessing applied
 * to every history frame before forecasting: raw no-data sentinel mapping,
 * non-finite handling, and the low-intensity floor.
 * Supports sanitize and strict guard modes.
 */

namespace nowcast
{

enum class GuardMode
{
    Off,
    Sanitize,
    Strict,
};

struct ValidationPolicy
{
    GuardMode mode = GuardMode::Sanitize;
    bool include_percentiles = false;
};

/**
 * @brief Raw-input conventions of the upstream decoder.
 */
struct InputConfig
{
    bool has_nodata_value = false;
    float nodata_value = 255.0f;   // raw sentinel marking no-data cells
    bool has_zero_below = false;
    float zero_below = 0.0f;       // valid values below this floor carry no echo
    int max_history = 10;          // most recent frames kept by the runner
};

struct FieldStats
{
    std::size_t total_count = 0;
    std::size_t valid_count = 0;
    std::size_t nodata_count = 0;
    std::size_t finite_count = 0;
    std::size_t nan_count = 0;
    std::size_t inf_count = 0;
    std::size_t sentinel_count = 0;
    std::size_t sanitized_nonfinite_count = 0;
    std::size_t floored_count = 0;
    double min_value = 0.0;
    double max_value = 0.0;
    double mean_value = 0.0;
    double p01 = 0.0;
    double p50 = 0.0;
    double p99 = 0.0;
    bool has_finite = false;
};

struct GridValidationResult
{
    FieldStats stats;
    bool failed = false;
};

/**
 * @brief Parses guard mode from text.
 */
bool parse_guard_mode(const std::string& value, GuardMode& out_mode);

/**
 * @brief Converts guard mode to text.
 */
const char* to_string(GuardMode mode);

/**
 * @brief Computes statistics over the valid cells of a grid.
 */
FieldStats compute_grid_stats(const FieldGrid& grid, bool include_percentiles);

/**
 * @brief Applies input conventions and the guard to one history frame.
 *
 * Sentinel cells become no-data; non-finite valid cells become no-data
 * (sanitize) or raise ConfigurationError (strict); valid values below the
 * floor become zero. No-data cells carry value zero in the output.
 *
 * @param result Optional statistics of the raw frame.
 */
FieldGrid prepare_input_grid(const FieldGrid& grid,
                             const ValidationPolicy& policy,
                             const InputConfig& input,
                             GridValidationResult* result = nullptr);

/**
 * @brief Serializes grid statistics to a JSON object.
 * @param indent Leading spaces of each member line.
 */
std::string field_stats_to_json(const FieldStats& stats, int indent = 2);

} // namespace nowcast
