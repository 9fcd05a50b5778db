/**
 * @file field_validation.cpp
 * @brief Input guard, preprocessing, and grid statistics.
 *
 * Statistics are gathered per row in parallel and reduced serially, so the
 * reported values do not depend on the thread count.
 */

#include "field_validation.hpp"
#include "nowcast_errors.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>
#include <vector>

namespace nowcast {namespace {

/**
 * @brief Per-row accumulator merged after the parallel pass.
 */
struct RowStats {
    std::size_t valid_count = 0;
    std::size_t finite_count = 0;
    std::size_t nan_count = 0;
    std::size_t inf_count = 0;
    std::size_t sentinel_count = 0;
    std::size_t floored_count = 0;
    double finite_sum = 0.0;
    double finite_min = std::numeric_limits<double>::infinity();
    double finite_max = -std::numeric_limits<double>::infinity();
};

bool is_finite(float value) {
    return std::isfinite(static_cast<double>(value));
}

void merge_rows(const std::vector<RowStats>& rows, std::size_t total, FieldStats& stats) {
    stats.total_count = total;
    double sum = 0.0;
    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();
    for (const RowStats& row : rows) {
        stats.valid_count += row.valid_count;
        stats.finite_count += row.finite_count;
        stats.nan_count += row.nan_count;
        stats.inf_count += row.inf_count;
        stats.sentinel_count += row.sentinel_count;
        stats.floored_count += row.floored_count;
        sum += row.finite_sum;
        lo = std::min(lo, row.finite_min);
        hi = std::max(hi, row.finite_max);
    }
    stats.nodata_count = total - stats.valid_count;
    stats.has_finite = stats.finite_count > 0;
    if (stats.has_finite) {
        stats.min_value = lo;
        stats.max_value = hi;
        stats.mean_value = sum / static_cast<double>(stats.finite_count);
    }
}

/**
 * @brief Computes representative percentiles from sampled finite values.
 */
void compute_percentiles(const FieldGrid& grid, FieldStats& stats) {
    constexpr std::size_t kMaxSamples = 4096;
    const std::size_t count = grid.cell_count();
    if (count == 0) {
        return;
    }

    const std::size_t stride = std::max<std::size_t>(1, count / kMaxSamples);
    const float* values = grid.values().data();
    const Mask2D& mask = grid.valid_mask();

    std::vector<float> samples;
    samples.reserve((count / stride) + 1);
    for (std::size_t i = 0; i < count; i += stride) {
        if (mask[i] && is_finite(values[i])) {
            samples.push_back(values[i]);
        }
    }
    if (samples.empty()) {
        return;
    }

    std::sort(samples.begin(), samples.end());
    const auto pick = [&samples](double q) -> double {
        const double idx = std::clamp(q, 0.0, 1.0) * static_cast<double>(samples.size() - 1);
        return static_cast<double>(samples[static_cast<std::size_t>(idx)]);
    };
    stats.p01 = pick(0.01);
    stats.p50 = pick(0.50);
    stats.p99 = pick(0.99);
}

}

/**
 * @brief Parses guard mode text into enum representation.
 */
bool parse_guard_mode(const std::string& value, GuardMode& out_mode) {
    const std::string v = strutil::lower_copy(strutil::trim_copy(value));
    if (v == "off") {
        out_mode = GuardMode::Off;
        return true;
    }
    if (v == "sanitize") {
        out_mode = GuardMode::Sanitize;
        return true;
    }
    if (v == "strict") {
        out_mode = GuardMode::Strict;
        return true;
    }
    return false;
}

/**
 * @brief Converts guard mode enum to stable string id.
 */
const char* to_string(GuardMode mode) {
    switch (mode) {
        case GuardMode::Off:
            return "off";
        case GuardMode::Sanitize:
            return "sanitize";
        case GuardMode::Strict:
            return "strict";
        default:
            return "off";
    }
}

FieldStats compute_grid_stats(const FieldGrid& grid, bool include_percentiles) {
    const int rows = grid.rows();
    const int cols = grid.cols();
    std::vector<RowStats> row_stats(static_cast<std::size_t>(std::max(rows, 0)));

    #pragma omp parallel for schedule(static)
    for (int r = 0; r < rows; ++r) {
        RowStats& acc = row_stats[static_cast<std::size_t>(r)];
        for (int c = 0; c < cols; ++c) {
            if (!grid.is_valid(r, c)) {
                continue;
            }
            ++acc.valid_count;
            const float value = grid.value(r, c);
            if (!is_finite(value)) {
                if (std::isnan(static_cast<double>(value))) {
                    ++acc.nan_count;
                } else {
                    ++acc.inf_count;
                }
                continue;
            }
            ++acc.finite_count;
            acc.finite_sum += value;
            acc.finite_min = std::min(acc.finite_min, static_cast<double>(value));
            acc.finite_max = std::max(acc.finite_max, static_cast<double>(value));
        }
    }

    FieldStats stats;
    merge_rows(row_stats, grid.cell_count(), stats);
    if (include_percentiles && stats.has_finite) {
        compute_percentiles(grid, stats);
    }
    return stats;
}

FieldGrid prepare_input_grid(const FieldGrid& grid,
                             const ValidationPolicy& policy,
                             const InputConfig& input,
                             GridValidationResult* result) {
    const int rows = grid.rows();
    const int cols = grid.cols();
    Field2D values = grid.values();
    Mask2D mask = grid.valid_mask();
    std::vector<RowStats> row_stats(static_cast<std::size_t>(rows));

    const bool sanitize = policy.mode != GuardMode::Off;

    #pragma omp parallel for schedule(static)
    for (int r = 0; r < rows; ++r) {
        RowStats& acc = row_stats[static_cast<std::size_t>(r)];
        for (int c = 0; c < cols; ++c) {
            const std::size_t idx = static_cast<std::size_t>(r) * static_cast<std::size_t>(cols) +
                                    static_cast<std::size_t>(c);
            float& value = values(r, c);
            if (!mask[idx]) {
                value = 0.0f;
                continue;
            }
            if (input.has_nodata_value && value == input.nodata_value) {
                ++acc.sentinel_count;
                mask[idx] = 0;
                value = 0.0f;
                continue;
            }
            if (!is_finite(value)) {
                if (std::isnan(static_cast<double>(value))) {
                    ++acc.nan_count;
                } else {
                    ++acc.inf_count;
                }
                if (sanitize) {
                    mask[idx] = 0;
                    value = 0.0f;
                    continue;
                }
                ++acc.valid_count;
                continue;
            }

            ++acc.valid_count;
            ++acc.finite_count;
            if (input.has_zero_below && value < input.zero_below) {
                ++acc.floored_count;
                value = 0.0f;
            }
            acc.finite_sum += value;
            acc.finite_min = std::min(acc.finite_min, static_cast<double>(value));
            acc.finite_max = std::max(acc.finite_max, static_cast<double>(value));
        }
    }

    GridValidationResult local;
    merge_rows(row_stats, grid.cell_count(), local.stats);
    const std::size_t nonfinite = local.stats.nan_count + local.stats.inf_count;
    if (policy.mode == GuardMode::Sanitize) {
        local.stats.sanitized_nonfinite_count = nonfinite;
    }
    local.failed = policy.mode == GuardMode::Strict && nonfinite > 0;

    FieldGrid out(grid.geometry(), grid.timestamp_s(), std::move(values), std::move(mask));
    if (policy.include_percentiles && local.stats.has_finite) {
        compute_percentiles(out, local.stats);
    }

    if (result) {
        *result = local;
    }
    if (local.failed) {
        std::ostringstream oss;
        oss << "Input grid at t=" << std::fixed << std::setprecision(0) << grid.timestamp_s()
            << " has " << nonfinite << " non-finite valid cells (guard_mode=strict)";
        throw ConfigurationError(oss.str());
    }
    return out;
}

/**
 * @brief Serializes grid statistics to formatted JSON.
 */
std::string field_stats_to_json(const FieldStats& stats, int indent) {
    const std::string pad(static_cast<std::size_t>(std::max(indent, 0)), ' ');
    const std::string outer(static_cast<std::size_t>(std::max(indent - 2, 0)), ' ');
    std::ostringstream oss;
    oss << "{\n";
    oss << pad << "\"total_count\": " << stats.total_count << ",\n";
    oss << pad << "\"valid_count\": " << stats.valid_count << ",\n";
    oss << pad << "\"nodata_count\": " << stats.nodata_count << ",\n";
    oss << pad << "\"finite_count\": " << stats.finite_count << ",\n";
    oss << pad << "\"nan_count\": " << stats.nan_count << ",\n";
    oss << pad << "\"inf_count\": " << stats.inf_count << ",\n";
    oss << pad << "\"sentinel_count\": " << stats.sentinel_count << ",\n";
    oss << pad << "\"sanitized_nonfinite_count\": " << stats.sanitized_nonfinite_count << ",\n";
    oss << pad << "\"floored_count\": " << stats.floored_count << ",\n";
    oss << pad << "\"has_finite\": " << (stats.has_finite ? "true" : "false") << ",\n";
    oss << std::fixed << std::setprecision(6);
    oss << pad << "\"min\": " << stats.min_value << ",\n";
    oss << pad << "\"max\": " << stats.max_value << ",\n";
    oss << pad << "\"mean\": " << stats.mean_value << ",\n";
    oss << pad << "\"p01\": " << stats.p01 << ",\n";
    oss << pad << "\"p50\": " << stats.p50 << ",\n";
    oss << pad << "\"p99\": " << stats.p99 << "\n";
    oss << outer << "}";
    return oss.str();
}

}
