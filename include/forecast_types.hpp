#pragma once

#include <functional>
#include <string>
#include <vector>

#include "field_grid.hpp"

/**
 * @file forecast_types.hpp
 * @brief Request, frame, and result types exchanged with the forecast engine.
 */

namespace nowcast
{

/**
 * @brief One extrapolated grid, stamped with its valid time.
 */
struct ForecastFrame
{
    FieldGrid grid;              // timestamp = last observation + lead time
    double lead_time_s = 0.0;
    double confidence = 0.0;     // in [0, 1]
};

struct ForecastRequest
{
    std::vector<FieldGrid> history;    // oldest first, strictly increasing timestamps
    std::vector<double> lead_times_s;  // positive, any order
};

struct ForecastDiagnostics
{
    std::string strategy;
    double mean_flow_cells_per_s = 0.0;
    double mean_flow_m_per_s = 0.0;
    double max_flow_cells_per_s = 0.0;
    double masked_fraction = 0.0;        // current-frame cells excluded from matching
    double nodata_fraction = 0.0;        // current-frame no-data cells
    double motion_valid_fraction = 0.0;
    double motion_quality = 0.0;
    double confidence = 0.0;             // highest frame confidence
    bool low_confidence = true;
    bool irregular_spacing = false;
    double relative_spacing_spread = 0.0;
    int history_frames_used = 0;
    double mean_interval_s = 0.0;
    int max_substeps = 0;
    std::size_t sanitized_cells = 0;
    double duration_ms = 0.0;
    bool cancelled = false;
};

struct ForecastResult
{
    std::vector<ForecastFrame> frames;   // in requested lead-time order
    ForecastDiagnostics diagnostics;
};

/**
 * @brief Called after each produced frame; returning false stops the run.
 */
using FrameObserver = std::function<bool(const ForecastFrame&)>;

} // namespace nowcast
