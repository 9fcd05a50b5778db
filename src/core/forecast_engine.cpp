/**
 * @file forecast_engine.cpp
 * @brief Request validation, input preparation, and result assembly.
 */

#include "forecast_engine.hpp"
#include "logging.hpp"
#include "nowcast_errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace nowcast
{

namespace
{

double masked_fraction(const FieldGrid& grid, float signal_threshold)
{
    if (grid.cell_count() == 0)
    {
        return 1.0;
    }
    const std::size_t usable = grid.echo_count(signal_threshold);
    return 1.0 - static_cast<double>(usable) / static_cast<double>(grid.cell_count());
}

}

ForecastEngine::ForecastEngine(NowcastConfig config)
    : config_(std::move(config))
{
    validate_nowcast_config(config_);
    sequencer_ = create_sequencer(config_.sequencer.strategy);
}

void ForecastEngine::validate_request(const ForecastRequest& request)
{
    if (request.history.empty())
    {
        throw ConfigurationError("Forecast request has an empty history");
    }

    const GridGeometry& reference = request.history.front().geometry();
    for (std::size_t i = 0; i < request.history.size(); ++i)
    {
        const FieldGrid& grid = request.history[i];
        if (!grid.geometry().compatible_with(reference))
        {
            std::ostringstream oss;
            oss << "History frame " << i << " geometry (" << grid.geometry().describe()
                << ") differs from frame 0 (" << reference.describe() << ")";
            throw ConfigurationError(oss.str());
        }
        if (!std::isfinite(grid.timestamp_s()))
        {
            throw ConfigurationError("History frame " + std::to_string(i) + " has a non-finite timestamp");
        }
        if (i > 0 && !(grid.timestamp_s() > request.history[i - 1].timestamp_s()))
        {
            throw ConfigurationError("History timestamps must be strictly increasing (frame " +
                                     std::to_string(i) + ")");
        }
    }

    if (request.lead_times_s.empty())
    {
        throw ConfigurationError("Forecast request has no lead times");
    }
    for (double lead : request.lead_times_s)
    {
        if (!std::isfinite(lead) || lead <= 0.0)
        {
            std::ostringstream oss;
            oss << "Lead times must be finite and positive (got " << lead << ")";
            throw ConfigurationError(oss.str());
        }
    }
}

ForecastResult ForecastEngine::run(const ForecastRequest& request, const FrameObserver& observer) const
{
    const auto start = std::chrono::steady_clock::now();
    validate_request(request);

    std::vector<FieldGrid> history;
    history.reserve(request.history.size());
    std::size_t sanitized = 0;
    for (const FieldGrid& grid : request.history)
    {
        GridValidationResult check;
        history.push_back(prepare_input_grid(grid, config_.validation, config_.input, &check));
        sanitized += check.stats.sanitized_nonfinite_count;
    }

    SequencerDiagnostics sdiag;
    ForecastResult result;
    result.frames = sequencer_->forecast(history, request.lead_times_s, config_, observer, &sdiag);

    const FieldGrid& current = history.back();
    const GridGeometry& geometry = current.geometry();
    const double cell_m = 0.5 * (geometry.dx_m + geometry.dy_m);

    ForecastDiagnostics& diag = result.diagnostics;
    diag.strategy = sequencer_->name();
    diag.mean_flow_cells_per_s = sdiag.mean_flow_cells_per_s;
    diag.mean_flow_m_per_s = sdiag.mean_flow_cells_per_s * cell_m;
    diag.max_flow_cells_per_s = sdiag.max_flow_cells_per_s;
    diag.masked_fraction = masked_fraction(current, config_.motion.signal_threshold);
    diag.nodata_fraction = current.nodata_fraction();
    diag.motion_valid_fraction = sdiag.motion_valid_fraction;
    diag.motion_quality = sdiag.motion_quality;
    diag.low_confidence = sdiag.low_confidence;
    diag.irregular_spacing = sdiag.irregular_spacing;
    diag.relative_spacing_spread = sdiag.relative_spacing_spread;
    diag.history_frames_used = sdiag.frames_used;
    diag.mean_interval_s = sdiag.mean_interval_s;
    diag.max_substeps = sdiag.max_substeps;
    diag.sanitized_cells = sanitized;
    diag.cancelled = sdiag.cancelled;
    for (const ForecastFrame& frame : result.frames)
    {
        diag.confidence = std::max(diag.confidence, frame.confidence);
    }

    const auto end = std::chrono::steady_clock::now();
    diag.duration_ms = std::chrono::duration<double, std::milli>(end - start).count();

    if (log_normal_enabled())
    {
        std::cout << "[nowcast] strategy=" << diag.strategy
                  << " frames=" << result.frames.size() << "/" << request.lead_times_s.size()
                  << std::fixed << std::setprecision(3)
                  << " flow=" << diag.mean_flow_m_per_s << " m/s"
                  << " masked=" << diag.masked_fraction
                  << " confidence=" << diag.confidence
                  << (diag.low_confidence ? " (low)" : "")
                  << (diag.cancelled ? " cancelled" : "")
                  << std::setprecision(1) << " in " << diag.duration_ms << " ms"
                  << std::defaultfloat << std::endl;
    }
    if (sanitized > 0)
    {
        std::cerr << "[nowcast] warning: " << sanitized << " non-finite input cells treated as no-data" << std::endl;
    }
    if (diag.irregular_spacing && log_normal_enabled())
    {
        std::cerr << "[nowcast] warning: irregular frame spacing (relative spread "
                  << diag.relative_spacing_spread << "), confidence reduced" << std::endl;
    }

    return result;
}

} // namespace nowcast
