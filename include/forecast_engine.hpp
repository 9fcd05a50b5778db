#pragma once

#include <memory>

#include "forecast_types.hpp"
#include "nowcast_config.hpp"
#include "sequencer_base.hpp"

/**
 * @file forecast_engine.hpp
 * @brief Top-level nowcast orchestration.
 *
 * An engine validates its configuration once at construction. Each run
 * validates the request, prepares the history, delegates to the configured
 * sequencing strategy, and assembles diagnostics. The engine holds only
 * immutable state, so concurrent runs on one engine need no locking.
 */

namespace nowcast
{

class ForecastEngine
{
public:
    /**
     * @brief Builds an engine; throws ConfigurationError on invalid settings.
     */
    explicit ForecastEngine(NowcastConfig config);

    const NowcastConfig& config() const { return config_; }

    /**
     * @brief Name of the sequencing strategy in use.
     */
    std::string strategy() const { return sequencer_->name(); }

    /**
     * @brief Produces forecast frames for a request.
     *
     * Throws ConfigurationError before any numerical work when the request
     * is malformed. Sparse, absent, or fully masked echo never throws.
     *
     * @param observer Optional per-frame callback; returning false cancels
     * the remaining frames.
     */
    ForecastResult run(const ForecastRequest& request,
                       const FrameObserver& observer = FrameObserver()) const;

    /**
     * @brief Checks request invariants; throws ConfigurationError.
     */
    static void validate_request(const ForecastRequest& request);

private:
    NowcastConfig config_;
    std::shared_ptr<const ForecastSequencer> sequencer_;
};

} // namespace nowcast
