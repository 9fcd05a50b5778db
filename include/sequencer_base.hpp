#pragma once

#include <memory>
#include <string>
#include <vector>

#include "advection.hpp"
#include "field_grid.hpp"
#include "forecast_types.hpp"
#include "motion_base.hpp"

/*This header file contains the base classes and structures for the sequencer module.
A sequencer turns an observed history into forecast frames at the requested lead times.
The strategy is chosen by the user in the configuration file. All strategies share one
forecast loop and the same motion and advection primitives; they differ only in how the
motion field is derived and updated across steps and in how frames are post-processed.*/

namespace nowcast
{

struct NowcastConfig;

/*Sequencer module configuration*/
struct SequencerConfig
{
    std::string strategy = "advanced";          // "basic" or "advanced"
    int history_window = 4;                     // frames used for the temporal motion estimate
    double temporal_decay = 0.5;                // weight ratio between successive older frame pairs
    double motion_decay_timescale_s = 7200.0;   // e-folding time of motion slow-down [s], 0 disables
    int scale_kernel = 9;                       // large-scale smoothing width [cells]
    double small_scale_lifetime_s = 1200.0;     // e-folding time of small-scale texture [s]
    bool clamp_to_observed_range = true;        // keep forecast values within the last observed range
};

/**
 * @brief Per-run values the engine folds into ForecastDiagnostics.
 */
struct SequencerDiagnostics
{
    double mean_flow_cells_per_s = 0.0;
    double max_flow_cells_per_s = 0.0;
    double motion_valid_fraction = 0.0;
    double motion_quality = 0.0;
    bool low_confidence = true;
    bool irregular_spacing = false;
    double relative_spacing_spread = 0.0;
    double mean_interval_s = 0.0;
    int frames_used = 0;
    int max_substeps = 0;
    double base_confidence = 0.0;
    bool cancelled = false;
};

/*Abstract base class for forecast sequencing strategies*/
class ForecastSequencer
{
public:
    virtual ~ForecastSequencer() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Produces one frame per requested lead time.
     * @param history Validated history, oldest first.
     * @param lead_times_s Requested lead times [s], positive.
     * @param cfg Full configuration.
     * @param observer Optional frame callback; returning false cancels.
     * @param diagnostics Optional run statistics.
     * @return Frames in the order of `lead_times_s` (only those produced
     * before a cancellation).
     */
    std::vector<ForecastFrame> forecast(const std::vector<FieldGrid>& history,
                                        const std::vector<double>& lead_times_s,
                                        const NowcastConfig& cfg,
                                        const FrameObserver& observer = FrameObserver(),
                                        SequencerDiagnostics* diagnostics = nullptr) const;

    /**
     * @brief Combines pairwise motion estimates over a history window.
     *
     * Pair k (counting back from the most recent) has weight
     * `decay^k * quality`. Low-confidence pairs are excluded; when all are,
     * the most recent pair's estimate is returned.
     */
    static MotionField temporal_motion(const std::vector<FieldGrid>& window,
                                       const MotionConfig& cfg,
                                       double decay);

protected:
    // Number of most recent history frames the strategy consumes
    virtual int history_window(const NowcastConfig& cfg) const = 0;

    // Motion used for the whole run, estimated once from the window
    virtual MotionField derive_motion(const std::vector<FieldGrid>& window,
                                      const NowcastConfig& cfg) const = 0;

    // Motion for the step ending at a lead time; `t_mid_s` is the step midpoint
    virtual MotionField step_motion(const MotionField& initial,
                                    double t_mid_s,
                                    const NowcastConfig& cfg) const;

    // Splits the last observation into independently advected components
    virtual std::vector<FieldGrid> decompose(const FieldGrid& last,
                                             const NowcastConfig& cfg) const;

    // Recombines advected components into one frame
    virtual FieldGrid compose(const std::vector<FieldGrid>& components,
                              double lead_time_s,
                              const NowcastConfig& cfg) const;

    // Post-processes an output frame; the propagated state is not affected
    virtual FieldGrid finalize(const FieldGrid& frame,
                               double lead_time_s,
                               const FieldGrid& last,
                               const NowcastConfig& cfg) const;
};

// Factory and lookup functions
std::unique_ptr<ForecastSequencer> create_sequencer(const std::string& strategy);
std::vector<std::string> get_available_sequencers();

} // namespace nowcast
