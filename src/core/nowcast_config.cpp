/**
 * @file nowcast_config.cpp
 * @brief Semantic validation of the aggregate configuration.
 */

#include "nowcast_config.hpp"
#include "nowcast_errors.hpp"
#include "string_utils.hpp"
#include "numerics/smoothing/smoothing_filter.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace nowcast
{

namespace
{

void fail(const std::string& key, const std::string& requirement)
{
    throw ConfigurationError("Invalid configuration: " + key + " " + requirement);
}

void require_known(const std::string& key, const std::string& value, const std::vector<std::string>& known)
{
    const std::string canonical = strutil::canonical_id(value);
    for (const std::string& name : known)
    {
        if (strutil::canonical_id(name) == canonical)
        {
            return;
        }
    }
    std::ostringstream oss;
    oss << "must be one of";
    for (const std::string& name : known)
    {
        oss << " " << name;
    }
    oss << " (got '" << value << "')";
    fail(key, oss.str());
}

bool finite_in(double value, double lo, double hi)
{
    return std::isfinite(value) && value >= lo && value <= hi;
}

}

void validate_nowcast_config(const NowcastConfig& cfg)
{
    const MotionConfig& m = cfg.motion;
    create_motion_scheme(m.scheme_id);
    if (m.pyramid_levels < 1) fail("motion.pyramid_levels", "must be >= 1");
    if (m.block_size < 2) fail("motion.block_size", "must be >= 2");
    if (m.search_radius < 0) fail("motion.search_radius", "must be >= 0");
    if (m.smoothing_kernel < 1) fail("motion.smoothing_kernel", "must be >= 1");
    create_smoothing_filter(m.smoothing_filter, m.smoothing_kernel);
    if (!std::isfinite(m.signal_threshold)) fail("motion.signal_threshold", "must be finite");
    if (!finite_in(m.min_valid_fraction, 0.0, 1.0)) fail("motion.min_valid_fraction", "must be within [0, 1]");
    if (!finite_in(m.min_overlap_fraction, 0.0, 1.0)) fail("motion.min_overlap_fraction", "must be within [0, 1]");
    if (!finite_in(m.min_correlation, -1.0, 1.0)) fail("motion.min_correlation", "must be within [-1, 1]");
    if (!(std::isfinite(m.displacement_penalty) && m.displacement_penalty >= 0.0))
    {
        fail("motion.displacement_penalty", "must be >= 0");
    }
    if (!std::isfinite(m.outlier_threshold)) fail("motion.outlier_threshold", "must be finite");
    require_known("motion.fill_mode", m.fill_mode, {"interpolate", "zero"});

    const AdvectionConfig& a = cfg.advection;
    if (!(std::isfinite(a.substep_threshold) && a.substep_threshold > 0.0))
    {
        fail("advection.substep_threshold", "must be > 0");
    }
    if (a.max_substeps < 1) fail("advection.max_substeps", "must be >= 1");

    const BlendConfig& b = cfg.blend;
    create_blend_scheme(b.scheme_id);
    if (!(std::isfinite(b.half_life_s) && b.half_life_s > 0.0)) fail("blend.half_life_s", "must be > 0");
    require_known("blend.fallback", b.fallback, get_available_blend_fallbacks());
    if (b.fallback_kernel < 1) fail("blend.fallback_kernel", "must be >= 1");
    if (!finite_in(b.max_weight, 0.0, 1.0)) fail("blend.max_weight", "must be within [0, 1]");

    const SequencerConfig& s = cfg.sequencer;
    create_sequencer(s.strategy);
    if (s.history_window < 2) fail("sequencer.history_window", "must be >= 2");
    if (!(std::isfinite(s.temporal_decay) && s.temporal_decay > 0.0 && s.temporal_decay <= 1.0))
    {
        fail("sequencer.temporal_decay", "must be within (0, 1]");
    }
    if (!(std::isfinite(s.motion_decay_timescale_s) && s.motion_decay_timescale_s >= 0.0))
    {
        fail("sequencer.motion_decay_timescale_s", "must be >= 0");
    }
    if (s.scale_kernel < 1) fail("sequencer.scale_kernel", "must be >= 1");
    if (!(std::isfinite(s.small_scale_lifetime_s) && s.small_scale_lifetime_s > 0.0))
    {
        fail("sequencer.small_scale_lifetime_s", "must be > 0");
    }

    if (cfg.input.max_history < 1) fail("input.max_history", "must be >= 1");
    if (cfg.input.has_zero_below && !std::isfinite(cfg.input.zero_below))
    {
        fail("input.zero_below", "must be finite");
    }
}

}
