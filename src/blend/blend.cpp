/**
 * @file blend.cpp
 * @brief Fallback construction and weighted mixing of forecast frames.
 */

#include "blend_base.hpp"
#include "nowcast_errors.hpp"
#include "string_utils.hpp"
#include "numerics/smoothing/smoothing_filter.hpp"

#include <algorithm>

namespace nowcast
{

namespace
{

enum class FallbackKind
{
    decay,
    persistence,
    zero
};

FallbackKind parse_fallback(const std::string& value)
{
    const std::string canonical = strutil::canonical_id(value);
    if (canonical == "decay" || canonical == "smooth")
    {
        return FallbackKind::decay;
    }
    if (canonical == "persistence")
    {
        return FallbackKind::persistence;
    }
    if (canonical == "zero" || canonical == "none")
    {
        return FallbackKind::zero;
    }
    throw ConfigurationError("Unknown blend fallback: " + value);
}

Field2D decay_fallback(const FieldGrid& advected, int kernel)
{
    Field2D smoothed = advected.values();
    const auto filter = create_smoothing_filter("box", kernel);
    filter->apply_2d(smoothed, &advected.valid_mask());
    return smoothed;
}

Field2D persistence_fallback(const FieldGrid& advected, const FieldGrid& persistence)
{
    if (!persistence.geometry().compatible_with(advected.geometry()))
    {
        throw ConfigurationError("Persistence fallback grid does not match the forecast grid");
    }
    Field2D out(advected.rows(), advected.cols(), 0.0f);
    const float* src = persistence.values().data();
    const Mask2D& mask = persistence.valid_mask();
    float* dst = out.data();
    for (std::size_t i = 0; i < out.size(); ++i)
    {
        if (mask[i])
        {
            dst[i] = src[i];
        }
    }
    return out;
}

}

double blend_weight(double lead_time_s, const BlendConfig& cfg)
{
    const double max_weight = std::clamp(cfg.max_weight, 0.0, 1.0);
    const auto scheme = create_blend_scheme(cfg.scheme_id);
    return max_weight * scheme->weight(std::max(lead_time_s, 0.0), cfg);
}

FieldGrid blend(const FieldGrid& advected,
                double lead_time_s,
                const BlendConfig& cfg,
                const FieldGrid* persistence)
{
    FallbackKind kind = parse_fallback(cfg.fallback);
    const double w = blend_weight(lead_time_s, cfg);
    if (w <= 0.0)
    {
        return advected;
    }

    if (kind == FallbackKind::persistence && persistence == nullptr)
    {
        kind = FallbackKind::decay;
    }

    Field2D fallback;
    switch (kind)
    {
        case FallbackKind::decay:
            fallback = decay_fallback(advected, cfg.fallback_kernel);
            break;
        case FallbackKind::persistence:
            fallback = persistence_fallback(advected, *persistence);
            break;
        case FallbackKind::zero:
        default:
            fallback.resize(advected.rows(), advected.cols(), 0.0f);
            break;
    }

    Field2D out(advected.rows(), advected.cols(), 0.0f);
    const Mask2D& mask = advected.valid_mask();
    const float* adv = advected.values().data();
    const float* fb = fallback.data();
    float* dst = out.data();
    const double keep = 1.0 - w;
    for (std::size_t i = 0; i < out.size(); ++i)
    {
        if (mask[i])
        {
            dst[i] = static_cast<float>(keep * adv[i] + w * fb[i]);
        }
    }

    return FieldGrid(advected.geometry(), advected.timestamp_s(), std::move(out), mask);
}

}
