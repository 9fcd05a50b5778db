#include "persistence.hpp"

namespace nowcast
{

/**
 * @brief Returns zero displacement without any direct estimate.
 */
DisplacementEstimate PersistenceMotionScheme::estimate_displacement(
    const FieldGrid& prev,
    const FieldGrid& /*curr*/,
    const MotionConfig& /*cfg*/) const
{
    DisplacementEstimate out;
    out.dx.resize(prev.rows(), prev.cols(), 0.0f);
    out.dy.resize(prev.rows(), prev.cols(), 0.0f);
    out.direct.assign(out.dx.size(), 0);
    return out;
}

}
