/**
 * @file persistence.hpp
 * @brief Motion scheme that always reports a stationary field.
 */

#pragma once

#include "motion_base.hpp"

namespace nowcast
{

class PersistenceMotionScheme : public MotionSchemeBase
{
public:
    std::string name() const override { return "persistence"; }

    DisplacementEstimate estimate_displacement(
        const FieldGrid& prev,
        const FieldGrid& curr,
        const MotionConfig& cfg) const override;
};

}
