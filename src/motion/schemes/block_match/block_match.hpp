/**
 * @file block_match.hpp
 * @brief Pyramidal block-matching motion scheme.
 *
 * Each block of the earlier frame is matched against shifted windows of the
 * later frame by zero-mean normalized cross-correlation (ZNCC), which is
 * insensitive to uniform growth or decay of echo intensity. Estimates run
 * coarse to fine; each level refines the up-sampled field of the level
 * above within a small search window.
 */

#pragma once

#include "motion_base.hpp"
#include "motion/base/block_vectors.hpp"
#include "motion/base/pyramid.hpp"

namespace nowcast
{

class BlockMatchScheme : public MotionSchemeBase
{
public:
    std::string name() const override { return "block_match"; }

    DisplacementEstimate estimate_displacement(
        const FieldGrid& prev,
        const FieldGrid& curr,
        const MotionConfig& cfg) const override;

protected:
    /**
     * @brief Block edge used on a level of the given shape.
     */
    virtual int block_size_for(int rows, int cols, const MotionConfig& cfg) const;

private:
    /**
     * @brief Matches every block of one level around a dense guess.
     * @param guess_dx Column displacement guess [cells of this level].
     * @param guess_dy Row displacement guess [cells of this level].
     * @param refine Apply parabolic sub-cell refinement.
     */
    BlockVectors match_level(const PyramidLevel& prev,
                             const PyramidLevel& curr,
                             const Field2D& guess_dx,
                             const Field2D& guess_dy,
                             const MotionConfig& cfg,
                             bool refine) const;
};

}
