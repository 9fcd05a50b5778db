/**
 * @file global_translation.hpp
 * @brief Single-vector motion scheme.
 *
 * Matches the whole domain as one block at every pyramid level, giving a
 * uniform translation. Suited to small domains or weakly structured echo
 * where per-block estimates are unreliable.
 */

#pragma once

#include "motion/schemes/block_match/block_match.hpp"

namespace nowcast
{

class GlobalTranslationScheme : public BlockMatchScheme
{
public:
    std::string name() const override { return "global_translation"; }

protected:
    int block_size_for(int rows, int cols, const MotionConfig& cfg) const override;
};

}
