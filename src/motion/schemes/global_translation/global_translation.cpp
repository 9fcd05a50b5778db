#include "global_translation.hpp"

#include <algorithm>

namespace nowcast
{

int GlobalTranslationScheme::block_size_for(int rows, int cols, const MotionConfig& /*cfg*/) const
{
    return std::max({rows, cols, 2});
}

}
