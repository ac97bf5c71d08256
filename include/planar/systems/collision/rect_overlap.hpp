#pragma once

#include "planar/math/vector_math.hpp"

namespace Collision {

/**
 * @brief Overlap test for axis-aligned rectangles given by their corners
 *
 * y grows upward, so a top-left corner has the larger y. Shared edges count
 * as overlapping.
 */
bool rectsOverlap(const Vector& topLeft1, const Vector& bottomRight1,
                  const Vector& topLeft2, const Vector& bottomRight2);

} // namespace Collision
