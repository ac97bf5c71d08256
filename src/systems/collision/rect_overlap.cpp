#include "planar/systems/collision/rect_overlap.hpp"

namespace Collision {

bool rectsOverlap(const Vector& topLeft1, const Vector& bottomRight1,
                  const Vector& topLeft2, const Vector& bottomRight2) {
    return topLeft1.x <= bottomRight2.x && bottomRight1.x >= topLeft2.x &&
           topLeft1.y >= bottomRight2.y && bottomRight1.y <= topLeft2.y;
}

} // namespace Collision
