/**
 * @file collision_response.hpp
 * @brief Positional and velocity resolution of a rigid-body contact
 *
 * Required components on both bodies:
 * - Position (to modify)
 * - Velocity (to modify)
 * - Mass (to read)
 */

#pragma once

#include <utility>
#include <entt/entt.hpp>

#include "planar/math/vector_math.hpp"

namespace Collision {

/**
 * @brief One-dimensional coefficient-of-restitution exchange
 *
 * Applied to the velocity components along the contact axis:
 * vS' = ((vS*mS + vT*mT) + cor*(vT - vS)*mT) / (mS + mT)
 * vT' = ((vS*mS + vT*mT) - cor*(vT - vS)*mS) / (mS + mT)
 *
 * @return The new (source, target) velocities
 */
std::pair<Vector, Vector> restitutionExchange(const Vector& vSource, double mSource,
                                              const Vector& vTarget, double mTarget,
                                              double cor);

/**
 * @brief Separates two overlapping rigid bodies and exchanges momentum
 *
 * The axis is first oriented from source toward target. Each body then
 * moves half the axis apart, and the parallel velocity components go
 * through restitutionExchange(); perpendicular components are untouched.
 *
 * @param axis Minimum translation vector from the SAT test
 * @param cor Coefficient of restitution, 1 elastic, 0 perfectly inelastic
 * @return false when the axis has zero length (touching contact) and
 *         nothing was changed
 */
bool resolveCollision(entt::registry& registry,
                      entt::entity source,
                      entt::entity target,
                      Vector axis,
                      double cor);

} // namespace Collision
