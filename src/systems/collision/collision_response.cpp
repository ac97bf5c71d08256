#include "planar/systems/collision/collision_response.hpp"

#include "planar/components/basic.hpp"

namespace Collision {

std::pair<Vector, Vector> restitutionExchange(const Vector& vSource, double mSource,
                                              const Vector& vTarget, double mTarget,
                                              double cor) {
    double const totalMass = mSource + mTarget;
    Vector const momentum = vSource * mSource + vTarget * mTarget;
    Vector const relative = vTarget - vSource;

    Vector const newSource = (momentum + relative * (cor * mTarget)) / totalMass;
    Vector const newTarget = (momentum - relative * (cor * mSource)) / totalMass;
    return {newSource, newTarget};
}

bool resolveCollision(entt::registry& registry,
                      entt::entity source,
                      entt::entity target,
                      Vector axis,
                      double cor) {
    if (axis.magSquare() == 0.0) {
        return false;
    }

    auto& posS = registry.get<Components::Position>(source);
    auto& posT = registry.get<Components::Position>(target);

    if ((posT - posS).dot(axis) < 0.0) {
        axis = -axis;
    }

    // equal split of the full depth, independent of mass
    Vector const half = axis / 2.0;
    posS = posS - half;
    posT = posT + half;

    auto& velS = registry.get<Components::Velocity>(source);
    auto& velT = registry.get<Components::Velocity>(target);
    double const mS = registry.get<Components::Mass>(source).value;
    double const mT = registry.get<Components::Mass>(target).value;

    Vector const parS = velS.componentParallel(axis);
    Vector const parT = velT.componentParallel(axis);
    Vector const perpS = velS - parS;
    Vector const perpT = velT - parT;

    auto const [newParS, newParT] = restitutionExchange(parS, mS, parT, mT, cor);
    velS = perpS + newParS;
    velT = perpT + newParT;
    return true;
}

} // namespace Collision
