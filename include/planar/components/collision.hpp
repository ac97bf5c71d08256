#ifndef PLANAR_COMPONENTS_COLLISION_HPP
#define PLANAR_COMPONENTS_COLLISION_HPP

#include <functional>
#include <entt/entt.hpp>

namespace Components {

    // Notified once per detected contact where this body is the source.
    // Runs before the contact is resolved.
    struct CollisionCallback {
        std::function<void(entt::registry&, entt::entity self, entt::entity other)> onCollision;
    };

} // namespace Components

#endif
