#ifndef PLANAR_COMPONENTS_BASIC_HPP
#define PLANAR_COMPONENTS_BASIC_HPP

#include <cstdint>
#include "planar/math/vector_math.hpp"

namespace Components {

    // Distinct component types over the Vector class from vector_math.hpp;
    // both convert to and from Vector implicitly.
    struct Position : public ::Vector {
        using Vector::Vector;
        Position() = default;
        Position(const Vector& v) : Vector(v) {}
    };

    struct Velocity : public ::Vector {
        using Vector::Vector;
        Velocity() = default;
        Velocity(const Vector& v) : Vector(v) {}
    };

    // Angular components
    struct AngularPosition {
        double angle = 0.0; // radians
    };

    struct Scale {
        double value = 1.0;
    };

    // Rigid body components
    struct Mass {
        double value;
    };

    struct Inertia {
        double I; // moment of inertia
    };

    struct Acceleration {
        Vector value;
    };

    struct AngularVelocity {
        double omega = 0.0; // radians per second
    };

    struct AngularAcceleration {
        double alpha = 0.0; // radians per second^2
    };

    // Net force and torque handed in by the caller for the next tick.
    // Cleared by the dynamics system after integration.
    struct NetForce {
        Vector force;
        double torque = 0.0;
    };

    struct Color {
        uint8_t r, g, b;
        Color(uint8_t r = 255, uint8_t g = 255, uint8_t b = 255)
            : r(r), g(g), b(b) {}
    };

} // namespace Components

#endif
