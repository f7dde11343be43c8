#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <array>

namespace replica::protocol {

using Vec3 = glm::dvec3;
using Quat = glm::dquat;

// Wire order is x, y, z, w; glm constructs quaternions as (w, x, y, z).
inline Quat MakeQuatXyzw(double x, double y, double z, double w) {
    return Quat(w, x, y, z);
}

inline constexpr double kDefaultRestitution = 0.9;

// First element selects the shape kind, the rest are kind specific.
using CollisionShape = std::array<double, 4>;

inline constexpr double kCollisionShapeSphere = 1.0;
inline constexpr double kCollisionShapeComposite = 4.0;

inline constexpr CollisionShape kDefaultCollisionShape{0.0, 1.0, 1.0, 1.0};
inline constexpr CollisionShape kDynamicCollisionShape{kCollisionShapeComposite, 1.0, 1.0, 1.0};

struct StateVariable final {
    Vec3 position = Vec3(0.0);
    Vec3 velocity_linear = Vec3(0.0);
    Vec3 velocity_rotational = Vec3(0.0);
    Quat orientation = MakeQuatXyzw(0.0, 0.0, 0.0, 1.0);
    double scale = 1.0;
    double radius = 1.0;
    double inverse_mass = 1.0;
    double restitution = kDefaultRestitution;
    CollisionShape collision_shape = kDefaultCollisionShape;
};

// Builds a state variable with radius equal to scale and zero spin.
StateVariable MakeStateVariable(
    const Vec3& position,
    const Vec3& velocity,
    const Quat& orientation,
    double scale,
    double inverse_mass);

}  // namespace replica::protocol
