#include "protocol/state_variable.h"

namespace replica::protocol {

StateVariable MakeStateVariable(
    const Vec3& position,
    const Vec3& velocity,
    const Quat& orientation,
    double scale,
    double inverse_mass) {
    StateVariable state{};
    state.position = position;
    state.velocity_linear = velocity;
    state.velocity_rotational = Vec3(0.0);
    state.orientation = orientation;
    state.scale = scale;
    state.radius = scale;
    state.inverse_mass = inverse_mass;
    state.restitution = kDefaultRestitution;
    state.collision_shape = kDefaultCollisionShape;
    return state;
}

}  // namespace replica::protocol
