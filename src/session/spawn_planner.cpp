#include "session/spawn_planner.h"

#include <cmath>

namespace replica::session {

protocol::Vec3 ComputeForwardAxis(const protocol::Quat& orientation) {
    const double x = orientation.x;
    const double y = orientation.y;
    const double z = orientation.z;
    const double w = orientation.w;
    return protocol::Vec3(
        2.0 * x * z + 2.0 * y * w,
        2.0 * y * z - 2.0 * x * w,
        1.0 - 2.0 * x * x - 2.0 * y * y);
}

protocol::Vec3 ComputeViewDirection(const protocol::Quat& orientation) {
    const protocol::Vec3 forward = ComputeForwardAxis(orientation);
    const double length_squared = glm::dot(forward, forward);
    if (length_squared < kMinForwardLengthSquared) {
        return protocol::Vec3(0.0);
    }

    return forward / -std::sqrt(length_squared);
}

SpawnPlan PlanSpawn(const Viewpoint& viewpoint) {
    const protocol::Vec3 view = ComputeViewDirection(viewpoint.orientation);

    SpawnPlan plan{};
    plan.position = viewpoint.position + kSpawnDistance * view;
    plan.velocity = kSpawnSpeed * view;
    plan.orientation = viewpoint.orientation;
    plan.scale = kSpawnScale;
    plan.inverse_mass = kSpawnInverseMass;
    return plan;
}

}  // namespace replica::session
