#pragma once

#include "protocol/state_variable.h"
#include "session/viewpoint.h"

namespace replica::session {

inline constexpr double kSpawnDistance = 2.0;
inline constexpr double kSpawnSpeed = 0.2;
inline constexpr double kSpawnScale = 0.25;
inline constexpr double kSpawnInverseMass = 20.0;
inline constexpr double kMinForwardLengthSquared = 1e-6;

struct SpawnPlan final {
    protocol::Vec3 position = protocol::Vec3(0.0);
    protocol::Vec3 velocity = protocol::Vec3(0.0);
    protocol::Quat orientation = protocol::MakeQuatXyzw(0.0, 0.0, 0.0, 1.0);
    double scale = kSpawnScale;
    double inverse_mass = kSpawnInverseMass;
};

// +Z rotated by `orientation`: (2xz+2yw, 2yz-2xw, 1-2x^2-2y^2).
protocol::Vec3 ComputeForwardAxis(const protocol::Quat& orientation);

// Normalized -forward, or exactly zero when |forward|^2 < 1e-6.
protocol::Vec3 ComputeViewDirection(const protocol::Quat& orientation);

SpawnPlan PlanSpawn(const Viewpoint& viewpoint);

}  // namespace replica::session
