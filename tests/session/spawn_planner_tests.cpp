#include "session/spawn_mailbox.h"
#include "session/spawn_planner.h"

#include <cmath>
#include <iostream>

namespace {

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

bool NearVec(const replica::protocol::Vec3& lhs, const replica::protocol::Vec3& rhs) {
    return glm::length(lhs - rhs) < 1e-9;
}

}  // namespace

int main() {
    namespace protocol = replica::protocol;
    namespace session = replica::session;

    bool passed = true;

    const protocol::Quat identity = protocol::MakeQuatXyzw(0.0, 0.0, 0.0, 1.0);
    passed &= Expect(
        NearVec(session::ComputeForwardAxis(identity), protocol::Vec3(0.0, 0.0, 1.0)),
        "Identity forward axis should be +Z.");
    passed &= Expect(
        NearVec(session::ComputeViewDirection(identity), protocol::Vec3(0.0, 0.0, -1.0)),
        "Identity view direction should be -Z.");

    const double half_sqrt2 = std::sqrt(0.5);
    const protocol::Quat yaw_quarter = protocol::MakeQuatXyzw(0.0, half_sqrt2, 0.0, half_sqrt2);
    passed &= Expect(
        NearVec(session::ComputeForwardAxis(yaw_quarter), protocol::Vec3(1.0, 0.0, 0.0)),
        "Quarter turn about Y should move forward to +X.");

    const protocol::Quat scaled = protocol::MakeQuatXyzw(0.0, 0.0, 0.0, 2.0);
    passed &= Expect(
        NearVec(session::ComputeViewDirection(scaled), protocol::Vec3(0.0, 0.0, -1.0)),
        "View direction should be normalized.");

    const protocol::Quat degenerate = protocol::MakeQuatXyzw(0.5, 0.5, 0.0, 0.0);
    passed &= Expect(
        glm::dot(session::ComputeForwardAxis(degenerate), session::ComputeForwardAxis(degenerate)) < 1e-6,
        "Degenerate orientation should give a near zero forward axis.");
    passed &= Expect(
        session::ComputeViewDirection(degenerate) == protocol::Vec3(0.0),
        "Near zero forward axis should give an exact zero view direction.");

    const session::Viewpoint viewpoint{
        .position = protocol::Vec3(1.0, 2.0, 3.0),
        .orientation = identity,
    };
    const session::SpawnPlan plan = session::PlanSpawn(viewpoint);
    passed &= Expect(NearVec(plan.position, protocol::Vec3(1.0, 2.0, 1.0)), "Spawn should sit two units ahead.");
    passed &= Expect(NearVec(plan.velocity, protocol::Vec3(0.0, 0.0, -0.2)), "Spawn velocity should be 0.2 along view.");
    passed &= Expect(plan.scale == 0.25 && plan.inverse_mass == 20.0, "Spawn should use projectile mass and scale.");

    const session::SpawnPlan degenerate_plan = session::PlanSpawn(session::Viewpoint{
        .position = protocol::Vec3(4.0, 5.0, 6.0),
        .orientation = degenerate,
    });
    passed &= Expect(
        NearVec(degenerate_plan.position, protocol::Vec3(4.0, 5.0, 6.0)) &&
            degenerate_plan.velocity == protocol::Vec3(0.0),
        "Degenerate orientation should spawn at the viewpoint at rest.");

    session::SpawnMailbox mailbox;
    passed &= Expect(!mailbox.IsPending(), "Mailbox should start empty.");
    passed &= Expect(!mailbox.TryConsume(), "Empty mailbox should not consume.");
    mailbox.Request();
    mailbox.Request();
    passed &= Expect(mailbox.IsPending(), "Request should raise the flag.");
    passed &= Expect(mailbox.TryConsume(), "Raised flag should be consumed once.");
    passed &= Expect(!mailbox.TryConsume(), "Repeated requests should collapse into one.");

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] replica_spawn_planner_tests\n";
    return 0;
}
