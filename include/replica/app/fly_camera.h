#pragma once

#include "platform/input_actions.h"
#include "protocol/state_variable.h"
#include "session/viewpoint.h"

namespace replica::app {

// Yaw/pitch camera looking down its local -Z axis with +Y up.
class FlyCamera final {
public:
    static constexpr double kTurnSpeedRadians = 1.5;
    static constexpr double kFastMoveFactor = 4.0;

    FlyCamera();

    void Reset();
    void SetPosition(const protocol::Vec3& position);
    void LookAt(const protocol::Vec3& target);

    void MoveForward(double distance);
    void Strafe(double distance);
    void Rise(double distance);
    void Rotate(double yaw_delta, double pitch_delta);
    void Update(const platform::InputActions& actions, double delta_seconds, double move_speed);

    const protocol::Vec3& Position() const;
    double Yaw() const;
    double Pitch() const;
    protocol::Quat Orientation() const;
    protocol::Vec3 Forward() const;
    protocol::Vec3 Right() const;
    session::Viewpoint ToViewpoint() const;

private:
    protocol::Vec3 position_ = protocol::Vec3(0.0);
    double yaw_ = 0.0;
    double pitch_ = 0.0;
};

}  // namespace replica::app
