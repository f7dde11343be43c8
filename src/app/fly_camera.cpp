#include "app/fly_camera.h"

#include <glm/gtc/constants.hpp>
#include <glm/gtc/quaternion.hpp>

#include <algorithm>
#include <cmath>

namespace replica::app {
namespace {

constexpr double kPitchLimit = 1.5607963267948966;  // pi/2 - 0.01
const protocol::Vec3 kStartPosition(0.0, 5.0, -10.0);
const protocol::Vec3 kWorldUp(0.0, 1.0, 0.0);

}  // namespace

FlyCamera::FlyCamera() {
    Reset();
}

void FlyCamera::Reset() {
    position_ = kStartPosition;
    yaw_ = 0.0;
    pitch_ = 0.0;
    LookAt(protocol::Vec3(0.0));
}

void FlyCamera::SetPosition(const protocol::Vec3& position) {
    position_ = position;
}

void FlyCamera::LookAt(const protocol::Vec3& target) {
    const protocol::Vec3 direction = target - position_;
    const double length = glm::length(direction);
    if (length <= 0.0) {
        return;
    }

    yaw_ = std::atan2(-direction.x, -direction.z);
    pitch_ = std::clamp(std::asin(direction.y / length), -kPitchLimit, kPitchLimit);
}

void FlyCamera::MoveForward(double distance) {
    position_ += Forward() * distance;
}

void FlyCamera::Strafe(double distance) {
    position_ += Right() * distance;
}

void FlyCamera::Rise(double distance) {
    position_ += kWorldUp * distance;
}

void FlyCamera::Rotate(double yaw_delta, double pitch_delta) {
    yaw_ = std::remainder(yaw_ + yaw_delta, 2.0 * glm::pi<double>());
    pitch_ = std::clamp(pitch_ + pitch_delta, -kPitchLimit, kPitchLimit);
}

void FlyCamera::Update(const platform::InputActions& actions, double delta_seconds, double move_speed) {
    if (delta_seconds <= 0.0) {
        return;
    }

    const double speed = actions.fast_move ? move_speed * kFastMoveFactor : move_speed;
    const double step = speed * delta_seconds;
    const double turn = kTurnSpeedRadians * delta_seconds;

    double yaw_delta = 0.0;
    double pitch_delta = 0.0;
    if (actions.turn_left) {
        yaw_delta += turn;
    }
    if (actions.turn_right) {
        yaw_delta -= turn;
    }
    if (actions.look_up) {
        pitch_delta += turn;
    }
    if (actions.look_down) {
        pitch_delta -= turn;
    }
    Rotate(yaw_delta, pitch_delta);

    if (actions.move_forward) {
        MoveForward(step);
    }
    if (actions.move_back) {
        MoveForward(-step);
    }
    if (actions.strafe_right) {
        Strafe(step);
    }
    if (actions.strafe_left) {
        Strafe(-step);
    }
    if (actions.rise) {
        Rise(step);
    }
    if (actions.fall) {
        Rise(-step);
    }
}

const protocol::Vec3& FlyCamera::Position() const {
    return position_;
}

double FlyCamera::Yaw() const {
    return yaw_;
}

double FlyCamera::Pitch() const {
    return pitch_;
}

protocol::Quat FlyCamera::Orientation() const {
    const protocol::Quat yaw_rotation = glm::angleAxis(yaw_, kWorldUp);
    const protocol::Quat pitch_rotation = glm::angleAxis(pitch_, protocol::Vec3(1.0, 0.0, 0.0));
    return glm::normalize(yaw_rotation * pitch_rotation);
}

protocol::Vec3 FlyCamera::Forward() const {
    return Orientation() * protocol::Vec3(0.0, 0.0, -1.0);
}

protocol::Vec3 FlyCamera::Right() const {
    return Orientation() * protocol::Vec3(1.0, 0.0, 0.0);
}

session::Viewpoint FlyCamera::ToViewpoint() const {
    return session::Viewpoint{
        .position = position_,
        .orientation = Orientation(),
    };
}

}  // namespace replica::app
