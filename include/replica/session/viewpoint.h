#pragma once

#include "protocol/state_variable.h"

namespace replica::session {

struct Viewpoint final {
    protocol::Vec3 position = protocol::Vec3(0.0);
    protocol::Quat orientation = protocol::MakeQuatXyzw(0.0, 0.0, 0.0, 1.0);
};

}  // namespace replica::session
