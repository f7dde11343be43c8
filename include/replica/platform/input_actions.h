#pragma once

namespace replica::platform {

struct InputActions final {
    bool move_forward = false;
    bool move_back = false;
    bool strafe_left = false;
    bool strafe_right = false;
    bool rise = false;
    bool fall = false;
    bool turn_left = false;
    bool turn_right = false;
    bool look_up = false;
    bool look_down = false;
    bool fast_move = false;

    bool spawn_pressed = false;
    int viewport_width = 0;
    int viewport_height = 0;
};

}  // namespace replica::platform
