#pragma once

#include "core/config.h"
#include "platform/input_actions.h"
#include "platform/render_scene.h"

#include <SDL3/SDL.h>

#include <string>

namespace replica::platform {

class SdlContext final {
public:
    ~SdlContext();

    bool Initialize(const core::ClientConfig& config);
    bool PumpEvents(bool& quit_requested, InputActions& out_actions);
    void RenderFrame(const RenderScene& scene);
    void SetTitle(const std::string& title);
    void Shutdown();

private:
    SDL_Window* window_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
};

}  // namespace replica::platform
