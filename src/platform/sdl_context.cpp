#include "platform/sdl_context.h"

#include "core/logger.h"

#include <string>
#include <vector>

namespace replica::platform {
namespace {

std::string SdlError() {
    const char* error = SDL_GetError();
    return error == nullptr ? std::string("unknown error") : std::string(error);
}

bool IsQuitEvent(Uint32 event_type) {
    return event_type == SDL_EVENT_QUIT ||
        event_type == SDL_EVENT_WINDOW_CLOSE_REQUESTED;
}

SDL_FColor ToFColor(const RgbaColor& color) {
    return SDL_FColor{
        static_cast<float>(color.r) / 255.0F,
        static_cast<float>(color.g) / 255.0F,
        static_cast<float>(color.b) / 255.0F,
        static_cast<float>(color.a) / 255.0F,
    };
}

}  // namespace

SdlContext::~SdlContext() {
    Shutdown();
}

bool SdlContext::Initialize(const core::ClientConfig& config) {
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        core::Logger::Error("platform", "SDL_Init failed: " + SdlError());
        return false;
    }

    window_ = SDL_CreateWindow(
        config.window_title.c_str(),
        config.window_width,
        config.window_height,
        SDL_WINDOW_RESIZABLE);
    if (window_ == nullptr) {
        core::Logger::Error("platform", "SDL_CreateWindow failed: " + SdlError());
        SDL_Quit();
        return false;
    }

    renderer_ = SDL_CreateRenderer(window_, nullptr);
    if (renderer_ == nullptr) {
        core::Logger::Error("platform", "SDL_CreateRenderer failed: " + SdlError());
        SDL_DestroyWindow(window_);
        window_ = nullptr;
        SDL_Quit();
        return false;
    }

    const int vsync = config.vsync ? 1 : 0;
    (void)SDL_SetRenderVSync(renderer_, vsync);
    (void)SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);

    core::Logger::Info("platform", "SDL3 context initialized.");
    return true;
}

bool SdlContext::PumpEvents(bool& quit_requested, InputActions& out_actions) {
    out_actions.spawn_pressed = false;

    SDL_Event event{};
    while (SDL_PollEvent(&event)) {
        if (IsQuitEvent(event.type)) {
            quit_requested = true;
        }

        if (event.type == SDL_EVENT_KEY_DOWN && event.key.scancode == SDL_SCANCODE_ESCAPE) {
            quit_requested = true;
        }

        if (event.type == SDL_EVENT_MOUSE_BUTTON_DOWN &&
            event.button.button == SDL_BUTTON_LEFT) {
            out_actions.spawn_pressed = true;
        }
    }

    const bool* keyboard_state = SDL_GetKeyboardState(nullptr);
    if (keyboard_state != nullptr) {
        out_actions.move_forward = keyboard_state[SDL_SCANCODE_W];
        out_actions.move_back = keyboard_state[SDL_SCANCODE_S];
        out_actions.strafe_left = keyboard_state[SDL_SCANCODE_A];
        out_actions.strafe_right = keyboard_state[SDL_SCANCODE_D];
        out_actions.rise = keyboard_state[SDL_SCANCODE_E] || keyboard_state[SDL_SCANCODE_SPACE];
        out_actions.fall = keyboard_state[SDL_SCANCODE_Q] || keyboard_state[SDL_SCANCODE_C];
        out_actions.turn_left = keyboard_state[SDL_SCANCODE_LEFT];
        out_actions.turn_right = keyboard_state[SDL_SCANCODE_RIGHT];
        out_actions.look_up = keyboard_state[SDL_SCANCODE_UP];
        out_actions.look_down = keyboard_state[SDL_SCANCODE_DOWN];
        out_actions.fast_move = keyboard_state[SDL_SCANCODE_LSHIFT] ||
            keyboard_state[SDL_SCANCODE_RSHIFT];
    }

    if (window_ != nullptr) {
        int window_width = 0;
        int window_height = 0;
        if (SDL_GetWindowSize(window_, &window_width, &window_height)) {
            out_actions.viewport_width = window_width;
            out_actions.viewport_height = window_height;
        }
    }

    return true;
}

void SdlContext::RenderFrame(const RenderScene& scene) {
    if (renderer_ == nullptr) {
        return;
    }

    (void)SDL_SetRenderDrawColor(renderer_, 16, 20, 28, 255);
    (void)SDL_RenderClear(renderer_);

    if (!scene.triangles.empty()) {
        std::vector<SDL_Vertex> vertices;
        vertices.reserve(scene.triangles.size() * 3);
        for (const RenderTriangle& triangle : scene.triangles) {
            const SDL_FColor color = ToFColor(triangle.color);
            for (const ScreenPoint& point : triangle.points) {
                SDL_Vertex vertex{};
                vertex.position = SDL_FPoint{point.x, point.y};
                vertex.color = color;
                vertex.tex_coord = SDL_FPoint{0.0F, 0.0F};
                vertices.push_back(vertex);
            }
        }

        if (!SDL_RenderGeometry(
                renderer_,
                nullptr,
                vertices.data(),
                static_cast<int>(vertices.size()),
                nullptr,
                0)) {
            core::Logger::Warn("platform", "SDL_RenderGeometry failed: " + SdlError());
        }
    }

    SDL_RenderPresent(renderer_);
}

void SdlContext::SetTitle(const std::string& title) {
    if (window_ != nullptr) {
        (void)SDL_SetWindowTitle(window_, title.c_str());
    }
}

void SdlContext::Shutdown() {
    if (renderer_ != nullptr) {
        SDL_DestroyRenderer(renderer_);
        renderer_ = nullptr;
    }

    if (window_ != nullptr) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }

    if (SDL_WasInit(SDL_INIT_VIDEO | SDL_INIT_EVENTS) != 0) {
        SDL_Quit();
    }
}

}  // namespace replica::platform
