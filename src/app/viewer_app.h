#pragma once

#include "app/fly_camera.h"
#include "app/render_scene_builder.h"
#include "core/config.h"
#include "net/session_link.h"
#include "net/tcp_line_channel.h"
#include "platform/sdl_context.h"
#include "session/session_driver.h"
#include "session/spawn_mailbox.h"

#include <cstdint>
#include <filesystem>
#include <memory>

namespace replica::app {

class ViewerApp final : public session::ISessionHost {
public:
    ViewerApp();
    ~ViewerApp() override;

    bool Initialize(const std::filesystem::path& config_path);
    int Run();
    void Shutdown();

    session::Viewpoint CurrentViewpoint() const override;
    void PresentFrame(const cache::ObjectCache& cache, const session::Viewpoint& viewpoint) override;

private:
    bool PumpFrame();
    void Update(double fixed_delta_seconds);
    void Render();

    bool initialized_ = false;
    bool quit_requested_ = false;
    core::ClientConfig config_;
    platform::SdlContext sdl_context_;
    platform::InputActions frame_actions_;
    FlyCamera camera_;
    RenderSceneBuilder render_scene_builder_;
    session::SpawnMailbox spawn_mailbox_;
    std::unique_ptr<net::TcpLineChannel> channel_;
    std::unique_ptr<session::SessionDriver> driver_;
    std::unique_ptr<net::SessionLink> link_;
    std::uint64_t presented_frame_count_ = 0;
    std::uint64_t last_status_cycle_ = 0;
};

}  // namespace replica::app
