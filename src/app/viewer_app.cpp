#include "app/viewer_app.h"

#include "core/executable_path.h"
#include "core/logger.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>

namespace replica::app {
namespace {

constexpr double kFixedDeltaSeconds = 1.0 / 60.0;
constexpr double kMaxFrameClampSeconds = 0.25;
constexpr std::uint64_t kStatusPeriodCycles = 600;

session::SessionOptions BuildSessionOptions(const core::ClientConfig& config) {
    session::SessionOptions options{};
    options.evict_after_cycles = static_cast<std::uint32_t>(config.cache_evict_after_cycles);
    return options;
}

}  // namespace

ViewerApp::ViewerApp() = default;

ViewerApp::~ViewerApp() {
    Shutdown();
}

bool ViewerApp::Initialize(const std::filesystem::path& config_path) {
    const std::filesystem::path resolved_config_path = core::ResolveConfigPath(config_path);
    std::string config_error;
    if (std::filesystem::exists(resolved_config_path)) {
        if (!core::ConfigLoader::Load(resolved_config_path, config_, config_error)) {
            core::Logger::Warn("config", "Config load failed, using defaults: " + config_error);
        } else {
            core::Logger::Info("config", "Config loaded: " + resolved_config_path.string());
        }
    } else {
        core::Logger::Info(
            "config",
            "Config not found, using defaults: " + resolved_config_path.string());
    }

    if (!config_.log_file.empty()) {
        std::string log_error;
        if (!core::Logger::SetLogFile(config_.log_file, log_error)) {
            core::Logger::Warn("app", "Log file disabled: " + log_error);
        }
    }

    if (!sdl_context_.Initialize(config_)) {
        core::Logger::Error("app", "SDL3 initialization failed.");
        return false;
    }

    camera_.Reset();
    channel_ = std::make_unique<net::TcpLineChannel>(net::TcpEndpoint{
        .host = config_.server_host,
        .port = static_cast<std::uint16_t>(config_.server_port),
    });
    driver_ = std::make_unique<session::SessionDriver>(*this, spawn_mailbox_, BuildSessionOptions(config_));
    link_ = std::make_unique<net::SessionLink>(*channel_, *driver_);

    core::Logger::Info(
        "net",
        "Connecting to " + config_.server_host + ":" + std::to_string(config_.server_port));
    std::string open_error;
    if (!link_->Open(open_error)) {
        link_.reset();
        driver_.reset();
        channel_.reset();
        sdl_context_.Shutdown();
        return false;
    }

    initialized_ = true;
    quit_requested_ = false;
    return true;
}

int ViewerApp::Run() {
    if (!initialized_) {
        return 1;
    }

    auto previous_time = std::chrono::steady_clock::now();
    double accumulator = 0.0;
    while (PumpFrame()) {
        const auto now = std::chrono::steady_clock::now();
        const double frame_seconds = std::clamp(
            std::chrono::duration<double>(now - previous_time).count(),
            0.0,
            kMaxFrameClampSeconds);
        previous_time = now;
        accumulator += frame_seconds;

        while (accumulator >= kFixedDeltaSeconds) {
            Update(kFixedDeltaSeconds);
            accumulator -= kFixedDeltaSeconds;
        }

        (void)link_->Pump();
        Render();
    }

    core::Logger::Info("app", "Main loop exited.");
    if (driver_->IsFinished() && !quit_requested_) {
        core::Logger::Error("app", "Session ended: " + driver_->FinishReason());
        return 1;
    }
    return 0;
}

bool ViewerApp::PumpFrame() {
    if (!sdl_context_.PumpEvents(quit_requested_, frame_actions_)) {
        core::Logger::Error("platform", "Event pump failed.");
        return false;
    }

    if (frame_actions_.spawn_pressed) {
        spawn_mailbox_.Request();
    }

    return !quit_requested_ && !driver_->IsFinished();
}

void ViewerApp::Update(double fixed_delta_seconds) {
    camera_.Update(frame_actions_, fixed_delta_seconds, static_cast<double>(config_.camera_move_speed));
}

void ViewerApp::Render() {
    const int viewport_width =
        frame_actions_.viewport_width > 0 ? frame_actions_.viewport_width : config_.window_width;
    const int viewport_height =
        frame_actions_.viewport_height > 0 ? frame_actions_.viewport_height : config_.window_height;
    const platform::RenderScene scene = render_scene_builder_.Build(
        driver_->Cache(),
        camera_.ToViewpoint(),
        viewport_width,
        viewport_height);
    sdl_context_.RenderFrame(scene);
}

session::Viewpoint ViewerApp::CurrentViewpoint() const {
    return camera_.ToViewpoint();
}

void ViewerApp::PresentFrame(const cache::ObjectCache& cache, const session::Viewpoint& viewpoint) {
    (void)viewpoint;
    ++presented_frame_count_;

    const std::uint64_t cycle = driver_ != nullptr ? driver_->CompletedCycleCount() : 0;
    if (cycle == 0 || cycle - last_status_cycle_ < kStatusPeriodCycles) {
        return;
    }

    last_status_cycle_ = cycle;
    sdl_context_.SetTitle(
        config_.window_title + " - " + std::to_string(cache.Size()) + " objects");
    core::Logger::Info(
        "app",
        "Status: cycles=" + std::to_string(cycle) +
            ", cached_objects=" + std::to_string(cache.Size()) +
            ", spawns=" + std::to_string(driver_->SpawnRequestCount()) +
            ", rejected_spawns=" + std::to_string(driver_->RejectedSpawnCount()) +
            ", aborted_reconciles=" + std::to_string(driver_->AbortedReconcileCount()));
}

void ViewerApp::Shutdown() {
    if (!initialized_) {
        return;
    }

    if (channel_ != nullptr) {
        channel_->Close();
    }
    if (link_ != nullptr) {
        (void)link_->Pump();
    }

    link_.reset();
    driver_.reset();
    channel_.reset();
    sdl_context_.Shutdown();
    initialized_ = false;
    core::Logger::Info("app", "Replica viewer shutdown complete.");
}

}  // namespace replica::app
