#include "headless_options.h"

#include "app/fly_camera.h"
#include "core/config.h"
#include "core/executable_path.h"
#include "core/logger.h"
#include "net/session_link.h"
#include "net/tcp_line_channel.h"
#include "session/session_driver.h"
#include "session/spawn_mailbox.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

namespace {

void PrintUsage() {
    std::cout
        << "Usage:\n"
        << "  replica_headless [--config <path>] [--host <host>] [--port <port>] "
        << "[--cycles <count>] [--spawn-every <cycles>]\n";
}

// Fixed viewpoint; raises a spawn request every `spawn_every` cycles.
class HeadlessHost final : public replica::session::ISessionHost {
public:
    HeadlessHost(replica::session::SpawnMailbox& spawn_mailbox, std::uint64_t spawn_every)
        : spawn_mailbox_(spawn_mailbox),
          spawn_every_(spawn_every) {}

    replica::session::Viewpoint CurrentViewpoint() const override {
        return camera_.ToViewpoint();
    }

    void PresentFrame(
        const replica::cache::ObjectCache& cache,
        const replica::session::Viewpoint& viewpoint) override {
        (void)viewpoint;
        ++frame_count_;
        last_object_count_ = cache.Size();
        if (spawn_every_ != 0 && frame_count_ % spawn_every_ == 0) {
            spawn_mailbox_.Request();
        }
    }

    std::uint64_t FrameCount() const {
        return frame_count_;
    }

    std::size_t LastObjectCount() const {
        return last_object_count_;
    }

private:
    replica::session::SpawnMailbox& spawn_mailbox_;
    std::uint64_t spawn_every_ = 0;
    replica::app::FlyCamera camera_;
    std::uint64_t frame_count_ = 0;
    std::size_t last_object_count_ = 0;
};

}  // namespace

int main(int argc, char** argv) {
    replica::tools::HeadlessOptions options{};
    std::string error;
    if (!replica::tools::ParseHeadlessArguments(argc, argv, options, error)) {
        std::cerr << "[ERROR] " << error << '\n';
        PrintUsage();
        return 1;
    }

    replica::core::ClientConfig config{};
    const std::filesystem::path config_path = replica::core::ResolveConfigPath(options.config_path);
    if (!options.config_path.empty() || std::filesystem::exists(config_path)) {
        if (!replica::core::ConfigLoader::Load(config_path, config, error)) {
            std::cerr << "[ERROR] config load failed: " << error << '\n';
            return 1;
        }
    }
    if (options.host.has_value()) {
        config.server_host = *options.host;
    }
    if (options.port.has_value()) {
        config.server_port = *options.port;
    }
    if (!config.log_file.empty() && !replica::core::Logger::SetLogFile(config.log_file, error)) {
        std::cerr << "[WARN] log file disabled: " << error << '\n';
    }

    replica::session::SpawnMailbox spawn_mailbox;
    HeadlessHost host(spawn_mailbox, options.spawn_every);
    replica::session::SessionOptions session_options{};
    session_options.evict_after_cycles = static_cast<std::uint32_t>(config.cache_evict_after_cycles);
    replica::session::SessionDriver driver(host, spawn_mailbox, session_options);
    replica::net::TcpLineChannel channel(replica::net::TcpEndpoint{
        .host = config.server_host,
        .port = static_cast<std::uint16_t>(config.server_port),
    });
    replica::net::SessionLink link(channel, driver);
    if (!link.Open(error)) {
        std::cerr << "[ERROR] connect failed: " << error << '\n';
        return 1;
    }

    bool cycle_limit_reached = false;
    while (!driver.IsFinished() && !link.IsClosed()) {
        if (link.Pump() == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        if (options.cycles != 0 && driver.CompletedCycleCount() >= options.cycles) {
            cycle_limit_reached = true;
            break;
        }
    }

    channel.Close();
    (void)link.Pump();

    std::cout
        << "[INFO] headless summary"
        << " cycles=" << driver.CompletedCycleCount()
        << " frames=" << host.FrameCount()
        << " cached_objects=" << driver.Cache().Size()
        << " requests=" << link.SentRequestCount()
        << " replies=" << link.ReceivedReplyCount()
        << " unexpected=" << link.UnexpectedMessageCount()
        << " spawns=" << driver.SpawnRequestCount()
        << " rejected_spawns=" << driver.RejectedSpawnCount()
        << " aborted_reconciles=" << driver.AbortedReconcileCount()
        << " template_lookups=" << driver.Templates().LookupCount()
        << " template_fetches=" << driver.Templates().FetchCount()
        << '\n';

    if (cycle_limit_reached) {
        return 0;
    }

    std::cerr << "[ERROR] session ended: " << driver.FinishReason() << '\n';
    return 1;
}
