#pragma once

#include <filesystem>
#include <string>

namespace replica::core {

struct ClientConfig final {
    std::string window_title = "Replica";
    int window_width = 1280;
    int window_height = 720;
    bool vsync = true;
    std::string server_host = "127.0.0.1";
    int server_port = 8080;
    std::string log_file;
    int cache_evict_after_cycles = 0;
    int camera_move_speed = 25;
};

class ConfigLoader final {
public:
    static bool Load(
        const std::filesystem::path& file_path,
        ClientConfig& out_config,
        std::string& out_error);
};

}  // namespace replica::core
