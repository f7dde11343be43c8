#include "core/config.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace {

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

std::filesystem::path BuildTestDirectory() {
    const auto unique_seed =
        std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() /
        ("replica_config_loader_test_" + std::to_string(unique_seed));
}

bool WriteConfigFile(const std::filesystem::path& file_path, const std::string& content) {
    std::ofstream file(file_path, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file << content;
    file.close();
    return true;
}

}  // namespace

int main() {
    bool passed = true;

    const std::filesystem::path test_dir = BuildTestDirectory();
    const std::filesystem::path config_path = test_dir / "replica.cfg";
    std::error_code ec;
    std::filesystem::remove_all(test_dir, ec);
    std::filesystem::create_directories(test_dir, ec);

    replica::core::ClientConfig defaults{};
    passed &= Expect(defaults.window_title == "Replica", "Window title should default to Replica.");
    passed &= Expect(
        defaults.window_width == 1280 && defaults.window_height == 720,
        "Window size should default to 1280x720.");
    passed &= Expect(defaults.vsync, "VSync should default to true.");
    passed &= Expect(defaults.server_host == "127.0.0.1", "Server host should default to loopback.");
    passed &= Expect(defaults.server_port == 8080, "Server port should default to 8080.");
    passed &= Expect(defaults.log_file.empty(), "Log file should default to disabled.");
    passed &= Expect(defaults.cache_evict_after_cycles == 0, "Eviction should default to never.");
    passed &= Expect(defaults.camera_move_speed == 25, "Camera speed should default to 25.");

    passed &= Expect(
        WriteConfigFile(
            config_path,
            "# viewer settings\n"
            "[window]\n"
            "window_title = \"CfgTest\"\n"
            "window_width = 1600\n"
            "window_height = 900\n"
            "vsync = false\n"
            "[server]\n"
            "server_host = \"10.0.0.5\"\n"
            "server_port = 9001\n"
            "log_file = \"replica.log\"\n"
            "cache_evict_after_cycles = 30\n"
            "camera_move_speed = 40\n"),
        "Config file write should succeed.");

    replica::core::ClientConfig config{};
    std::string error;
    passed &= Expect(
        replica::core::ConfigLoader::Load(config_path, config, error),
        "Config load should succeed.");
    passed &= Expect(error.empty(), "Successful config load should not return error.");
    passed &= Expect(config.window_title == "CfgTest", "window_title should parse.");
    passed &= Expect(config.window_width == 1600 && config.window_height == 900, "Window size should parse.");
    passed &= Expect(!config.vsync, "vsync should parse as false.");
    passed &= Expect(config.server_host == "10.0.0.5", "server_host should parse.");
    passed &= Expect(config.server_port == 9001, "server_port should parse.");
    passed &= Expect(config.log_file == "replica.log", "log_file should parse.");
    passed &= Expect(config.cache_evict_after_cycles == 30, "cache_evict_after_cycles should parse.");
    passed &= Expect(config.camera_move_speed == 40, "camera_move_speed should parse.");

    passed &= Expect(
        WriteConfigFile(config_path, "server_port = 7000\n"),
        "Partial config file write should succeed.");
    replica::core::ClientConfig partial_config{};
    passed &= Expect(
        replica::core::ConfigLoader::Load(config_path, partial_config, error),
        "Partial config load should succeed.");
    passed &= Expect(partial_config.server_port == 7000, "Partial config should override port.");
    passed &= Expect(
        partial_config.server_host == "127.0.0.1" && partial_config.window_width == 1280,
        "Keys absent from the file should keep their defaults.");

    passed &= Expect(
        WriteConfigFile(config_path, "window_title = \"Replica #2\"  # second seat\n"),
        "Hash in title config file write should succeed.");
    replica::core::ClientConfig hash_config{};
    passed &= Expect(
        replica::core::ConfigLoader::Load(config_path, hash_config, error),
        "Quoted hash config load should succeed.");
    passed &= Expect(
        hash_config.window_title == "Replica #2",
        "A hash inside quotes should not start a comment.");

    passed &= Expect(
        WriteConfigFile(config_path, "window_width = 1600\nvsync\n"),
        "Missing separator config file write should succeed.");
    replica::core::ClientConfig separator_config{};
    passed &= Expect(
        !replica::core::ConfigLoader::Load(config_path, separator_config, error),
        "Line without '=' should fail to load.");
    passed &= Expect(error.find("line 2") != std::string::npos, "Missing '=' error should name the line.");
    passed &= Expect(separator_config.window_width == 1280, "Parse failure should leave the config untouched.");

    passed &= Expect(
        WriteConfigFile(config_path, "window_height = 9OO\n"),
        "Malformed integer config file write should succeed.");
    passed &= Expect(
        !replica::core::ConfigLoader::Load(config_path, separator_config, error),
        "Integer with trailing characters should fail to load.");

    passed &= Expect(
        WriteConfigFile(
            config_path,
            "window_title = \"Broken\"\n"
            "server_port = 70000\n"),
        "Invalid port config file write should succeed.");
    replica::core::ClientConfig untouched_config{};
    passed &= Expect(
        !replica::core::ConfigLoader::Load(config_path, untouched_config, error),
        "Out of range port should fail to load.");
    passed &= Expect(error.find("line 2") != std::string::npos, "Port error should name the line.");
    passed &= Expect(
        untouched_config.window_title == "Replica",
        "Failed load should leave the target config untouched.");

    passed &= Expect(
        WriteConfigFile(config_path, "server_name = \"alpha\"\n"),
        "Unknown key config file write should succeed.");
    passed &= Expect(
        !replica::core::ConfigLoader::Load(config_path, untouched_config, error),
        "Unknown key should fail to load.");
    passed &= Expect(
        error.find("server_name") != std::string::npos,
        "Unknown key error should name the key.");

    passed &= Expect(
        WriteConfigFile(config_path, "window_width = 0\n"),
        "Zero width config file write should succeed.");
    passed &= Expect(
        !replica::core::ConfigLoader::Load(config_path, untouched_config, error),
        "Zero window width should fail to load.");

    passed &= Expect(
        WriteConfigFile(config_path, "cache_evict_after_cycles = -3\n"),
        "Negative eviction config file write should succeed.");
    passed &= Expect(
        !replica::core::ConfigLoader::Load(config_path, untouched_config, error),
        "Negative eviction threshold should fail to load.");

    passed &= Expect(
        WriteConfigFile(config_path, "vsync = maybe\n"),
        "Malformed bool config file write should succeed.");
    passed &= Expect(
        !replica::core::ConfigLoader::Load(config_path, untouched_config, error),
        "Malformed boolean should fail to load.");

    passed &= Expect(
        !replica::core::ConfigLoader::Load(test_dir / "missing.cfg", untouched_config, error),
        "Missing file should fail to load.");
    passed &= Expect(!error.empty(), "Missing file should report an error.");

    std::filesystem::remove_all(test_dir, ec);

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] replica_config_tests\n";
    return 0;
}
