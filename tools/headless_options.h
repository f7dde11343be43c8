#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace replica::tools {

struct HeadlessOptions final {
    std::filesystem::path config_path;
    std::optional<std::string> host;
    std::optional<std::uint16_t> port;
    // Zero runs until the session ends.
    std::uint64_t cycles = 0;
    std::uint64_t spawn_every = 0;
};

bool ParseHeadlessArguments(int argc, const char* const* argv, HeadlessOptions& out_options, std::string& out_error);

}  // namespace replica::tools
