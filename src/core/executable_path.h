#pragma once

#include <filesystem>

namespace replica::core {

std::filesystem::path GetExecutablePath();

// Empty requests resolve to "<exe_stem>.cfg" beside the executable; relative
// paths are taken from the current directory first, then the executable's.
std::filesystem::path ResolveConfigPath(const std::filesystem::path& requested_path);

}  // namespace replica::core
