#include "core/executable_path.h"

#include <string>
#include <system_error>

#if defined(_WIN32)
#include <Windows.h>
#endif

namespace replica::core {

std::filesystem::path GetExecutablePath() {
#if defined(_WIN32)
    std::wstring buffer;
    buffer.resize(32 * 1024);

    const DWORD size =
        ::GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
    if (size == 0) {
        return std::filesystem::current_path();
    }

    buffer.resize(size);
    return std::filesystem::path(buffer);
#else
    std::error_code ec;
    const std::filesystem::path resolved = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec && !resolved.empty()) {
        return resolved;
    }
    return std::filesystem::current_path();
#endif
}

std::filesystem::path ResolveConfigPath(const std::filesystem::path& requested_path) {
    const std::filesystem::path executable_path = GetExecutablePath();
    const std::filesystem::path exe_dir = executable_path.parent_path();
    if (requested_path.empty()) {
        return (exe_dir / (executable_path.stem().string() + ".cfg")).lexically_normal();
    }
    if (requested_path.is_absolute()) {
        return requested_path.lexically_normal();
    }

    std::error_code ec;
    if (std::filesystem::exists(requested_path, ec)) {
        return requested_path.lexically_normal();
    }
    return (exe_dir / requested_path).lexically_normal();
}

}  // namespace replica::core
