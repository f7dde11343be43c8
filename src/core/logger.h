#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace replica::core {

class Logger final {
public:
    static void Info(std::string_view module, std::string_view message);
    static void Warn(std::string_view module, std::string_view message);
    static void Error(std::string_view module, std::string_view message);

    // Mirrors every subsequent line to `file_path` (append). An empty path
    // detaches the file sink.
    static bool SetLogFile(const std::filesystem::path& file_path, std::string& out_error);

private:
    static void Log(std::string_view level, std::string_view module, std::string_view message);
};

}  // namespace replica::core
