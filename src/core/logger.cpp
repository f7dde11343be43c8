#include "core/logger.h"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace replica::core {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

std::ofstream& LogFileStream() {
    static std::ofstream stream;
    return stream;
}

std::string BuildTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t time = std::chrono::system_clock::to_time_t(now);

    std::tm local_tm{};
#if defined(_WIN32)
    localtime_s(&local_tm, &time);
#else
    localtime_r(&time, &local_tm);
#endif

    std::ostringstream stream;
    stream << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    return stream.str();
}

}  // namespace

void Logger::Info(std::string_view module, std::string_view message) {
    Log("INFO", module, message);
}

void Logger::Warn(std::string_view module, std::string_view message) {
    Log("WARN", module, message);
}

void Logger::Error(std::string_view module, std::string_view message) {
    Log("ERROR", module, message);
}

bool Logger::SetLogFile(const std::filesystem::path& file_path, std::string& out_error) {
    std::lock_guard<std::mutex> lock(LogMutex());
    std::ofstream& stream = LogFileStream();
    if (stream.is_open()) {
        stream.close();
    }

    if (file_path.empty()) {
        out_error.clear();
        return true;
    }

    stream.open(file_path, std::ios::app);
    if (!stream.is_open()) {
        out_error = "Cannot open log file: " + file_path.string();
        return false;
    }

    out_error.clear();
    return true;
}

void Logger::Log(
    std::string_view level,
    std::string_view module,
    std::string_view message) {
    std::lock_guard<std::mutex> lock(LogMutex());
    const std::string timestamp = BuildTimestamp();
    std::cout << '[' << timestamp << "] [" << level << "] [" << module << "] "
              << message << '\n';

    std::ofstream& stream = LogFileStream();
    if (stream.is_open()) {
        stream << '[' << timestamp << "] [" << level << "] [" << module << "] "
               << message << '\n';
        stream.flush();
    }
}

}  // namespace replica::core
