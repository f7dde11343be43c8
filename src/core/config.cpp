#include "core/config.h"

#include "core/cfg_parser.h"

#include <string>
#include <utility>
#include <vector>

namespace replica::core {
namespace {

bool ParsePort(const std::string& value, int& out_port) {
    int parsed_port = 0;
    if (!cfg::ParseInt(value, parsed_port)) {
        return false;
    }

    if (parsed_port < 0 || parsed_port > 65535) {
        return false;
    }

    out_port = parsed_port;
    return true;
}

bool ParseNonNegativeInt(const std::string& value, int& out_value) {
    int parsed = 0;
    if (!cfg::ParseInt(value, parsed) || parsed < 0) {
        return false;
    }

    out_value = parsed;
    return true;
}

std::string LineSuffix(int line_number) {
    return ": line " + std::to_string(line_number);
}

}  // namespace

bool ConfigLoader::Load(
    const std::filesystem::path& file_path,
    ClientConfig& out_config,
    std::string& out_error) {
    std::vector<cfg::KeyValueLine> lines;
    if (!cfg::ParseFile(file_path, lines, out_error)) {
        return false;
    }

    ClientConfig parsed_config = out_config;
    for (const cfg::KeyValueLine& line : lines) {
        const std::string& key = line.key;
        const std::string& value = line.value;

        if (key == "window_title") {
            if (!cfg::ParseQuotedString(value, parsed_config.window_title)) {
                out_error = "window_title expects string" + LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        if (key == "window_width") {
            if (!cfg::ParseInt(value, parsed_config.window_width)) {
                out_error = "window_width expects integer" + LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        if (key == "window_height") {
            if (!cfg::ParseInt(value, parsed_config.window_height)) {
                out_error = "window_height expects integer" + LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        if (key == "vsync") {
            if (!cfg::ParseBool(value, parsed_config.vsync)) {
                out_error = "vsync expects boolean" + LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        if (key == "server_host") {
            if (!cfg::ParseQuotedString(value, parsed_config.server_host) ||
                parsed_config.server_host.empty()) {
                out_error = "server_host expects non-empty string" + LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        if (key == "server_port") {
            if (!ParsePort(value, parsed_config.server_port)) {
                out_error =
                    "server_port expects integer within [0,65535]" + LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        if (key == "log_file") {
            if (!cfg::ParseQuotedString(value, parsed_config.log_file)) {
                out_error = "log_file expects string" + LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        if (key == "cache_evict_after_cycles") {
            if (!ParseNonNegativeInt(value, parsed_config.cache_evict_after_cycles)) {
                out_error = "cache_evict_after_cycles expects non-negative integer" +
                    LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        if (key == "camera_move_speed") {
            if (!ParseNonNegativeInt(value, parsed_config.camera_move_speed)) {
                out_error =
                    "camera_move_speed expects non-negative integer" + LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        out_error = "Unknown config key '" + key + "'" + LineSuffix(line.line_number);
        return false;
    }

    if (parsed_config.window_width <= 0 || parsed_config.window_height <= 0) {
        out_error = "Window size must be greater than zero.";
        return false;
    }

    out_config = std::move(parsed_config);
    out_error.clear();
    return true;
}

}  // namespace replica::core
