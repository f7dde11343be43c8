#include "headless_options.h"

#include <charconv>
#include <string_view>

namespace replica::tools {
namespace {

bool ParseUInt16(std::string_view text, std::uint16_t& out_value) {
    unsigned int parsed = 0;
    const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (error != std::errc() || end != text.data() + text.size() || parsed > 65535U) {
        return false;
    }

    out_value = static_cast<std::uint16_t>(parsed);
    return true;
}

bool ParseUInt64(std::string_view text, std::uint64_t& out_value) {
    std::uint64_t parsed = 0;
    const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (text.empty() || error != std::errc() || end != text.data() + text.size()) {
        return false;
    }

    out_value = parsed;
    return true;
}

}  // namespace

bool ParseHeadlessArguments(int argc, const char* const* argv, HeadlessOptions& out_options, std::string& out_error) {
    for (int index = 1; index < argc; ++index) {
        const std::string arg = argv[index];
        std::string value;
        auto read_value = [&](const std::string& key) {
            if (index + 1 >= argc) {
                out_error = "Missing value for option: " + key;
                return false;
            }
            ++index;
            value = argv[index];
            if (value.empty()) {
                out_error = "Empty value for option: " + key;
                return false;
            }
            return true;
        };

        if (arg == "--config") {
            if (!read_value(arg)) {
                return false;
            }
            out_options.config_path = value;
            continue;
        }

        if (arg == "--host") {
            if (!read_value(arg)) {
                return false;
            }
            out_options.host = value;
            continue;
        }

        if (arg == "--port") {
            if (!read_value(arg)) {
                return false;
            }
            std::uint16_t port = 0;
            if (!ParseUInt16(value, port) || port == 0) {
                out_error = "Invalid --port value: " + value;
                return false;
            }
            out_options.port = port;
            continue;
        }

        if (arg == "--cycles") {
            if (!read_value(arg)) {
                return false;
            }
            if (!ParseUInt64(value, out_options.cycles)) {
                out_error = "Invalid --cycles value: " + value;
                return false;
            }
            continue;
        }

        if (arg == "--spawn-every") {
            if (!read_value(arg)) {
                return false;
            }
            if (!ParseUInt64(value, out_options.spawn_every)) {
                out_error = "Invalid --spawn-every value: " + value;
                return false;
            }
            continue;
        }

        out_error = "Unknown option: " + arg;
        return false;
    }

    out_error.clear();
    return true;
}

}  // namespace replica::tools
