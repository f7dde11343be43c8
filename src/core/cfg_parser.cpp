#include "core/cfg_parser.h"

#include <cctype>
#include <charconv>
#include <fstream>
#include <utility>

namespace replica::core::cfg {
namespace {

std::string_view Trim(std::string_view text) {
    std::size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
        ++start;
    }

    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }

    return text.substr(start, end - start);
}

std::string_view StripComment(std::string_view line) {
    bool in_quotes = false;
    for (std::size_t index = 0; index < line.size(); ++index) {
        if (line[index] == '"') {
            in_quotes = !in_quotes;
        } else if (line[index] == '#' && !in_quotes) {
            return line.substr(0, index);
        }
    }
    return line;
}

std::string LineSuffix(int line_number) {
    return ": line " + std::to_string(line_number);
}

}  // namespace

bool ParseFile(
    const std::filesystem::path& file_path,
    std::vector<KeyValueLine>& out_lines,
    std::string& out_error) {
    out_lines.clear();

    std::ifstream file(file_path);
    if (!file.is_open()) {
        out_error = "Cannot open config file: " + file_path.string();
        return false;
    }

    std::string raw_line;
    int line_number = 0;
    while (std::getline(file, raw_line)) {
        ++line_number;
        const std::string_view line = Trim(StripComment(raw_line));
        if (line.empty()) {
            continue;
        }

        if (line.front() == '[' && line.back() == ']') {
            continue;
        }

        const std::string_view::size_type equal_pos = line.find('=');
        if (equal_pos == std::string_view::npos) {
            out_error = "Invalid config line (missing '=')" + LineSuffix(line_number);
            return false;
        }

        KeyValueLine parsed{};
        parsed.key = std::string(Trim(line.substr(0, equal_pos)));
        parsed.value = std::string(Trim(line.substr(equal_pos + 1)));
        parsed.line_number = line_number;
        if (parsed.key.empty()) {
            out_error = "Invalid config line (empty key)" + LineSuffix(line_number);
            return false;
        }

        out_lines.push_back(std::move(parsed));
    }

    out_error.clear();
    return true;
}

bool ParseBool(std::string_view value, bool& out_value) {
    const std::string_view trimmed = Trim(value);
    if (trimmed == "true") {
        out_value = true;
        return true;
    }
    if (trimmed == "false") {
        out_value = false;
        return true;
    }
    return false;
}

bool ParseInt(std::string_view value, int& out_value) {
    const std::string_view trimmed = Trim(value);
    int parsed = 0;
    const auto [end, error] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), parsed);
    if (trimmed.empty() || error != std::errc() || end != trimmed.data() + trimmed.size()) {
        return false;
    }

    out_value = parsed;
    return true;
}

bool ParseQuotedString(std::string_view value, std::string& out_text) {
    const std::string_view trimmed = Trim(value);
    if (trimmed.size() < 2 || trimmed.front() != '"' || trimmed.back() != '"') {
        return false;
    }
    out_text = std::string(trimmed.substr(1, trimmed.size() - 2));
    return true;
}

}  // namespace replica::core::cfg
