#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace replica::core::cfg {

struct KeyValueLine final {
    std::string key;
    std::string value;
    int line_number = 0;
};

// Reads `key = value` lines. `#` starts a comment outside double quotes and
// `[section]` lines are skipped.
bool ParseFile(
    const std::filesystem::path& file_path,
    std::vector<KeyValueLine>& out_lines,
    std::string& out_error);

bool ParseQuotedString(std::string_view value, std::string& out_text);
bool ParseBool(std::string_view value, bool& out_value);
bool ParseInt(std::string_view value, int& out_value);

}  // namespace replica::core::cfg
