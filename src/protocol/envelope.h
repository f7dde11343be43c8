#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace replica::protocol {

struct ResponseEnvelope final {
    bool ok = false;
    // Object payload; null when the server omitted it.
    nlohmann::json payload;
};

// {"cmd": <command_name>, "payload": <payload>}
std::string EncodeRequest(std::string_view command_name, const nlohmann::json& payload);

// Accepts {"ok": <bool>, "payload": <object>}; payload may be absent or null
// on failure. A rejection (ok == false) is a successful decode.
bool TryDecodeResponse(std::string_view text, ResponseEnvelope& out_envelope, std::string& out_error);

}  // namespace replica::protocol
