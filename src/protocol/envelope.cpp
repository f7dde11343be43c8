#include "protocol/envelope.h"

#include <utility>

namespace replica::protocol {

std::string EncodeRequest(std::string_view command_name, const nlohmann::json& payload) {
    nlohmann::json request = nlohmann::json::object();
    request["cmd"] = std::string(command_name);
    request["payload"] = payload.is_null() ? nlohmann::json::object() : payload;
    return request.dump();
}

bool TryDecodeResponse(std::string_view text, ResponseEnvelope& out_envelope, std::string& out_error) {
    out_envelope = {};

    const nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        out_error = "response is not valid json";
        return false;
    }
    if (!parsed.is_object()) {
        out_error = "response is not a json object";
        return false;
    }

    const auto ok_it = parsed.find("ok");
    if (ok_it == parsed.end() || !ok_it->is_boolean()) {
        out_error = "response missing boolean 'ok'";
        return false;
    }

    nlohmann::json payload;
    const auto payload_it = parsed.find("payload");
    if (payload_it != parsed.end() && !payload_it->is_null()) {
        if (!payload_it->is_object()) {
            out_error = "response payload is not an object";
            return false;
        }
        payload = *payload_it;
    }

    out_envelope.ok = ok_it->get<bool>();
    out_envelope.payload = std::move(payload);
    out_error.clear();
    return true;
}

}  // namespace replica::protocol
