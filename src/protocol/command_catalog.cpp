#include "protocol/command_catalog.h"

#include "protocol/envelope.h"
#include "protocol/json_codec.h"

#include <nlohmann/json.hpp>

#include <utility>

namespace replica::protocol {
namespace {

template <typename ResultT, typename PayloadDecoder>
typename Command<ResultT>::Decoder MakeDecoder(std::string_view command_name, PayloadDecoder decode_payload) {
    return [name = std::string(command_name), decode_payload](
               std::string_view text,
               ResultT& out_result,
               std::string& out_error) {
        out_result = {};

        ResponseEnvelope envelope;
        if (!TryDecodeResponse(text, envelope, out_error)) {
            out_error = name + ": " + out_error;
            return false;
        }

        out_result.ok = envelope.ok;
        if (!envelope.ok) {
            out_error.clear();
            return true;
        }

        if (!decode_payload(envelope.payload, out_result, out_error)) {
            out_result = {};
            out_error = name + ": " + out_error;
            return false;
        }

        out_error.clear();
        return true;
    };
}

template <typename ResultT, typename PayloadDecoder>
Command<ResultT> MakeCommand(
    std::string_view command_name,
    const nlohmann::json& payload,
    PayloadDecoder decode_payload) {
    Command<ResultT> command;
    command.name = std::string(command_name);
    command.request = EncodeRequest(command_name, payload);
    command.decode = MakeDecoder<ResultT>(command_name, std::move(decode_payload));
    return command;
}

bool DecodeAck(const nlohmann::json& payload, AckResult& out_result, std::string& out_error) {
    (void)payload;
    (void)out_result;
    out_error.clear();
    return true;
}

bool DecodeObjIdField(const nlohmann::json& payload, ObjectId& out_id, std::string& out_error) {
    const nlohmann::json* field = nullptr;
    if (!json_codec::TryGetField(payload, "objID", "payload", field, out_error)) {
        return false;
    }
    return json_codec::TryDecodeCompositeId(*field, out_id, out_error);
}

}  // namespace

Command<AckResult> Ping() {
    return MakeCommand<AckResult>(kCommandPing, nlohmann::json::object(), DecodeAck);
}

Command<IdentityResult> SetIdentity(const std::optional<ObjectId>& requested_id) {
    nlohmann::json payload = nlohmann::json::object();
    payload["objID"] = requested_id.has_value()
        ? json_codec::EncodeCompositeId(*requested_id)
        : nlohmann::json(nullptr);

    return MakeCommand<IdentityResult>(
        kCommandSetIdentity,
        payload,
        [](const nlohmann::json& reply, IdentityResult& out_result, std::string& out_error) {
            return DecodeObjIdField(reply, out_result.obj_id, out_error);
        });
}

Command<AckResult> AddTemplate(
    const TemplateId& template_id,
    const CollisionShape& collision_shape,
    const std::vector<float>& vertex_buffer) {
    nlohmann::json payload = nlohmann::json::object();
    payload["name"] = json_codec::EncodeCompositeId(template_id);
    payload["cs"] = json_codec::EncodeCollisionShape(collision_shape);
    payload["geo"] = vertex_buffer;
    payload["boosters"] = nlohmann::json::array();
    payload["factories"] = nlohmann::json::array();

    return MakeCommand<AckResult>(kCommandAddTemplate, payload, DecodeAck);
}

Command<TemplateResult> GetTemplate(const TemplateId& template_id) {
    nlohmann::json payload = nlohmann::json::object();
    payload["templateID"] = json_codec::EncodeCompositeId(template_id);

    return MakeCommand<TemplateResult>(
        kCommandGetTemplate,
        payload,
        [](const nlohmann::json& reply, TemplateResult& out_result, std::string& out_error) {
            const nlohmann::json* geometry = nullptr;
            const nlohmann::json* shape = nullptr;
            return json_codec::TryGetField(reply, "geo", "payload", geometry, out_error) &&
                json_codec::TryDecodeFloatList(*geometry, out_result.geometry, out_error) &&
                json_codec::TryGetField(reply, "cs", "payload", shape, out_error) &&
                json_codec::TryDecodeCollisionShape(*shape, out_result.collision_shape, out_error);
        });
}

Command<SpawnResult> Spawn(
    const TemplateId& template_id,
    const Vec3& position,
    const Vec3& velocity,
    const Quat& orientation,
    double scale,
    double inverse_mass) {
    StateVariable state = MakeStateVariable(position, velocity, orientation, scale, inverse_mass);
    state.collision_shape = kDynamicCollisionShape;

    nlohmann::json payload = nlohmann::json::object();
    payload["name"] = nullptr;
    payload["templateID"] = json_codec::EncodeCompositeId(template_id);
    payload["sv"] = json_codec::EncodeStateVariable(state);

    return MakeCommand<SpawnResult>(
        kCommandSpawn,
        payload,
        [](const nlohmann::json& reply, SpawnResult& out_result, std::string& out_error) {
            return DecodeObjIdField(reply, out_result.obj_id, out_error);
        });
}

Command<ObjectListResult> ListObjectIds() {
    return MakeCommand<ObjectListResult>(
        kCommandListObjectIds,
        nlohmann::json::object(),
        [](const nlohmann::json& reply, ObjectListResult& out_result, std::string& out_error) {
            const nlohmann::json* ids = nullptr;
            return json_codec::TryGetField(reply, "objIDs", "payload", ids, out_error) &&
                json_codec::TryDecodeCompositeIdList(*ids, out_result.obj_ids, out_error);
        });
}

Command<TemplateIdResult> GetTemplateIdOf(const ObjectId& obj_id) {
    nlohmann::json payload = nlohmann::json::object();
    payload["objID"] = json_codec::EncodeCompositeId(obj_id);

    return MakeCommand<TemplateIdResult>(
        kCommandGetTemplateId,
        payload,
        [](const nlohmann::json& reply, TemplateIdResult& out_result, std::string& out_error) {
            const nlohmann::json* template_id = nullptr;
            return json_codec::TryGetField(reply, "templateID", "payload", template_id, out_error) &&
                json_codec::TryDecodeCompositeId(*template_id, out_result.template_id, out_error);
        });
}

Command<StateVariablesResult> GetStateVariables(const std::vector<ObjectId>& obj_ids) {
    nlohmann::json encoded_ids = nlohmann::json::array();
    for (const ObjectId& obj_id : obj_ids) {
        encoded_ids.push_back(json_codec::EncodeCompositeId(obj_id));
    }

    nlohmann::json payload = nlohmann::json::object();
    payload["objIDs"] = std::move(encoded_ids);

    return MakeCommand<StateVariablesResult>(
        kCommandGetStateVariables,
        payload,
        [](const nlohmann::json& reply, StateVariablesResult& out_result, std::string& out_error) {
            const nlohmann::json* data = nullptr;
            if (!json_codec::TryGetField(reply, "data", "payload", data, out_error)) {
                return false;
            }
            if (!data->is_array()) {
                out_error = "payload 'data' expects array";
                return false;
            }

            out_result.sv.reserve(data->size());
            for (const nlohmann::json& record : *data) {
                const nlohmann::json* sv = nullptr;
                if (!json_codec::TryGetField(record, "sv", "state record", sv, out_error)) {
                    return false;
                }

                StateVariableRecord decoded{};
                if (!sv->is_null()) {
                    StateVariable state{};
                    if (!json_codec::TryDecodeStateVariable(*sv, state, out_error)) {
                        return false;
                    }
                    decoded.sv = state;
                }
                out_result.sv.push_back(std::move(decoded));
            }
            return true;
        });
}

Command<AckResult> SuggestPosition(const ObjectId& obj_id, const Vec3& position) {
    nlohmann::json payload = nlohmann::json::object();
    payload["objID"] = json_codec::EncodeCompositeId(obj_id);
    payload["pos"] = json_codec::EncodeVec3(position);

    return MakeCommand<AckResult>(kCommandSuggestPosition, payload, DecodeAck);
}

}  // namespace replica::protocol
