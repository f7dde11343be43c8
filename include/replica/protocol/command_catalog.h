#pragma once

#include "protocol/composite_id.h"
#include "protocol/state_variable.h"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace replica::protocol {

inline constexpr std::string_view kCommandPing = "ping_clacks";
inline constexpr std::string_view kCommandSetIdentity = "set_id";
inline constexpr std::string_view kCommandAddTemplate = "add_template";
inline constexpr std::string_view kCommandGetTemplate = "get_template";
inline constexpr std::string_view kCommandSpawn = "spawn";
inline constexpr std::string_view kCommandListObjectIds = "get_all_objids";
inline constexpr std::string_view kCommandGetTemplateId = "get_template_id";
inline constexpr std::string_view kCommandGetStateVariables = "get_statevar";
inline constexpr std::string_view kCommandSuggestPosition = "suggest_pos";

// One request/response exchange. `decode` fails only on a malformed reply;
// a well formed rejection decodes with `ok == false`.
template <typename ResultT>
struct Command final {
    using Result = ResultT;
    using Decoder = std::function<bool(std::string_view, ResultT&, std::string&)>;

    std::string name;
    std::string request;
    Decoder decode;
};

struct AckResult final {
    bool ok = false;
};

struct IdentityResult final {
    bool ok = false;
    ObjectId obj_id;
};

struct TemplateResult final {
    bool ok = false;
    std::vector<float> geometry;
    CollisionShape collision_shape = kDefaultCollisionShape;
};

struct SpawnResult final {
    bool ok = false;
    ObjectId obj_id;
};

struct ObjectListResult final {
    bool ok = false;
    std::vector<ObjectId> obj_ids;
};

struct TemplateIdResult final {
    bool ok = false;
    TemplateId template_id;
};

// Empty when the object vanished between enumeration and the state query.
struct StateVariableRecord final {
    std::optional<StateVariable> sv;
};

struct StateVariablesResult final {
    bool ok = false;
    std::vector<StateVariableRecord> sv;
};

Command<AckResult> Ping();

// The server assigns the identity; pass std::nullopt to let it choose.
Command<IdentityResult> SetIdentity(const std::optional<ObjectId>& requested_id);

// A template id must not be reused for different geometry within a session.
Command<AckResult> AddTemplate(
    const TemplateId& template_id,
    const CollisionShape& collision_shape,
    const std::vector<float>& vertex_buffer);

Command<TemplateResult> GetTemplate(const TemplateId& template_id);

// The spawned state variable always carries the dynamic collision shape.
Command<SpawnResult> Spawn(
    const TemplateId& template_id,
    const Vec3& position,
    const Vec3& velocity,
    const Quat& orientation,
    double scale,
    double inverse_mass);

Command<ObjectListResult> ListObjectIds();

Command<TemplateIdResult> GetTemplateIdOf(const ObjectId& obj_id);

// Reply is parallel to `obj_ids`.
Command<StateVariablesResult> GetStateVariables(const std::vector<ObjectId>& obj_ids);

Command<AckResult> SuggestPosition(const ObjectId& obj_id, const Vec3& position);

}  // namespace replica::protocol
