#pragma once

#include "protocol/composite_id.h"
#include "protocol/state_variable.h"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace replica::protocol::json_codec {

nlohmann::json EncodeCompositeId(const CompositeId& id);
nlohmann::json EncodeVec3(const Vec3& value);
nlohmann::json EncodeQuat(const Quat& value);
nlohmann::json EncodeCollisionShape(const CollisionShape& shape);
nlohmann::json EncodeStateVariable(const StateVariable& state);

bool TryDecodeCompositeId(const nlohmann::json& value, CompositeId& out_id, std::string& out_error);
bool TryDecodeCompositeIdList(
    const nlohmann::json& value,
    std::vector<CompositeId>& out_ids,
    std::string& out_error);
bool TryDecodeVec3(const nlohmann::json& value, Vec3& out_vec, std::string& out_error);
bool TryDecodeQuat(const nlohmann::json& value, Quat& out_quat, std::string& out_error);
bool TryDecodeCollisionShape(
    const nlohmann::json& value,
    CollisionShape& out_shape,
    std::string& out_error);
bool TryDecodeFloatList(const nlohmann::json& value, std::vector<float>& out_values, std::string& out_error);

// Missing keys keep their defaults; radius falls back to the decoded scale.
bool TryDecodeStateVariable(const nlohmann::json& value, StateVariable& out_state, std::string& out_error);

// Looks up `key` in an object payload. Reports "<context>: missing '<key>'".
bool TryGetField(
    const nlohmann::json& object,
    std::string_view key,
    std::string_view context,
    const nlohmann::json*& out_field,
    std::string& out_error);

}  // namespace replica::protocol::json_codec
