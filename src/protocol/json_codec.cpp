#include "protocol/json_codec.h"

#include <cstddef>
#include <utility>

namespace replica::protocol::json_codec {
namespace {

bool TryDecodeNumberArray(
    const nlohmann::json& value,
    std::size_t expected_size,
    std::string_view what,
    double* out_values,
    std::string& out_error) {
    if (!value.is_array() || value.size() != expected_size) {
        out_error = std::string(what) + " expects array of " + std::to_string(expected_size) + " numbers";
        return false;
    }

    for (std::size_t index = 0; index < expected_size; ++index) {
        if (!value[index].is_number()) {
            out_error = std::string(what) + " element " + std::to_string(index) + " is not a number";
            return false;
        }
        out_values[index] = value[index].get<double>();
    }

    out_error.clear();
    return true;
}

bool TryDecodeScalar(
    const nlohmann::json& object,
    const char* key,
    double& out_value,
    bool& out_present,
    std::string& out_error) {
    out_present = false;
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return true;
    }
    if (!it->is_number()) {
        out_error = std::string("state variable '") + key + "' is not a number";
        return false;
    }

    out_value = it->get<double>();
    out_present = true;
    return true;
}

}  // namespace

nlohmann::json EncodeCompositeId(const CompositeId& id) {
    nlohmann::json encoded = nlohmann::json::array();
    for (const CompositeId::Element element : id.Elements()) {
        encoded.push_back(element);
    }
    return encoded;
}

nlohmann::json EncodeVec3(const Vec3& value) {
    return nlohmann::json::array({value.x, value.y, value.z});
}

nlohmann::json EncodeQuat(const Quat& value) {
    return nlohmann::json::array({value.x, value.y, value.z, value.w});
}

nlohmann::json EncodeCollisionShape(const CollisionShape& shape) {
    return nlohmann::json::array({shape[0], shape[1], shape[2], shape[3]});
}

nlohmann::json EncodeStateVariable(const StateVariable& state) {
    nlohmann::json encoded = nlohmann::json::object();
    encoded["radius"] = state.radius;
    encoded["scale"] = state.scale;
    encoded["imass"] = state.inverse_mass;
    encoded["restitution"] = state.restitution;
    encoded["orientation"] = EncodeQuat(state.orientation);
    encoded["position"] = EncodeVec3(state.position);
    encoded["velocityLin"] = EncodeVec3(state.velocity_linear);
    encoded["velocityRot"] = EncodeVec3(state.velocity_rotational);
    encoded["cshape"] = EncodeCollisionShape(state.collision_shape);
    return encoded;
}

bool TryDecodeCompositeId(const nlohmann::json& value, CompositeId& out_id, std::string& out_error) {
    if (!value.is_array() || value.empty()) {
        out_error = "id expects non-empty integer array";
        return false;
    }

    std::vector<CompositeId::Element> elements;
    elements.reserve(value.size());
    for (const nlohmann::json& element : value) {
        if (!element.is_number_integer()) {
            out_error = "id element is not an integer";
            return false;
        }
        elements.push_back(element.get<CompositeId::Element>());
    }

    out_id = CompositeId(std::move(elements));
    out_error.clear();
    return true;
}

bool TryDecodeCompositeIdList(
    const nlohmann::json& value,
    std::vector<CompositeId>& out_ids,
    std::string& out_error) {
    out_ids.clear();
    if (!value.is_array()) {
        out_error = "id list expects array";
        return false;
    }

    out_ids.reserve(value.size());
    for (const nlohmann::json& element : value) {
        CompositeId id;
        if (!TryDecodeCompositeId(element, id, out_error)) {
            out_ids.clear();
            return false;
        }
        out_ids.push_back(std::move(id));
    }

    out_error.clear();
    return true;
}

bool TryDecodeVec3(const nlohmann::json& value, Vec3& out_vec, std::string& out_error) {
    double components[3] = {};
    if (!TryDecodeNumberArray(value, 3, "vector", components, out_error)) {
        return false;
    }

    out_vec = Vec3(components[0], components[1], components[2]);
    return true;
}

bool TryDecodeQuat(const nlohmann::json& value, Quat& out_quat, std::string& out_error) {
    double components[4] = {};
    if (!TryDecodeNumberArray(value, 4, "quaternion", components, out_error)) {
        return false;
    }

    out_quat = MakeQuatXyzw(components[0], components[1], components[2], components[3]);
    return true;
}

bool TryDecodeCollisionShape(
    const nlohmann::json& value,
    CollisionShape& out_shape,
    std::string& out_error) {
    CollisionShape decoded{};
    if (!TryDecodeNumberArray(value, decoded.size(), "collision shape", decoded.data(), out_error)) {
        return false;
    }

    out_shape = decoded;
    return true;
}

bool TryDecodeFloatList(const nlohmann::json& value, std::vector<float>& out_values, std::string& out_error) {
    out_values.clear();
    if (!value.is_array()) {
        out_error = "float list expects array";
        return false;
    }

    out_values.reserve(value.size());
    for (const nlohmann::json& element : value) {
        if (!element.is_number()) {
            out_values.clear();
            out_error = "float list element is not a number";
            return false;
        }
        out_values.push_back(element.get<float>());
    }

    out_error.clear();
    return true;
}

bool TryDecodeStateVariable(const nlohmann::json& value, StateVariable& out_state, std::string& out_error) {
    if (!value.is_object()) {
        out_error = "state variable expects object";
        return false;
    }

    StateVariable decoded{};
    bool present = false;
    if (!TryDecodeScalar(value, "scale", decoded.scale, present, out_error)) {
        return false;
    }

    decoded.radius = decoded.scale;
    if (!TryDecodeScalar(value, "radius", decoded.radius, present, out_error) ||
        !TryDecodeScalar(value, "imass", decoded.inverse_mass, present, out_error) ||
        !TryDecodeScalar(value, "restitution", decoded.restitution, present, out_error)) {
        return false;
    }

    struct VectorField final {
        const char* key;
        Vec3* target;
    };
    const VectorField vector_fields[] = {
        {"position", &decoded.position},
        {"velocityLin", &decoded.velocity_linear},
        {"velocityRot", &decoded.velocity_rotational},
    };
    for (const VectorField& field : vector_fields) {
        const auto it = value.find(field.key);
        if (it == value.end() || it->is_null()) {
            continue;
        }
        if (!TryDecodeVec3(*it, *field.target, out_error)) {
            out_error = std::string(field.key) + ": " + out_error;
            return false;
        }
    }

    const auto orientation_it = value.find("orientation");
    if (orientation_it != value.end() && !orientation_it->is_null() &&
        !TryDecodeQuat(*orientation_it, decoded.orientation, out_error)) {
        out_error = "orientation: " + out_error;
        return false;
    }

    const auto shape_it = value.find("cshape");
    if (shape_it != value.end() && !shape_it->is_null() &&
        !TryDecodeCollisionShape(*shape_it, decoded.collision_shape, out_error)) {
        out_error = "cshape: " + out_error;
        return false;
    }

    out_state = decoded;
    out_error.clear();
    return true;
}

bool TryGetField(
    const nlohmann::json& object,
    std::string_view key,
    std::string_view context,
    const nlohmann::json*& out_field,
    std::string& out_error) {
    out_field = nullptr;
    if (!object.is_object()) {
        out_error = std::string(context) + ": payload missing";
        return false;
    }

    const auto it = object.find(std::string(key));
    if (it == object.end()) {
        out_error = std::string(context) + ": missing '" + std::string(key) + "'";
        return false;
    }

    out_field = &(*it);
    out_error.clear();
    return true;
}

}  // namespace replica::protocol::json_codec
