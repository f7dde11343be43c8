#pragma once

#include <glm/glm.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace replica::mesh {

// Three vertices of three floats each.
inline constexpr std::size_t kFloatsPerTriangle = 9;

struct MeshColor final {
    std::uint8_t r = 255;
    std::uint8_t g = 255;
    std::uint8_t b = 255;
    std::uint8_t a = 255;
};

struct MeshTriangle final {
    std::array<glm::vec3, 3> vertices{glm::vec3(0.0F), glm::vec3(0.0F), glm::vec3(0.0F)};
    MeshColor color{};
};

struct CompiledMesh final {
    std::vector<MeshTriangle> triangles;
};

// Scales the raw triangle soup and splits it into triangles. Face colours are
// derived from the triangle index, so equal input yields equal output.
bool CompileGeometry(
    const std::vector<float>& vertex_buffer,
    double scale,
    CompiledMesh& out_mesh,
    std::string& out_error);

// Axis aligned cube centred on the origin, 12 triangles.
std::vector<float> BuildCubeVertexBuffer(float half_extent);

}  // namespace replica::mesh
