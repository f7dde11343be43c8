#include "mesh/geometry_compiler.h"

namespace replica::mesh {
namespace {

MeshColor FaceColor(std::size_t triangle_index) {
    // Knuth multiplicative hash spreads neighbouring faces across the palette.
    const std::uint32_t hashed =
        static_cast<std::uint32_t>(triangle_index + 1) * 2654435761U;
    return MeshColor{
        .r = static_cast<std::uint8_t>(64 + ((hashed >> 24) & 0xBFU)),
        .g = static_cast<std::uint8_t>(64 + ((hashed >> 16) & 0xBFU)),
        .b = static_cast<std::uint8_t>(64 + ((hashed >> 8) & 0xBFU)),
        .a = 255,
    };
}

}  // namespace

bool CompileGeometry(
    const std::vector<float>& vertex_buffer,
    double scale,
    CompiledMesh& out_mesh,
    std::string& out_error) {
    out_mesh.triangles.clear();

    if (vertex_buffer.size() % kFloatsPerTriangle != 0) {
        out_error = "vertex buffer length " + std::to_string(vertex_buffer.size()) +
            " is not a multiple of " + std::to_string(kFloatsPerTriangle);
        return false;
    }

    const float scale_factor = static_cast<float>(scale);
    const std::size_t triangle_count = vertex_buffer.size() / kFloatsPerTriangle;
    out_mesh.triangles.reserve(triangle_count);
    for (std::size_t triangle_index = 0; triangle_index < triangle_count; ++triangle_index) {
        const float* base = vertex_buffer.data() + triangle_index * kFloatsPerTriangle;

        MeshTriangle triangle{};
        for (std::size_t corner = 0; corner < triangle.vertices.size(); ++corner) {
            triangle.vertices[corner] = glm::vec3(
                base[corner * 3 + 0] * scale_factor,
                base[corner * 3 + 1] * scale_factor,
                base[corner * 3 + 2] * scale_factor);
        }
        triangle.color = FaceColor(triangle_index);
        out_mesh.triangles.push_back(triangle);
    }

    out_error.clear();
    return true;
}

std::vector<float> BuildCubeVertexBuffer(float half_extent) {
    std::vector<float> vertices = {
        -1.0F, -1.0F, -1.0F,   -1.0F, -1.0F, +1.0F,   -1.0F, +1.0F, +1.0F,
        +1.0F, +1.0F, -1.0F,   -1.0F, -1.0F, -1.0F,   -1.0F, +1.0F, -1.0F,
        +1.0F, -1.0F, +1.0F,   -1.0F, -1.0F, -1.0F,   +1.0F, -1.0F, -1.0F,
        +1.0F, +1.0F, -1.0F,   +1.0F, -1.0F, -1.0F,   -1.0F, -1.0F, -1.0F,
        -1.0F, -1.0F, -1.0F,   -1.0F, +1.0F, +1.0F,   -1.0F, +1.0F, -1.0F,
        +1.0F, -1.0F, +1.0F,   -1.0F, -1.0F, +1.0F,   -1.0F, -1.0F, -1.0F,
        -1.0F, +1.0F, +1.0F,   -1.0F, -1.0F, +1.0F,   +1.0F, -1.0F, +1.0F,
        +1.0F, +1.0F, +1.0F,   +1.0F, -1.0F, -1.0F,   +1.0F, +1.0F, -1.0F,
        +1.0F, -1.0F, -1.0F,   +1.0F, +1.0F, +1.0F,   +1.0F, -1.0F, +1.0F,
        +1.0F, +1.0F, +1.0F,   +1.0F, +1.0F, -1.0F,   -1.0F, +1.0F, -1.0F,
        +1.0F, +1.0F, +1.0F,   -1.0F, +1.0F, -1.0F,   -1.0F, +1.0F, +1.0F,
        +1.0F, +1.0F, +1.0F,   -1.0F, +1.0F, +1.0F,   +1.0F, -1.0F, +1.0F,
    };

    for (float& coordinate : vertices) {
        coordinate *= half_extent;
    }
    return vertices;
}

}  // namespace replica::mesh
