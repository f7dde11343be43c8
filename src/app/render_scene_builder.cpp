#include "app/render_scene_builder.h"

#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>

namespace replica::app {
namespace {

constexpr double kMinShade = 0.35;

std::uint8_t ScaleChannel(std::uint8_t channel, double factor) {
    const double scaled = static_cast<double>(channel) * std::clamp(factor, 0.0, 1.0);
    return static_cast<std::uint8_t>(std::lround(scaled));
}

platform::RgbaColor ApplyShade(const mesh::MeshColor& base_color, double facing) {
    const double factor = kMinShade + (1.0 - kMinShade) * std::abs(facing);
    return platform::RgbaColor{
        .r = ScaleChannel(base_color.r, factor),
        .g = ScaleChannel(base_color.g, factor),
        .b = ScaleChannel(base_color.b, factor),
        .a = base_color.a,
    };
}

// A zero quaternion on the wire means "no rotation" for drawing purposes.
protocol::Quat DrawableOrientation(const protocol::Quat& orientation) {
    const double length = glm::length(orientation);
    if (!(length > 0.0)) {
        return protocol::MakeQuatXyzw(0.0, 0.0, 0.0, 1.0);
    }
    return orientation / length;
}

glm::dmat4 BuildViewMatrix(const session::Viewpoint& viewpoint) {
    const glm::dmat4 camera_to_world =
        glm::translate(glm::dmat4(1.0), viewpoint.position) *
        glm::mat4_cast(DrawableOrientation(viewpoint.orientation));
    return glm::inverse(camera_to_world);
}

}  // namespace

RenderSceneBuilder::RenderSceneBuilder(ProjectionSettings settings)
    : settings_(settings) {}

const ProjectionSettings& RenderSceneBuilder::Settings() const {
    return settings_;
}

platform::RenderScene RenderSceneBuilder::Build(
    const cache::ObjectCache& cache,
    const session::Viewpoint& viewpoint,
    int viewport_width,
    int viewport_height) const {
    platform::RenderScene scene{};
    scene.viewport_width = viewport_width;
    scene.viewport_height = viewport_height;
    if (viewport_width <= 0 || viewport_height <= 0) {
        return scene;
    }

    const double aspect = static_cast<double>(viewport_width) / static_cast<double>(viewport_height);
    const glm::dmat4 projection = glm::perspective(
        glm::radians(settings_.vertical_fov_degrees),
        aspect,
        settings_.near_plane,
        settings_.far_plane);
    const glm::dmat4 view = BuildViewMatrix(viewpoint);
    const double half_width = static_cast<double>(viewport_width) * 0.5;
    const double half_height = static_cast<double>(viewport_height) * 0.5;

    for (const auto& [obj_id, entry] : cache.Entries()) {
        if (!entry.mesh.has_value()) {
            continue;
        }

        ++scene.entity_count;
        const glm::dmat4 model_view =
            view *
            glm::translate(glm::dmat4(1.0), entry.state.position) *
            glm::mat4_cast(DrawableOrientation(entry.state.orientation));

        for (const mesh::MeshTriangle& triangle : entry.mesh->triangles) {
            std::array<glm::dvec3, 3> view_vertices{glm::dvec3(0.0), glm::dvec3(0.0), glm::dvec3(0.0)};
            bool behind_near_plane = false;
            for (std::size_t index = 0; index < view_vertices.size(); ++index) {
                const glm::dvec4 transformed =
                    model_view * glm::dvec4(glm::dvec3(triangle.vertices[index]), 1.0);
                view_vertices[index] = glm::dvec3(transformed);
                if (-view_vertices[index].z < settings_.near_plane) {
                    behind_near_plane = true;
                }
            }

            if (behind_near_plane) {
                ++scene.culled_triangle_count;
                continue;
            }

            platform::RenderTriangle projected{};
            double depth_sum = 0.0;
            for (std::size_t index = 0; index < view_vertices.size(); ++index) {
                const glm::dvec4 clip = projection * glm::dvec4(view_vertices[index], 1.0);
                const double ndc_x = clip.x / clip.w;
                const double ndc_y = clip.y / clip.w;
                projected.points[index] = platform::ScreenPoint{
                    .x = static_cast<float>((ndc_x + 1.0) * half_width),
                    .y = static_cast<float>((1.0 - ndc_y) * half_height),
                };
                depth_sum += -view_vertices[index].z;
            }
            projected.depth = static_cast<float>(depth_sum / 3.0);

            const glm::dvec3 normal = glm::cross(
                view_vertices[1] - view_vertices[0],
                view_vertices[2] - view_vertices[0]);
            const double normal_length = glm::length(normal);
            const double facing = normal_length > 0.0 ? normal.z / normal_length : 0.0;
            projected.color = ApplyShade(triangle.color, facing);
            scene.triangles.push_back(projected);
        }
    }

    std::stable_sort(
        scene.triangles.begin(),
        scene.triangles.end(),
        [](const platform::RenderTriangle& lhs, const platform::RenderTriangle& rhs) {
            return lhs.depth > rhs.depth;
        });
    return scene;
}

}  // namespace replica::app
