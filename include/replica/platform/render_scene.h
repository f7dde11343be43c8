#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace replica::platform {

struct RgbaColor final {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;
};

struct ScreenPoint final {
    float x = 0.0F;
    float y = 0.0F;
};

struct RenderTriangle final {
    std::array<ScreenPoint, 3> points{};
    RgbaColor color{};
    // Mean view space distance, larger is farther.
    float depth = 0.0F;
};

// Triangles are already in pixel space and ordered back to front.
struct RenderScene final {
    int viewport_width = 0;
    int viewport_height = 0;
    std::vector<RenderTriangle> triangles;
    std::size_t entity_count = 0;
    std::size_t culled_triangle_count = 0;
};

}  // namespace replica::platform
