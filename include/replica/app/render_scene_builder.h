#pragma once

#include "cache/object_cache.h"
#include "platform/render_scene.h"
#include "session/viewpoint.h"

namespace replica::app {

struct ProjectionSettings final {
    double vertical_fov_degrees = 45.0;
    double near_plane = 0.1;
    double far_plane = 1000.0;
};

// Projects every meshed cache entry into pixel space for the given viewpoint.
class RenderSceneBuilder final {
public:
    explicit RenderSceneBuilder(ProjectionSettings settings = {});

    platform::RenderScene Build(
        const cache::ObjectCache& cache,
        const session::Viewpoint& viewpoint,
        int viewport_width,
        int viewport_height) const;

    const ProjectionSettings& Settings() const;

private:
    ProjectionSettings settings_;
};

}  // namespace replica::app
