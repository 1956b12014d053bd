/**
 * Open Space Program
 * Copyright © 2019-2024 Open Space Program Project
 *
 * MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
#include "view_config.h"
#include "patch.h"

#include <udlod/core/math_2pow.h>

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <limits>

namespace udlod
{

CullState CullState::from_matrices(Vector3 const viewerPosition, Matrix4 const& viewProjection, Matrix4 const& model)
{
    CullState out;
    out.viewerPosition = viewerPosition;
    out.viewProjection = viewProjection;
    out.model          = model;

    Frustum const frustum = Frustum::fromMatrix(viewProjection);
    for (std::size_t i = 0; i < out.planes.size(); ++i)
    {
        out.planes[i] = frustum[i];
    }
    return out;
}

CullState CullState::from_camera(CameraSettings const& camera, Matrix4 const& model)
{
    if ( ! (camera.fovDeg > 0.0f && camera.fovDeg < 180.0f) )
    {
        throw ConfigError(fmt::format("fov_deg must be within (0, 180), got {}", camera.fovDeg));
    }
    if ( ! (camera.aspect > 0.0f && camera.nearClip > 0.0f && camera.farClip > camera.nearClip) )
    {
        throw ConfigError(fmt::format("invalid projection: aspect {}, near {}, far {}",
                                      camera.aspect, camera.nearClip, camera.farClip));
    }

    Vector3 const forward = camera.lookAt - camera.position;
    if (forward.isZero() || Magnum::Math::cross(forward, camera.up).isZero())
    {
        throw ConfigError("camera look_at must differ from position and not be parallel to up");
    }

    Matrix4 const projection = Matrix4::perspectiveProjection(Rad{Deg{camera.fovDeg}}, camera.aspect,
                                                              camera.nearClip, camera.farClip);
    Matrix4 const cameraTf   = Matrix4::lookAt(camera.position, camera.lookAt, camera.up);

    return from_matrices(camera.position, projection * cameraTf.invertedRigid(), model);
}

std::uint32_t root_cell_size(ViewConfig const& config) noexcept
{
    return math::ceil_2pow(math::div_ceil(config.worldExtent, config.rootCount));
}

std::uint64_t required_work_capacity(ViewConfig const& config) noexcept
{
    constexpr std::uint64_t c_max = std::numeric_limits<std::uint64_t>::max();

    std::uint64_t const roots = std::uint64_t(config.rootCount) * config.rootCount;
    int           const shift = 2 * int(config.maxDepth);

    if (shift >= 64 || roots > (c_max >> shift))
    {
        return c_max;
    }
    return roots << shift;
}

void validate(ViewConfig const& config, TessellationSettings const& settings)
{
    if (config.rootCount == 0)
    {
        throw ConfigError("root_count must be at least 1");
    }
    if (std::uint64_t(config.rootCount) * config.rootCount > std::numeric_limits<std::uint32_t>::max())
    {
        throw ConfigError(fmt::format("root_count {} squared overflows the seed invocation count", config.rootCount));
    }
    if (config.worldExtent == 0)
    {
        throw ConfigError("world_extent must be at least 1");
    }
    if ( ! (std::isfinite(config.scale) && config.scale > 0.0f) )
    {
        throw ConfigError(fmt::format("scale must be positive, got {}", config.scale));
    }
    if ( ! (std::isfinite(config.viewDistance) && config.viewDistance > 0.0f) )
    {
        throw ConfigError(fmt::format("view_distance must be positive, got {}", config.viewDistance));
    }
    if ( ! std::isfinite(config.heightUnderViewer) )
    {
        throw ConfigError("height_under_viewer must be finite");
    }
    if ( ! (settings.distanceBias > 0.0f && settings.distanceBias <= 1.0f) )
    {
        throw ConfigError(fmt::format("distance_bias must be within (0, 1], got {}", settings.distanceBias));
    }

    std::uint32_t const perRoot = math::div_ceil(config.worldExtent, config.rootCount);
    if (perRoot > math::int_2pow<std::uint32_t>(31))
    {
        throw ConfigError(fmt::format("world_extent {} split across {} root cells exceeds the largest cell size",
                                      config.worldExtent, config.rootCount));
    }

    std::uint32_t const rootSize = math::ceil_2pow(perRoot);
    if (int(config.maxDepth) > math::log2_of_pow2(rootSize))
    {
        throw ConfigError(fmt::format("max_depth {} would shrink root cells of size {} below one grid unit",
                                      config.maxDepth, rootSize));
    }
    if (std::uint64_t(config.rootCount - 1) * rootSize >= config.worldExtent)
    {
        throw ConfigError(fmt::format("{}x{} root cells of size {} reach past world_extent {}",
                                      config.rootCount, config.rootCount, rootSize, config.worldExtent));
    }

    if (settings.workCapacity == 0)
    {
        throw ConfigError("work_capacity must be at least 1");
    }
    if (settings.bucketCapacity == 0)
    {
        throw ConfigError("bucket_capacity must be at least 1");
    }
    if (std::uint64_t(settings.bucketCapacity) * gc_densityLevels > std::numeric_limits<std::uint32_t>::max())
    {
        throw ConfigError(fmt::format("bucket_capacity {} overflows 32-bit patch addresses across {} buckets",
                                      settings.bucketCapacity, gc_densityLevels));
    }

    if (settings.frustumCulling)
    {
        if (settings.cullPlaneMask == 0 || (settings.cullPlaneMask & ~gc_planesAll) != 0)
        {
            throw ConfigError(fmt::format("cull plane mask {:#b} must select planes 0 to 5", settings.cullPlaneMask));
        }
        if ( ! (settings.cullMinHeight <= settings.cullMaxHeight) )
        {
            throw ConfigError("cull_min_height must not exceed cull_max_height");
        }
    }
}

ViewState make_view_state(ViewConfig const& config, CullState const& cull, TessellationSettings const& settings)
{
    validate(config, settings);

    std::uint32_t const rootSize = root_cell_size(config);

    return {
        .config         = config,
        .cull           = cull,
        .distanceBias   = settings.distanceBias,
        .cullPlaneMask  = settings.cullPlaneMask,
        .cullMinHeight  = settings.cullMinHeight,
        .cullMaxHeight  = settings.cullMaxHeight,
        .rootSize       = rootSize,
        .minSize        = rootSize >> config.maxDepth
    };
}

} // namespace udlod
