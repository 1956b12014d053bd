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
/**
 * @file
 * @brief Per-view inputs of a patch list build, and their validation
 */
#pragma once

#include <udlod/core/math_types.h>

#include <array>
#include <cstdint>
#include <stdexcept>

namespace udlod
{

/**
 * @brief Thrown when a configuration is rejected before the first pass
 */
class ConfigError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Per-frame, per-view terrain parameters
 */
struct ViewConfig
{
    /// World units per grid unit
    float           scale               {1.0f};

    /// Terrain height below the viewer; the height cell corners are sampled at
    float           heightUnderViewer   {0.0f};

    /// Multiplier on each cell's half size, controls how far away cells subdivide
    float           viewDistance        {4.0f};

    /// Number of refine passes, cells shrink at most this many times from the root size
    std::uint8_t    maxDepth            {4};

    /// Side length of the terrain in grid units; need not be a power of two
    std::uint32_t   worldExtent         {256};

    /// Root cells per side. Seeding queues rootCount * rootCount cells
    std::uint32_t   rootCount           {1};
};

/**
 * @brief Perspective camera looking at the terrain
 */
struct CameraSettings
{
    Vector3 position    {0.0f, 10.0f, 0.0f};
    Vector3 lookAt      {1.0f, 0.0f, 1.0f};
    Vector3 up          {0.0f, 1.0f, 0.0f};
    float   fovDeg      {60.0f};
    float   aspect      {16.0f / 9.0f};
    float   nearClip    {0.1f};
    float   farClip     {10000.0f};
};

/**
 * @brief Viewer and frustum state used for distance tests and visibility rejection
 */
struct CullState
{
    /// Create a cull state with frustum planes extracted from a view-projection matrix
    static CullState from_matrices(Vector3 viewerPosition, Matrix4 const& viewProjection, Matrix4 const& model);

    /**
     * @brief Create a cull state from a perspective camera
     *
     * @throws ConfigError if the camera has a degenerate projection or view direction
     */
    static CullState from_camera(CameraSettings const& camera, Matrix4 const& model = Matrix4{IdentityInit});

    Vector3                 viewerPosition  {ZeroInit};
    Matrix4                 viewProjection  {IdentityInit};

    /// Terrain space to world space
    Matrix4                 model           {IdentityInit};

    /// Left, right, bottom, top, near, far. Positive signed distance is inside. Defaults to
    /// planes every point is inside of.
    std::array<Vector4, 6>  planes          {{ {0.0f, 0.0f, 0.0f, 1.0f}, {0.0f, 0.0f, 0.0f, 1.0f},
                                               {0.0f, 0.0f, 0.0f, 1.0f}, {0.0f, 0.0f, 0.0f, 1.0f},
                                               {0.0f, 0.0f, 0.0f, 1.0f}, {0.0f, 0.0f, 0.0f, 1.0f} }};
};

// Plane mask bits for CullState::planes
inline constexpr std::uint8_t gc_planeLeft      = 1u << 0u;
inline constexpr std::uint8_t gc_planeRight     = 1u << 1u;
inline constexpr std::uint8_t gc_planeBottom    = 1u << 2u;
inline constexpr std::uint8_t gc_planeTop       = 1u << 3u;
inline constexpr std::uint8_t gc_planeNear      = 1u << 4u;
inline constexpr std::uint8_t gc_planeFar       = 1u << 5u;
inline constexpr std::uint8_t gc_planesAll      = 0b111111u;

/**
 * @brief Settings that stay the same over many builds
 */
struct TessellationSettings
{
    /// Max cells one level of the working queue can hold
    std::uint32_t   workCapacity    {1u << 16u};

    /// Max patches per density bucket; also the address stride between buckets
    std::uint32_t   bucketCapacity  {1u << 16u};

    /// Scales corner distances in divide(). Below 1 biases toward subdividing.
    float           distanceBias    {0.99f};

    /// Drop cells outside the view frustum during refine and flush
    bool            frustumCulling  {false};

    /// Frustum planes tested by frustum culling. Far plane excluded for unbounded terrain.
    std::uint8_t    cullPlaneMask   {gc_planesAll ^ gc_planeFar};

    /// Fixed vertical extent of cell bounding boxes, in terrain space
    float           cullMinHeight   {0.0f};
    float           cullMaxHeight   {1.0f};
};

/**
 * @brief Validated, derived view parameters read by predicates and kernels
 */
struct ViewState
{
    ViewConfig      config;
    CullState       cull;

    float           distanceBias    {0.99f};
    std::uint8_t    cullPlaneMask   {};
    float           cullMinHeight   {};
    float           cullMaxHeight   {};

    /// Size of root cells, a power of two
    std::uint32_t   rootSize        {};

    /// Size of cells at max depth; these never subdivide
    std::uint32_t   minSize         {};
};

/**
 * @return Size of root cells: world extent split across root cells, rounded up to a power of two
 *
 * Only meaningful for configs accepted by validate()
 */
std::uint32_t root_cell_size(ViewConfig const& config) noexcept;

/**
 * @return Worst-case working queue length, rootCount^2 * 4^maxDepth, saturating at UINT64_MAX
 */
std::uint64_t required_work_capacity(ViewConfig const& config) noexcept;

/**
 * @brief Reject configurations that would underflow cell sizes, overflow addresses, or
 *        produce an empty tree
 *
 * @throws ConfigError
 */
void validate(ViewConfig const& config, TessellationSettings const& settings);

/**
 * @brief Validate and combine inputs into a ViewState
 *
 * @throws ConfigError
 */
ViewState make_view_state(ViewConfig const& config, CullState const& cull, TessellationSettings const& settings);

} // namespace udlod
