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
 * @brief Loading build settings from TOML files
 *
 * @code{.toml}
 * [view]
 * scale = 1.0
 * height_under_viewer = 0.0
 * view_distance = 4.0
 * max_depth = 6
 * world_extent = 1000
 * root_count = 2
 *
 * [tessellation]
 * work_capacity = 65536
 * bucket_capacity = 65536
 * distance_bias = 0.99
 * frustum_culling = true
 * cull_planes = ["left", "right", "bottom", "top", "near"]
 * cull_min_height = 0.0
 * cull_max_height = 50.0
 *
 * [density]
 * policy = "noise"            # "fixed" or "noise"
 * level = 3                   # used by "fixed"
 * seed = 1337
 * frequency = 0.015625
 * parent_correction = true
 *
 * [viewer]
 * position = [64.0, 20.0, 64.0]
 * look_at = [200.0, 0.0, 200.0]
 * up = [0.0, 1.0, 0.0]
 * fov_deg = 60.0
 * aspect = 1.777
 * near = 0.1
 * far = 10000.0
 * @endcode
 *
 * Every table and key is optional.
 */
#pragma once

#include <udlod/tessellation/density.h>
#include <udlod/tessellation/view_config.h>

#include <iosfwd>
#include <string>
#include <string_view>

namespace udlod
{

struct TerrainConfig
{
    ViewConfig              view;
    TessellationSettings    tessellation;
    DensitySettings         density;
    CameraSettings          camera;
};

/**
 * @throws ConfigError if the file can't be read, isn't valid TOML, or has a value of the
 *         wrong type or out of range
 */
TerrainConfig load_config_file(std::string const& path);

/**
 * @param rStream [in] TOML text
 * @param name    [in] Name used in error messages, usually a file path
 *
 * @throws ConfigError
 */
TerrainConfig parse_config(std::istream &rStream, std::string const& name);

/**
 * @return Plane mask bit of a frustum plane name ("left", "right", "bottom", "top", "near",
 *         "far"), or 0 if unknown
 */
std::uint8_t cull_plane_bit(std::string_view name) noexcept;

} // namespace udlod
