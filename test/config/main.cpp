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
#include <udlod/config/config_file.h>

#include <gtest/gtest.h>

#include <sstream>

using namespace udlod;

namespace
{

TerrainConfig parse(std::string const& text)
{
    std::istringstream stream{text};
    return parse_config(stream, "test.toml");
}

} // namespace

TEST(ConfigFile, EmptyUsesDefaults)
{
    TerrainConfig const config = parse("");

    ViewConfig const view;
    EXPECT_EQ( config.view.maxDepth, view.maxDepth );
    EXPECT_EQ( config.view.worldExtent, view.worldExtent );
    EXPECT_EQ( config.view.rootCount, view.rootCount );
    EXPECT_FLOAT_EQ( config.view.viewDistance, view.viewDistance );

    EXPECT_FLOAT_EQ( config.tessellation.distanceBias, 0.99f );
    EXPECT_FALSE( config.tessellation.frustumCulling );
    EXPECT_EQ( config.tessellation.cullPlaneMask, gc_planesAll ^ gc_planeFar );

    EXPECT_EQ( config.density.policy, EDensityPolicy::Fixed );
    EXPECT_EQ( config.density.fixedLevel, gc_maxDensity );
}

TEST(ConfigFile, AllTables)
{
    TerrainConfig const config = parse(R"(
[view]
scale = 0.5
height_under_viewer = 12.5
view_distance = 6
max_depth = 5
world_extent = 1000
root_count = 2

[tessellation]
work_capacity = 4096
bucket_capacity = 2048
distance_bias = 0.95
frustum_culling = true
cull_planes = ["left", "right", "near", "far"]
cull_min_height = -10.0
cull_max_height = 80.0

[density]
policy = "noise"
level = 2
seed = 42
frequency = 0.125
parent_correction = false

[viewer]
position = [1.0, 2.0, 3.0]
look_at = [4, 5, 6]
up = [0.0, 0.0, 1.0]
fov_deg = 75.0
aspect = 1.5
near = 0.5
far = 2000.0
)");

    EXPECT_FLOAT_EQ( config.view.scale, 0.5f );
    EXPECT_FLOAT_EQ( config.view.heightUnderViewer, 12.5f );
    EXPECT_FLOAT_EQ( config.view.viewDistance, 6.0f );
    EXPECT_EQ( config.view.maxDepth, 5 );
    EXPECT_EQ( config.view.worldExtent, 1000u );
    EXPECT_EQ( config.view.rootCount, 2u );

    EXPECT_EQ( config.tessellation.workCapacity, 4096u );
    EXPECT_EQ( config.tessellation.bucketCapacity, 2048u );
    EXPECT_FLOAT_EQ( config.tessellation.distanceBias, 0.95f );
    EXPECT_TRUE( config.tessellation.frustumCulling );
    EXPECT_EQ( config.tessellation.cullPlaneMask, gc_planeLeft | gc_planeRight | gc_planeNear | gc_planeFar );
    EXPECT_FLOAT_EQ( config.tessellation.cullMinHeight, -10.0f );
    EXPECT_FLOAT_EQ( config.tessellation.cullMaxHeight, 80.0f );

    EXPECT_EQ( config.density.policy, EDensityPolicy::Noise );
    EXPECT_EQ( config.density.fixedLevel, 2 );
    EXPECT_EQ( config.density.seed, 42u );
    EXPECT_FLOAT_EQ( config.density.frequency, 0.125f );
    EXPECT_FALSE( config.density.parentCorrection );

    EXPECT_EQ( config.camera.position, Vector3(1.0f, 2.0f, 3.0f) );
    EXPECT_EQ( config.camera.lookAt, Vector3(4.0f, 5.0f, 6.0f) );
    EXPECT_EQ( config.camera.up, Vector3(0.0f, 0.0f, 1.0f) );
    EXPECT_FLOAT_EQ( config.camera.fovDeg, 75.0f );
    EXPECT_FLOAT_EQ( config.camera.aspect, 1.5f );
    EXPECT_FLOAT_EQ( config.camera.nearClip, 0.5f );
    EXPECT_FLOAT_EQ( config.camera.farClip, 2000.0f );

    // Loaded settings are accepted as a whole
    EXPECT_NO_THROW( make_view_state(config.view, CullState::from_camera(config.camera), config.tessellation) );
    EXPECT_NO_THROW( make_density_policy(config.density) );
}

TEST(ConfigFile, PartialTablesKeepOtherDefaults)
{
    TerrainConfig const config = parse("[view]\nmax_depth = 3\n");

    EXPECT_EQ( config.view.maxDepth, 3 );
    EXPECT_EQ( config.view.worldExtent, ViewConfig{}.worldExtent );
    EXPECT_EQ( config.tessellation.workCapacity, TessellationSettings{}.workCapacity );
}

TEST(ConfigFile, Errors)
{
    // Not TOML
    EXPECT_THROW( parse("[view\nmax_depth = "), ConfigError );

    // Wrong types
    EXPECT_THROW( parse("[view]\nmax_depth = \"deep\"\n"), ConfigError );
    EXPECT_THROW( parse("[tessellation]\nfrustum_culling = 1\n"), ConfigError );
    EXPECT_THROW( parse("[viewer]\nposition = [1.0, 2.0]\n"), ConfigError );

    // Out of range
    EXPECT_THROW( parse("[view]\nmax_depth = 300\n"), ConfigError );
    EXPECT_THROW( parse("[view]\nworld_extent = -4\n"), ConfigError );
    EXPECT_THROW( parse("[view]\nroot_count = 5000000000\n"), ConfigError );

    // Unknown names
    EXPECT_THROW( parse("[density]\npolicy = \"perlin\"\n"), ConfigError );
    EXPECT_THROW( parse("[tessellation]\ncull_planes = [\"left\", \"behind\"]\n"), ConfigError );
}

TEST(ConfigFile, ErrorsNameTheFile)
{
    try
    {
        parse("[density]\npolicy = \"perlin\"\n");
        FAIL() << "ConfigError not thrown";
    }
    catch (ConfigError const& e)
    {
        EXPECT_NE( std::string(e.what()).find("test.toml"), std::string::npos );
    }
}

TEST(ConfigFile, MissingFile)
{
    EXPECT_THROW( load_config_file("/nonexistent/terrain.toml"), ConfigError );
}

TEST(ConfigFile, PlaneNames)
{
    EXPECT_EQ( cull_plane_bit("left"),   gc_planeLeft );
    EXPECT_EQ( cull_plane_bit("right"),  gc_planeRight );
    EXPECT_EQ( cull_plane_bit("bottom"), gc_planeBottom );
    EXPECT_EQ( cull_plane_bit("top"),    gc_planeTop );
    EXPECT_EQ( cull_plane_bit("near"),   gc_planeNear );
    EXPECT_EQ( cull_plane_bit("far"),    gc_planeFar );
    EXPECT_EQ( cull_plane_bit("Left"),   0 );
}

TEST(Validate, RootCellSize)
{
    EXPECT_EQ( root_cell_size({ .worldExtent = 4,   .rootCount = 1 }), 4u );
    EXPECT_EQ( root_cell_size({ .worldExtent = 100, .rootCount = 1 }), 128u );
    EXPECT_EQ( root_cell_size({ .worldExtent = 100, .rootCount = 2 }), 64u );
    EXPECT_EQ( root_cell_size({ .worldExtent = 700, .rootCount = 3 }), 256u );
}

TEST(Validate, RejectsBadViews)
{
    TessellationSettings const settings;
    ViewConfig const good{ .maxDepth = 4, .worldExtent = 256, .rootCount = 1 };
    EXPECT_NO_THROW( validate(good, settings) );

    auto const rejects = [&settings] (ViewConfig const& config)
    {
        EXPECT_THROW( validate(config, settings), ConfigError );
    };

    ViewConfig bad = good;
    bad.rootCount = 0;          rejects(bad);

    bad = good;
    bad.worldExtent = 0;        rejects(bad);

    bad = good;
    bad.scale = 0.0f;           rejects(bad);

    bad = good;
    bad.viewDistance = -1.0f;   rejects(bad);

    // 256 can only be halved 8 times
    bad = good;
    bad.maxDepth = 9;           rejects(bad);
    bad.maxDepth = 8;           EXPECT_NO_THROW( validate(bad, settings) );

    // Third row of roots would start at 4, past the extent
    bad = { .maxDepth = 0, .worldExtent = 4, .rootCount = 3 };
    rejects(bad);

    bad = { .maxDepth = 0, .worldExtent = 100000, .rootCount = 70000 };
    rejects(bad);
}

TEST(Validate, RejectsBadSettings)
{
    ViewConfig const view{ .maxDepth = 4, .worldExtent = 256, .rootCount = 1 };

    auto const rejects = [&view] (TessellationSettings const& settings)
    {
        EXPECT_THROW( validate(view, settings), ConfigError );
    };

    TessellationSettings bad;
    bad.distanceBias = 0.0f;                rejects(bad);
    bad.distanceBias = 1.5f;                rejects(bad);
    bad.distanceBias = 1.0f;                EXPECT_NO_THROW( validate(view, bad) );

    bad = {};
    bad.workCapacity = 0;                   rejects(bad);

    bad = {};
    bad.bucketCapacity = 0;                 rejects(bad);

    // 4 buckets of this stride don't fit 32-bit addresses
    bad = {};
    bad.bucketCapacity = 1u << 30u;         rejects(bad);
    bad.bucketCapacity = (1u << 30u) - 1u;  EXPECT_NO_THROW( validate(view, bad) );

    bad = {};
    bad.frustumCulling = true;
    bad.cullPlaneMask = 0;                  rejects(bad);
    bad.cullPlaneMask = 0x40;               rejects(bad);

    bad = {};
    bad.frustumCulling = true;
    bad.cullMinHeight = 5.0f;
    bad.cullMaxHeight = 1.0f;               rejects(bad);
}

TEST(Validate, CameraErrors)
{
    EXPECT_NO_THROW( CullState::from_camera({}) );
    EXPECT_THROW( CullState::from_camera({ .fovDeg = 0.0f }), ConfigError );
    EXPECT_THROW( CullState::from_camera({ .nearClip = 10.0f, .farClip = 1.0f }), ConfigError );

    // Looking straight along up
    EXPECT_THROW( CullState::from_camera({ .position = {0.0f, 0.0f, 0.0f}, .lookAt = {0.0f, 5.0f, 0.0f} }), ConfigError );
    EXPECT_THROW( CullState::from_camera({ .position = {1.0f, 1.0f, 1.0f}, .lookAt = {1.0f, 1.0f, 1.0f} }), ConfigError );
}
