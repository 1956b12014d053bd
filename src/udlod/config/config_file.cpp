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
#include "config_file.h"

#include <spdlog/fmt/fmt.h>

#include <toml.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <vector>

namespace udlod
{

namespace
{

/**
 * @brief Read an optional key; throws toml::type_error if present with the wrong type
 */
template <typename T>
T read_or(toml::value const& table, std::string const& key, T const& fallback)
{
    if ( ! table.contains(key) )
    {
        return fallback;
    }
    return toml::find<T>(table, key);
}

template <typename UINT_T>
UINT_T read_unsigned_or(toml::value const& table, std::string const& key, UINT_T const fallback, std::string const& where)
{
    std::int64_t const value = read_or<std::int64_t>(table, key, std::int64_t(fallback));
    if (value < 0 || std::uint64_t(value) > std::numeric_limits<UINT_T>::max())
    {
        throw ConfigError(fmt::format("{}: {} = {} is out of range [0, {}]",
                                      where, key, value, std::numeric_limits<UINT_T>::max()));
    }
    return UINT_T(value);
}

/**
 * @brief Convert a TOML integer or float; throws toml::type_error for anything else
 */
float to_float(toml::value const& value)
{
    if (value.is_integer())
    {
        return float(value.as_integer());
    }
    return float(value.as_floating());
}

float read_float_or(toml::value const& table, std::string const& key, float const fallback)
{
    if ( ! table.contains(key) )
    {
        return fallback;
    }
    return to_float(toml::find(table, key));
}

Vector3 read_vector3_or(toml::value const& table, std::string const& key, Vector3 const& fallback, std::string const& where)
{
    if ( ! table.contains(key) )
    {
        return fallback;
    }

    auto const& xyz = toml::find(table, key).as_array();
    if (xyz.size() != 3)
    {
        throw ConfigError(fmt::format("{}: {} needs 3 components, got {}", where, key, xyz.size()));
    }
    return { to_float(xyz[0]), to_float(xyz[1]), to_float(xyz[2]) };
}

void read_view(toml::value const& table, ViewConfig &rOut, std::string const& where)
{
    rOut.scale              = read_float_or(table, "scale",               rOut.scale);
    rOut.heightUnderViewer  = read_float_or(table, "height_under_viewer", rOut.heightUnderViewer);
    rOut.viewDistance       = read_float_or(table, "view_distance",       rOut.viewDistance);
    rOut.maxDepth           = read_unsigned_or(table, "max_depth",        rOut.maxDepth,    where);
    rOut.worldExtent        = read_unsigned_or(table, "world_extent",     rOut.worldExtent, where);
    rOut.rootCount          = read_unsigned_or(table, "root_count",       rOut.rootCount,   where);
}

void read_tessellation(toml::value const& table, TessellationSettings &rOut, std::string const& where)
{
    rOut.workCapacity       = read_unsigned_or(table, "work_capacity",    rOut.workCapacity,   where);
    rOut.bucketCapacity     = read_unsigned_or(table, "bucket_capacity",  rOut.bucketCapacity, where);
    rOut.distanceBias       = read_float_or(table, "distance_bias",       rOut.distanceBias);
    rOut.frustumCulling     = read_or<bool>(table, "frustum_culling",     rOut.frustumCulling);
    rOut.cullMinHeight      = read_float_or(table, "cull_min_height",     rOut.cullMinHeight);
    rOut.cullMaxHeight      = read_float_or(table, "cull_max_height",     rOut.cullMaxHeight);

    if (table.contains("cull_planes"))
    {
        std::uint8_t mask = 0;
        for (std::string const& name : toml::find<std::vector<std::string>>(table, "cull_planes"))
        {
            std::uint8_t const bit = cull_plane_bit(name);
            if (bit == 0)
            {
                throw ConfigError(fmt::format("{}: unknown frustum plane \"{}\" in cull_planes", where, name));
            }
            mask |= bit;
        }
        rOut.cullPlaneMask = mask;
    }
}

void read_density(toml::value const& table, DensitySettings &rOut, std::string const& where)
{
    if (table.contains("policy"))
    {
        std::string const policy = toml::find<std::string>(table, "policy");
        if (policy == "fixed")
        {
            rOut.policy = EDensityPolicy::Fixed;
        }
        else if (policy == "noise")
        {
            rOut.policy = EDensityPolicy::Noise;
        }
        else
        {
            throw ConfigError(fmt::format("{}: unknown density policy \"{}\", expected \"fixed\" or \"noise\"",
                                          where, policy));
        }
    }

    rOut.fixedLevel         = read_unsigned_or(table, "level",            rOut.fixedLevel, where);
    rOut.seed               = read_unsigned_or(table, "seed",             rOut.seed,       where);
    rOut.frequency          = read_float_or(table, "frequency",           rOut.frequency);
    rOut.parentCorrection   = read_or<bool>(table, "parent_correction",   rOut.parentCorrection);
}

void read_camera(toml::value const& table, CameraSettings &rOut, std::string const& where)
{
    rOut.position           = read_vector3_or(table, "position",          rOut.position, where);
    rOut.lookAt             = read_vector3_or(table, "look_at",           rOut.lookAt,   where);
    rOut.up                 = read_vector3_or(table, "up",                rOut.up,       where);
    rOut.fovDeg             = read_float_or(table, "fov_deg",             rOut.fovDeg);
    rOut.aspect             = read_float_or(table, "aspect",              rOut.aspect);
    rOut.nearClip           = read_float_or(table, "near",                rOut.nearClip);
    rOut.farClip            = read_float_or(table, "far",                 rOut.farClip);
}

} // namespace

std::uint8_t cull_plane_bit(std::string_view const name) noexcept
{
    if (name == "left")     { return gc_planeLeft;   }
    if (name == "right")    { return gc_planeRight;  }
    if (name == "bottom")   { return gc_planeBottom; }
    if (name == "top")      { return gc_planeTop;    }
    if (name == "near")     { return gc_planeNear;   }
    if (name == "far")      { return gc_planeFar;    }
    return 0;
}

TerrainConfig parse_config(std::istream &rStream, std::string const& name)
{
    TerrainConfig out;

    try
    {
        toml::value const data = toml::parse(rStream, name);

        if (data.contains("view"))
        {
            read_view(toml::find(data, "view"), out.view, name);
        }
        if (data.contains("tessellation"))
        {
            read_tessellation(toml::find(data, "tessellation"), out.tessellation, name);
        }
        if (data.contains("density"))
        {
            read_density(toml::find(data, "density"), out.density, name);
        }
        if (data.contains("viewer"))
        {
            read_camera(toml::find(data, "viewer"), out.camera, name);
        }
    }
    catch (toml::exception const& e)
    {
        throw ConfigError(fmt::format("{}: {}", name, e.what()));
    }
    catch (std::out_of_range const& e)
    {
        throw ConfigError(fmt::format("{}: {}", name, e.what()));
    }

    return out;
}

TerrainConfig load_config_file(std::string const& path)
{
    std::ifstream file(path, std::ios::binary);
    if ( ! file.is_open() )
    {
        throw ConfigError(fmt::format("can't open config file {}", path));
    }
    return parse_config(file, path);
}

} // namespace udlod
