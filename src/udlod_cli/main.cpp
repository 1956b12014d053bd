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
#include <udlod/executor/dispatcher.h>
#include <udlod/tessellation/tessellator.h>
#include <udlod/util/logging.h>

#include <Corrade/Utility/Arguments.h>
#include <Magnum/Math/ConfigurationValue.h>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

// Worlds wider than this aren't drawn by --ascii
constexpr std::uint32_t gc_asciiMaxExtent = 128;

udlod::Logger_t g_mainThreadLogger;

void print_stats(udlod::BuildStats const& stats, udlod::PatchBuckets const& patches)
{
    std::printf("pass        invocations     queued    emitted\n");
    for (std::size_t i = 0; i < stats.passes.size(); ++i)
    {
        udlod::BuildStats::Pass const& pass = stats.passes[i];
        std::string const name = (i == 0) ? "seed"
                               : (i + 1 == stats.passes.size()) ? "flush"
                               : "refine " + std::to_string(i - 1);
        std::printf("%-10s %12u %10u %10u\n", name.c_str(), pass.invocations, pass.queued, pass.emitted);
    }

    std::printf("\nleaves: %u\n", stats.totalLeaves);
    for (std::size_t density = 0; density < stats.leavesPerBucket.size(); ++density)
    {
        std::printf("  density %zu: %u (bucket at %u)\n", density, stats.leavesPerBucket[density],
                    udlod::bucket_address(std::uint8_t(density), 0, patches.stride()));
    }
    for (std::size_t depth = 0; depth < stats.leavesPerDepth.size(); ++depth)
    {
        std::printf("  depth %zu: %u\n", depth, stats.leavesPerDepth[depth]);
    }
    std::printf("culled: %u\ntrimmed: %u\n", stats.culled, stats.trimmed);
}

/**
 * @brief Draw each grid unit as the depth of the leaf covering it, '.' where nothing does
 */
void print_ascii_map(udlod::Tessellator const& tess)
{
    std::uint32_t const extent = tess.view().config.worldExtent;
    if (extent > gc_asciiMaxExtent)
    {
        UDLOD_LOG_WARN("World extent {} too large to draw, max is {}", extent, gc_asciiMaxExtent);
        return;
    }

    std::vector<std::string> rows(extent, std::string(extent, '.'));
    std::uint32_t const rootSize = tess.view().rootSize;

    for (std::uint8_t density = 0; density < udlod::gc_densityLevels; ++density)
    {
        for (udlod::Patch const& patch : tess.patches().bucket(density))
        {
            int depth = 0;
            for (std::uint32_t size = patch.size; size < rootSize; size *= 2)
            {
                ++depth;
            }
            char const symbol = (depth < 10) ? char('0' + depth) : '+';

            std::uint32_t const x0 = patch.coords.x() * patch.size;
            std::uint32_t const y0 = patch.coords.y() * patch.size;
            for (std::uint32_t y = y0; y < std::min(y0 + patch.size, extent); ++y)
            {
                for (std::uint32_t x = x0; x < std::min(x0 + patch.size, extent); ++x)
                {
                    rows[y][x] = symbol;
                }
            }
        }
    }

    // +y upwards
    for (auto it = rows.rbegin(); it != rows.rend(); ++it)
    {
        std::printf("%s\n", it->c_str());
    }
}

void write_records(udlod::Tessellator const& tess, std::string const& path)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if ( ! file.is_open() )
    {
        throw std::runtime_error("can't open " + path + " for writing");
    }

    for (std::uint8_t density = 0; density < udlod::gc_densityLevels; ++density)
    {
        for (udlod::Patch const& patch : tess.patches().bucket(density))
        {
            udlod::GpuPatchRecord const record = udlod::to_gpu_record(patch);
            file.write(reinterpret_cast<char const*>(&record), sizeof(record));
        }
    }

    if ( ! file )
    {
        throw std::runtime_error("failed writing " + path);
    }
    UDLOD_LOG_INFO("Wrote {} patch records to {}", tess.patches().total_size(), path);
}

int run(Corrade::Utility::Arguments const& args)
{
    udlod::TerrainConfig config;

    std::string const configPath = args.value("config");
    if ( ! configPath.empty() )
    {
        config = udlod::load_config_file(configPath);
        UDLOD_LOG_INFO("Loaded {}", configPath);
    }

    if ( ! args.value("viewer").empty() )
    {
        config.camera.position = args.value<udlod::Vector3>("viewer");
    }

    std::uint64_t const required = udlod::required_work_capacity(config.view);
    if (config.tessellation.workCapacity < required)
    {
        UDLOD_LOG_WARN("work_capacity {} is below the worst case of {} cells, builds near the viewer may overflow",
                       config.tessellation.workCapacity, required);
    }

    std::unique_ptr<udlod::exec::IDispatcher> pDispatcher;
    if (args.isSet("serial"))
    {
        pDispatcher = std::make_unique<udlod::exec::SerialDispatcher>();
        UDLOD_LOG_INFO("Using serial dispatcher");
    }
    else
    {
        auto pTbb = std::make_unique<udlod::exec::TbbDispatcher>(args.value<int>("threads"),
                                                                 args.value<unsigned int>("grain"));
        UDLOD_LOG_INFO("Using TBB dispatcher, up to {} threads", pTbb->max_concurrency());
        pDispatcher = std::move(pTbb);
    }

    udlod::Tessellator tess{config.tessellation, udlod::make_density_policy(config.density)};

    udlod::CullState const cull = udlod::CullState::from_camera(config.camera);
    udlod::BuildStats const stats = udlod::build_patch_list(tess, *pDispatcher, config.view, cull);

    print_stats(stats, tess.patches());

    if (args.isSet("ascii"))
    {
        std::printf("\n");
        print_ascii_map(tess);
    }

    std::string const outPath = args.value("out");
    if ( ! outPath.empty() )
    {
        write_records(tess, outPath);
    }

    return 0;
}

} // namespace

//-----------------------------------------------------------------------------

int main(int argc, char** argv)
{
    // Command line argument parsing
    Corrade::Utility::Arguments args;
    args.addOption          ("config")          .setHelp("config",  "path to a TOML configuration file")
        .addOption          ("viewer")          .setHelp("viewer",  "viewer position overriding the config, as \"x y z\"")
        .addOption          ("threads", "0")    .setHelp("threads", "max TBB worker threads, 0 lets TBB decide")
        .addOption          ("grain", "64")     .setHelp("grain",   "minimum cells per TBB task")
        .addBooleanOption   ("serial")          .setHelp("serial",  "run passes on the main thread only")
        .addOption          ("out")             .setHelp("out",     "write the final patch list as raw 24-byte records")
        .addBooleanOption   ("ascii")           .setHelp("ascii",   "draw a map of leaf depths for small worlds")
        .addBooleanOption   ('v', "verbose")    .setHelp("verbose", "log build passes")
        .setGlobalHelp("Builds an adaptive quadtree patch list for one terrain view.")
        .parse(argc, argv);

    // Setup logging
    auto pSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    pSink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");
    g_mainThreadLogger = std::make_shared<spdlog::logger>("main-thread", std::move(pSink));
    g_mainThreadLogger->set_level(args.isSet("verbose") ? spdlog::level::debug : spdlog::level::info);

    // Set thread-local logger used by UDLOD_LOG_* macros
    udlod::set_thread_logger(g_mainThreadLogger);

    int status = 0;
    try
    {
        status = run(args);
    }
    catch (udlod::ConfigError const& e)
    {
        UDLOD_LOG_ERROR("Invalid configuration: {}", e.what());
        status = 1;
    }
    catch (udlod::CapacityError const& e)
    {
        UDLOD_LOG_ERROR("Build ran out of space: {}", e.what());
        status = 1;
    }
    catch (std::exception const& e)
    {
        UDLOD_LOG_ERROR("{}", e.what());
        status = 1;
    }

    spdlog::shutdown();

    return status;
}
