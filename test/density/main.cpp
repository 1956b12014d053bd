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
#include <udlod/tessellation/density.h>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <set>

using namespace udlod;

namespace
{

ViewState make_view()
{
    ViewConfig const config{ .scale = 1.0f, .viewDistance = 4.0f, .maxDepth = 6, .worldExtent = 512, .rootCount = 1 };
    return make_view_state(config, {}, TessellationSettings{});
}

} // namespace

TEST(Density, Fixed)
{
    ViewState const view = make_view();

    EXPECT_EQ( FixedDensity{}.density(view, { {0, 0}, 512 }), gc_maxDensity );
    EXPECT_EQ( FixedDensity{1}.density(view, { {7, 3}, 8 }), 1 );
}

TEST(Density, ValueNoiseRange)
{
    for (int i = -200; i < 200; ++i)
    {
        float const x = float(i) * 0.37f;
        float const y = float(i) * -0.61f + 3.0f;
        float const value = value_noise_2d(x, y, 99);
        EXPECT_GE( value, 0.0f );
        EXPECT_LE( value, 1.0f );
    }
}

TEST(Density, ValueNoiseIsSmoothAndSeeded)
{
    // Lattice points can be reproduced; seeds give different fields
    EXPECT_EQ( value_noise_2d(3.0f, 4.0f, 7), value_noise_2d(3.0f, 4.0f, 7) );

    int differs = 0;
    for (int i = 0; i < 32; ++i)
    {
        if (value_noise_2d(float(i), 0.5f, 1) != value_noise_2d(float(i), 0.5f, 2))
        {
            ++differs;
        }
    }
    EXPECT_GT( differs, 16 );

    // Small steps give small changes
    float const a = value_noise_2d(10.25f, 5.5f, 3);
    float const b = value_noise_2d(10.26f, 5.5f, 3);
    EXPECT_LT( std::abs(a - b), 0.05f );
}

TEST(Density, ValueNoiseFarFromOrigin)
{
    for (float const x : {3.9e9f, -3.9e9f, 1.0e20f, -1.0e30f})
    {
        float const value = value_noise_2d(x, 0.5f, 1337);
        EXPECT_GE( value, 0.0f );
        EXPECT_LE( value, 1.0f );
    }

    // Lattice repeats every 2^32
    EXPECT_EQ( value_noise_2d(4294967296.0f + 1024.0f, 3.0f, 7), value_noise_2d(1024.0f, 3.0f, 7) );
    EXPECT_EQ( value_noise_2d(4294967296.0f - 1024.0f, 3.0f, 7), value_noise_2d(-1024.0f, 3.0f, 7) );

    EXPECT_EQ( value_noise_2d(std::numeric_limits<float>::infinity(), 0.0f, 7), 0.0f );
    EXPECT_EQ( value_noise_2d(0.0f, std::numeric_limits<float>::quiet_NaN(), 7), 0.0f );
}

TEST(Density, NoiseOnHugeWorld)
{
    // Root cells of size 2^31; cell centres lie past the 32-bit signed range
    ViewConfig const config{ .viewDistance = 1.0f, .maxDepth = 4, .worldExtent = 4000000000u, .rootCount = 2 };
    ViewState const view = make_view_state(config, {}, TessellationSettings{});
    NoiseDensity const noise{99, 1.0f, true};

    for (Cell const& cell : { Cell{ {1, 1}, view.rootSize },
                              Cell{ {3, 2}, view.rootSize / 2 },
                              Cell{ {29, 30}, view.rootSize / 16 } })
    {
        EXPECT_LE( noise.density(view, cell), gc_maxDensity );
    }
}

TEST(Density, NoiseIsDeterministicAndInRange)
{
    ViewState const view = make_view();
    NoiseDensity const first{1337, 1.0f / 64.0f, true};
    NoiseDensity const second{1337, 1.0f / 64.0f, true};

    std::set<std::uint8_t> seen;
    for (std::uint32_t y = 0; y < 64; ++y)
    {
        for (std::uint32_t x = 0; x < 64; ++x)
        {
            Cell const cell{ {x, y}, 8 };
            std::uint8_t const level = first.density(view, cell);
            EXPECT_LE( level, gc_maxDensity );
            EXPECT_EQ( level, second.density(view, cell) );
            seen.insert(level);
        }
    }

    // Noise spread over a 512 unit world covers more than one level
    EXPECT_GT( seen.size(), 1u );
}

TEST(Density, ParentCorrection)
{
    ViewState const view = make_view();
    NoiseDensity const corrected{5, 1.0f / 16.0f, true};
    NoiseDensity const raw{5, 1.0f / 16.0f, false};

    int raised = 0;
    for (std::uint32_t size : {128u, 64u, 32u, 16u, 8u})
    {
        for (std::uint32_t y = 0; y < 512 / size; ++y)
        {
            for (std::uint32_t x = 0; x < 512 / size; ++x)
            {
                Cell const cell{ {x, y}, size };
                std::uint8_t const parent = corrected.natural_density(view, parent_of(cell));
                std::uint8_t const level  = corrected.density(view, cell);

                // Never coarser than the parent's edge resolution halved
                EXPECT_GE( int(level), int(parent) - 1 );
                EXPECT_GE( level, raw.density(view, cell) );
                EXPECT_EQ( raw.density(view, cell), corrected.natural_density(view, cell) );

                if (level != raw.density(view, cell))
                {
                    ++raised;
                }
            }
        }
    }
    EXPECT_GT( raised, 0 );
}

TEST(Density, RootsAreNotCorrected)
{
    ViewState const view = make_view();
    NoiseDensity const corrected{5, 1.0f / 16.0f, true};

    Cell const root{ {0, 0}, view.rootSize };
    EXPECT_EQ( corrected.density(view, root), corrected.natural_density(view, root) );
}

TEST(Density, Factory)
{
    ViewState const view = make_view();

    auto const pFixed = make_density_policy({ .policy = EDensityPolicy::Fixed, .fixedLevel = 2 });
    EXPECT_EQ( pFixed->density(view, { {0, 0}, 8 }), 2 );

    auto const pNoise = make_density_policy({ .policy = EDensityPolicy::Noise, .seed = 1337 });
    NoiseDensity const expected{1337, 1.0f / 64.0f, true};
    EXPECT_EQ( pNoise->density(view, { {3, 5}, 8 }), expected.density(view, { {3, 5}, 8 }) );

    EXPECT_THROW( make_density_policy({ .policy = EDensityPolicy::Fixed, .fixedLevel = 4 }), ConfigError );
    EXPECT_THROW( make_density_policy({ .policy = EDensityPolicy::Noise, .frequency = 0.0f }), ConfigError );
    EXPECT_THROW( make_density_policy({ .policy = EDensityPolicy::Noise, .frequency = -1.0f }), ConfigError );
}
