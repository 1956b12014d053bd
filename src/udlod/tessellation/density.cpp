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
#include "density.h"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>

namespace udlod
{

namespace
{

std::uint32_t lattice_hash(std::uint32_t const x, std::uint32_t const y, std::uint32_t const seed) noexcept
{
    std::uint32_t h = seed ^ 0x9e3779b9u;
    h ^= x * 0x85ebca6bu;
    h  = (h << 13u) | (h >> 19u);
    h ^= y * 0xc2b2ae35u;

    // murmur3 finalizer
    h ^= h >> 16u;
    h *= 0x85ebca6bu;
    h ^= h >> 13u;
    h *= 0xc2b2ae35u;
    h ^= h >> 16u;
    return h;
}

float lattice_value(std::uint32_t const x, std::uint32_t const y, std::uint32_t const seed) noexcept
{
    constexpr std::uint32_t c_mask = 0xFFFFFFu;
    return float(lattice_hash(x, y, seed) & c_mask) / float(c_mask);
}

/**
 * @brief Lattice coordinate of an integral value, wrapped to 32 bits
 *
 * The lattice repeats every 2^32 cells, which keeps any finite input in range.
 */
std::uint32_t wrap_lattice(double const integral) noexcept
{
    constexpr double c_period = 4294967296.0;

    double wrapped = std::fmod(integral, c_period);
    if (wrapped < 0.0)
    {
        wrapped += c_period;
    }
    return std::uint32_t(std::uint64_t(wrapped));
}

constexpr float fade(float const t) noexcept
{
    // 6t^5 - 15t^4 + 10t^3
    return t * t * t * (t * (t * 6.0f - 15.0f) + 10.0f);
}

constexpr float lerp(float const a, float const b, float const t) noexcept
{
    return a + t * (b - a);
}

} // namespace

float value_noise_2d(float const x, float const y, std::uint32_t const seed) noexcept
{
    if ( ! (std::isfinite(x) && std::isfinite(y)) )
    {
        return 0.0f;
    }

    float const floorX = std::floor(x);
    float const floorY = std::floor(y);

    std::uint32_t const ix = wrap_lattice(floorX);
    std::uint32_t const iy = wrap_lattice(floorY);

    float const u = fade(x - floorX);
    float const v = fade(y - floorY);

    float const v00 = lattice_value(ix,      iy,      seed);
    float const v10 = lattice_value(ix + 1u, iy,      seed);
    float const v01 = lattice_value(ix,      iy + 1u, seed);
    float const v11 = lattice_value(ix + 1u, iy + 1u, seed);

    return lerp(lerp(v00, v10, u), lerp(v01, v11, u), v);
}

std::uint8_t NoiseDensity::natural_density(ViewState const& view, Cell const& cell) const noexcept
{
    float const size    = float(cell.size);
    float const centerX = (float(cell.coords.x()) + 0.5f) * size * view.config.scale;
    float const centerZ = (float(cell.coords.y()) + 0.5f) * size * view.config.scale;

    float const noise = value_noise_2d(centerX * m_frequency, centerZ * m_frequency, m_seed);

    return std::min<std::uint8_t>(std::uint8_t(noise * float(gc_densityLevels)), gc_maxDensity);
}

std::uint8_t NoiseDensity::density(ViewState const& view, Cell const& cell) const noexcept
{
    std::uint8_t const natural = natural_density(view, cell);

    if ( ! m_parentCorrection || cell.size >= view.rootSize )
    {
        return natural;
    }

    std::uint8_t const parent = natural_density(view, parent_of(cell));
    if (parent == 0)
    {
        return natural;
    }

    return std::max(natural, std::uint8_t(parent - 1));
}

std::unique_ptr<IDensityPolicy> make_density_policy(DensitySettings const& settings)
{
    switch (settings.policy)
    {
    case EDensityPolicy::Fixed:
        if (settings.fixedLevel > gc_maxDensity)
        {
            throw ConfigError(fmt::format("fixed density level {} exceeds the max of {}",
                                          settings.fixedLevel, gc_maxDensity));
        }
        return std::make_unique<FixedDensity>(settings.fixedLevel);
    case EDensityPolicy::Noise:
        if ( ! (std::isfinite(settings.frequency) && settings.frequency > 0.0f) )
        {
            throw ConfigError(fmt::format("noise frequency must be positive, got {}", settings.frequency));
        }
        return std::make_unique<NoiseDensity>(settings.seed, settings.frequency, settings.parentCorrection);
    }

    throw ConfigError("unknown density policy");
}

} // namespace udlod
