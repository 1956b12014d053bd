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
 * @brief Policies deciding how densely each leaf patch is meshed
 */
#pragma once

#include "patch.h"
#include "view_config.h"

#include <cstdint>
#include <memory>

namespace udlod
{

/**
 * @brief Chooses the density level (0 to gc_maxDensity) of a cell
 *
 * Independent from quadtree depth: depth decides which cells exist, density decides how many
 * vertices a patch's mesh gets. One policy is used for a whole build.
 *
 * Implementations must be pure and thread-safe, they're called from parallel kernels.
 */
class IDensityPolicy
{
public:

    virtual ~IDensityPolicy() = default;

    virtual std::uint8_t density(ViewState const& view, Cell const& cell) const noexcept = 0;
};

/**
 * @brief Every cell gets the same density, gc_maxDensity unless specified
 */
class FixedDensity final : public IDensityPolicy
{
public:

    constexpr explicit FixedDensity(std::uint8_t level = gc_maxDensity) noexcept
     : m_level{level}
    { }

    std::uint8_t density(ViewState const& /*view*/, Cell const& /*cell*/) const noexcept override
    {
        return m_level;
    }

private:
    std::uint8_t m_level;
};

/**
 * @brief Density from 2D smooth noise sampled at the cell's center
 *
 * With parent correction, a cell's density is raised to at least its parent's density minus
 * one, so a child is never coarser than its parent's edge resolution halved. This keeps
 * morphing between a parent and its children seamless.
 */
class NoiseDensity final : public IDensityPolicy
{
public:

    /**
     * @param seed             [in] Noise seed
     * @param frequency        [in] Noise lattice points per world unit
     * @param parentCorrection [in] Enable raising densities to match parents
     */
    NoiseDensity(std::uint32_t seed, float frequency, bool parentCorrection) noexcept
     : m_seed{seed}
     , m_frequency{frequency}
     , m_parentCorrection{parentCorrection}
    { }

    std::uint8_t density(ViewState const& view, Cell const& cell) const noexcept override;

    /**
     * @return Density from noise only, without parent correction
     */
    std::uint8_t natural_density(ViewState const& view, Cell const& cell) const noexcept;

private:
    std::uint32_t   m_seed;
    float           m_frequency;
    bool            m_parentCorrection;
};

/**
 * @brief Smooth value noise over a hashed integer lattice
 *
 * The lattice wraps every 2^32 units along each axis. Non-finite coordinates give 0.
 *
 * @return Value within [0, 1]
 */
float value_noise_2d(float x, float y, std::uint32_t seed) noexcept;

enum class EDensityPolicy : std::uint8_t
{
    Fixed,
    Noise
};

struct DensitySettings
{
    EDensityPolicy  policy              {EDensityPolicy::Fixed};

    /// Level used by EDensityPolicy::Fixed
    std::uint8_t    fixedLevel          {gc_maxDensity};

    std::uint32_t   seed                {1337};
    float           frequency           {1.0f / 64.0f};
    bool            parentCorrection    {true};
};

std::unique_ptr<IDensityPolicy> make_density_policy(DensitySettings const& settings);

} // namespace udlod
