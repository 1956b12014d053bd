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
 * @brief Quadtree cells, finished patches, and their packed blend codes
 */
#pragma once

#include <udlod/core/math_types.h>

#include <array>
#include <cstdint>

namespace udlod
{

/// Number of density levels, also the number of final-list buckets
inline constexpr std::uint8_t   gc_densityLevels    = 4;

/// Densest level a patch can be meshed at
inline constexpr std::uint8_t   gc_maxDensity       = gc_densityLevels - 1;

inline constexpr int            gc_blendFieldBits   = 6;
inline constexpr std::uint32_t  gc_blendFieldMask   = (1u << gc_blendFieldBits) - 1u;

/// Field index of the patch's own value within a packed blend code. Fields 0 to 3 are edges.
inline constexpr int            gc_blendSelfField   = 4;

/**
 * @brief Cardinal edges of a cell, in the same order as packed blend code fields
 */
enum class EEdge : std::uint8_t
{
    NegX = 0,
    NegY = 1,
    PosX = 2,
    PosY = 3
};

inline constexpr std::array<EEdge, 4> gc_edges{{EEdge::NegX, EEdge::NegY, EEdge::PosX, EEdge::PosY}};

/**
 * @return Step from a cell to its neighbor across edge
 */
constexpr Vector2i edge_direction(EEdge const edge) noexcept
{
    switch (edge)
    {
    case EEdge::NegX: return {-1,  0};
    case EEdge::NegY: return { 0, -1};
    case EEdge::PosX: return { 1,  0};
    case EEdge::PosY: return { 0,  1};
    }
    return {0, 0};
}

/**
 * @return Number of segments along one edge of a patch meshed at a density level
 *
 * 2, 4, 8, or 16. A parent's edge covers two children, so seen at child scale a parent's
 * resolution is halved.
 */
constexpr std::uint8_t edge_segments(std::uint8_t const density) noexcept
{
    return std::uint8_t(2u << density);
}

/**
 * @brief A quadtree cell; a square region of the terrain grid
 */
struct Cell
{
    /// Address within the grid at this cell's size level. Grid position is coords * size
    Vector2ui       coords;

    /// Side length in grid units, always a power of two
    std::uint32_t   size{};

    bool operator==(Cell const&) const = default;
};

inline Cell parent_of(Cell const& cell) noexcept
{
    return { cell.coords / 2u, cell.size * 2u };
}

/**
 * @param cell    [in] Cell to subdivide, size must be 2 or more
 * @param sibling [in] 0 to 3; bit 0 selects +x half, bit 1 selects +y half
 */
inline Cell child_of(Cell const& cell, std::uint32_t const sibling) noexcept
{
    return { cell.coords * 2u + Vector2ui{sibling & 1u, (sibling >> 1u) & 1u}, cell.size / 2u };
}

/**
 * @brief Edge resolutions of a patch toward its 4 neighbors, plus its own
 *
 * Plain form of the packed 30-bit code: edges[i] occupies bits [6i, 6i+6), self occupies
 * bits [24, 30). See pack_blend_code.
 */
struct BlendCode
{
    std::array<std::uint8_t, 4> edges{};
    std::uint8_t                self{};

    constexpr bool operator==(BlendCode const&) const = default;
};

/**
 * @return Value of field (0 to 4) within a packed blend code
 */
constexpr std::uint8_t blend_field(std::uint32_t const packed, int const field) noexcept
{
    return std::uint8_t((packed >> (field * gc_blendFieldBits)) & gc_blendFieldMask);
}

/**
 * @return packed with field (0 to 4) replaced by the low 6 bits of value
 */
constexpr std::uint32_t with_blend_field(std::uint32_t const packed, int const field, std::uint32_t const value) noexcept
{
    int const shift = field * gc_blendFieldBits;
    return (packed & ~(gc_blendFieldMask << shift)) | ((value & gc_blendFieldMask) << shift);
}

constexpr std::uint32_t pack_blend_code(BlendCode const& code) noexcept
{
    std::uint32_t packed = 0;
    for (int i = 0; i < 4; ++i)
    {
        packed = with_blend_field(packed, i, code.edges[std::size_t(i)]);
    }
    return with_blend_field(packed, gc_blendSelfField, code.self);
}

constexpr BlendCode unpack_blend_code(std::uint32_t const packed) noexcept
{
    return {
        .edges = {{ blend_field(packed, 0), blend_field(packed, 1),
                    blend_field(packed, 2), blend_field(packed, 3) }},
        .self  = blend_field(packed, gc_blendSelfField)
    };
}

/**
 * @brief A finished leaf of the quadtree, ready for mesh building
 */
struct Patch
{
    Vector2ui       coords;
    std::uint32_t   size{};

    /// Vertex resolution each edge must be stitched to so neighbors line up without cracks
    BlendCode       stitch;

    /// Resolution each edge morphs toward as the viewer moves away
    BlendCode       morph;

    /// Density level (0 to 3), selects the final-list bucket
    std::uint8_t    density{};

    /// A neighbor's children share an edge with this patch, morphing needs extra correction
    bool            needsSpecialMorph{false};

    Cell cell() const noexcept { return {coords, size}; }
};

/**
 * @brief Byte layout of a Patch as consumed by a GPU mesh builder
 */
struct GpuPatchRecord
{
    std::uint32_t coordX;
    std::uint32_t coordY;
    std::uint32_t size;
    std::uint32_t stitchCode;
    std::uint32_t morphCode;
    std::uint32_t needsSpecialMorph;
};
static_assert(sizeof(GpuPatchRecord) == 24, "GpuPatchRecord must stay tightly packed");

inline GpuPatchRecord to_gpu_record(Patch const& patch) noexcept
{
    return {
        .coordX             = patch.coords.x(),
        .coordY             = patch.coords.y(),
        .size               = patch.size,
        .stitchCode         = pack_blend_code(patch.stitch),
        .morphCode          = pack_blend_code(patch.morph),
        .needsSpecialMorph  = patch.needsSpecialMorph ? 1u : 0u
    };
}

} // namespace udlod
