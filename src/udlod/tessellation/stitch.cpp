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
#include "stitch.h"
#include "predicates.h"

#include <longeron/utility/asserts.hpp>

#include <algorithm>
#include <array>
#include <limits>

namespace udlod
{

namespace
{

/**
 * @return Sibling indices of a neighbor's children that touch the edge shared with a cell
 */
constexpr std::array<std::uint32_t, 2> children_touching(EEdge const edge) noexcept
{
    switch (edge)
    {
    case EEdge::NegX: return {{1u, 3u}}; // Neighbor's +x column
    case EEdge::NegY: return {{2u, 3u}}; // Neighbor's +y row
    case EEdge::PosX: return {{0u, 2u}}; // Neighbor's -x column
    case EEdge::PosY: return {{0u, 1u}}; // Neighbor's -y row
    }
    return {{0u, 0u}};
}

constexpr EEdge opposite(EEdge const edge) noexcept
{
    return EEdge((std::uint8_t(edge) + 2u) % 4u);
}

bool inside_terrain(ViewState const& view, Cell const& cell) noexcept
{
    std::uint64_t const extent = view.config.worldExtent;
    return    std::uint64_t(cell.coords.x()) * cell.size < extent
           && std::uint64_t(cell.coords.y()) * cell.size < extent;
}

/**
 * @brief Stitch of a leaf's edge that borders the children of a same-size neighbor
 *
 * @param coarseSegments [in] Edge segments of the leaf
 * @param neighbor       [in] Subdivided cell across the edge
 * @param edge           [in] Edge of the leaf, pointing toward neighbor
 *
 * @return Segments across the leaf's whole edge, limited by the coarsest child touching it
 */
std::uint8_t finer_edge_stitch(ViewState const& view, IDensityPolicy const& policy,
                               std::uint8_t const coarseSegments, Cell const& neighbor, EEdge const edge) noexcept
{
    // Two of the neighbor's children span this edge. Either may be trimmed away at the border
    // of a non-power-of-two terrain, but never both.
    std::uint8_t childSegments = std::numeric_limits<std::uint8_t>::max();
    for (std::uint32_t const sibling : children_touching(edge))
    {
        Cell const child = child_of(neighbor, sibling);
        if (inside_terrain(view, child))
        {
            childSegments = std::min(childSegments, edge_segments(policy.density(view, child)));
        }
    }
    LGRN_ASSERTM(childSegments != std::numeric_limits<std::uint8_t>::max(),
                 "A neighbor's children touching a leaf can't all be outside the terrain");

    return std::uint8_t(std::min<std::uint32_t>(coarseSegments, 2u * childSegments));
}

} // namespace

std::optional<Cell> neighbor_cell(ViewState const& view, Cell const& cell, EEdge const edge) noexcept
{
    Vector2i     const dir    = edge_direction(edge);
    std::int64_t const x      = std::int64_t(cell.coords.x()) + dir.x();
    std::int64_t const y      = std::int64_t(cell.coords.y()) + dir.y();
    std::int64_t const extent = view.config.worldExtent;

    if (x < 0 || y < 0 || x * cell.size >= extent || y * cell.size >= extent)
    {
        return std::nullopt;
    }

    return Cell{ Vector2ui{std::uint32_t(x), std::uint32_t(y)}, cell.size };
}

ENeighbor classify_neighbor(ViewState const& view, std::optional<Cell> const& neighbor) noexcept
{
    if ( ! neighbor.has_value() )
    {
        return ENeighbor::Outside;
    }

    if ( ! parent_subdivides(view, *neighbor) )
    {
        return ENeighbor::Coarser;
    }

    return subdivides(view, *neighbor) ? ENeighbor::FinerChildren : ENeighbor::SameSize;
}

std::uint8_t parent_resolution(ViewState const& view, IDensityPolicy const& policy, Cell const& cell) noexcept
{
    if (cell.size >= view.rootSize)
    {
        return edge_segments(policy.density(view, cell));
    }

    return edge_segments(policy.density(view, parent_of(cell))) / 2u;
}

Patch make_leaf_patch(ViewState const& view, IDensityPolicy const& policy, Cell const& cell) noexcept
{
    std::uint8_t const level        = policy.density(view, cell);
    std::uint8_t const selfSegments = edge_segments(level);
    std::uint8_t const selfMorph    = std::min(selfSegments, parent_resolution(view, policy, cell));

    Patch patch
    {
        .coords     = cell.coords,
        .size       = cell.size,
        .stitch     = { .self = selfSegments },
        .morph      = { .self = selfMorph },
        .density    = level
    };

    for (EEdge const edge : gc_edges)
    {
        std::size_t const         i        = std::size_t(edge);
        std::optional<Cell> const neighbor = neighbor_cell(view, cell, edge);

        std::uint8_t &rStitch = patch.stitch.edges[i];
        std::uint8_t &rMorph  = patch.morph .edges[i];

        switch (classify_neighbor(view, neighbor))
        {
        case ENeighbor::Outside:
            rStitch = selfSegments;
            rMorph  = selfMorph;
            break;
        case ENeighbor::FinerChildren:
        {
            rStitch = finer_edge_stitch(view, policy, selfSegments, *neighbor, edge);

            // Children morph toward the neighbor's own resolution as they merge back into it
            rMorph  = std::min(rStitch, edge_segments(policy.density(view, *neighbor)));
            patch.needsSpecialMorph = true;
            break;
        }
        case ENeighbor::SameSize:
            rStitch = std::min(selfSegments, edge_segments(policy.density(view, *neighbor)));
            rMorph  = std::min(selfMorph, parent_resolution(view, policy, *neighbor));
            break;
        case ENeighbor::Coarser:
        {
            // Only this side adapts. Take the coarse leaf's stitch over this edge, which also
            // depends on the sibling sharing the edge, then halve it to this patch's scale.
            Cell const coarse = parent_of(*neighbor);
            rStitch = std::uint8_t(finer_edge_stitch(view, policy, edge_segments(policy.density(view, coarse)),
                                                     parent_of(cell), opposite(edge)) / 2u);
            rMorph  = rStitch;
            break;
        }
        }
    }

    return patch;
}

} // namespace udlod
