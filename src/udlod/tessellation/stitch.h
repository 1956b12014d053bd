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
 * @brief Neighbor classification and blend codes for leaf patches
 *
 * A leaf's edge must be stitched to the coarser of its own and its neighbor's resolution so
 * vertices line up, and must morph toward the resolution the shared edge will have once the
 * finer side merges into its parent.
 */
#pragma once

#include "density.h"
#include "patch.h"
#include "view_config.h"

#include <optional>

namespace udlod
{

/**
 * @brief How the terrain across one edge of a leaf is subdivided
 */
enum class ENeighbor : std::uint8_t
{
    /// Edge lies on the border of the terrain
    Outside,

    /// Neighbor cell subdivides; its children touch the edge
    FinerChildren,

    /// Neighbor is a leaf of the same size
    SameSize,

    /// Neighbor's parent doesn't subdivide; a coarser leaf lies across the edge
    Coarser
};

/**
 * @return Same-size cell across an edge, or std::nullopt if it lies outside the terrain
 */
std::optional<Cell> neighbor_cell(ViewState const& view, Cell const& cell, EEdge edge) noexcept;

/**
 * @brief Classify the neighbor of a leaf by testing subdivision at the neighbor's level and at
 *        its parent's level
 */
ENeighbor classify_neighbor(ViewState const& view, std::optional<Cell> const& neighbor) noexcept;

/**
 * @return Resolution a cell's edges have at the level above, measured at the cell's own scale
 *
 * Half of the parent's edge segments. Root-sized cells have no level above, they use their own.
 */
std::uint8_t parent_resolution(ViewState const& view, IDensityPolicy const& policy, Cell const& cell) noexcept;

/**
 * @brief Turn a leaf cell into a Patch with stitch and morph codes for all 4 edges
 */
Patch make_leaf_patch(ViewState const& view, IDensityPolicy const& policy, Cell const& cell) noexcept;

} // namespace udlod
