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
 * @brief Pure per-cell tests used to drive quadtree subdivision
 */
#pragma once

#include "patch.h"
#include "view_config.h"

namespace udlod
{

/**
 * @return Terrain-space position of grid point (gridX, gridY), at the height under the viewer
 */
inline Vector3 grid_to_terrain(ViewState const& view, float const gridX, float const gridY) noexcept
{
    return { gridX * view.config.scale, view.config.heightUnderViewer, gridY * view.config.scale };
}

/**
 * @brief Test if a cell is close enough to the viewer to be split into 4 children
 *
 * True if any of the cell's 4 corners is nearer to the viewer than
 * (half cell size * view distance), with corner distances scaled by the distance bias.
 *
 * Safe for any coordinates, including ones outside the grid.
 */
bool divide(ViewState const& view, Cell const& cell) noexcept;

/**
 * @brief Test if a cell would subdivide if visited; cells at max depth never do
 */
inline bool subdivides(ViewState const& view, Cell const& cell) noexcept
{
    return cell.size > view.minSize && divide(view, cell);
}

/**
 * @brief Test if a cell's parent subdivides; root-sized cells always exist
 */
inline bool parent_subdivides(ViewState const& view, Cell const& cell) noexcept
{
    return cell.size >= view.rootSize || divide(view, parent_of(cell));
}

/**
 * @return Terrain-space bounds of a cell, using the fixed cull height range as vertical extent
 */
Range3D cell_bounds(ViewState const& view, Cell const& cell) noexcept;

/**
 * @brief Test if a box is fully outside the view frustum
 *
 * The box's 8 corners are transformed by the model matrix, then counted against each plane
 * selected by planeMask. A plane with no corner on its positive side rejects the box.
 *
 * @param cull      [in] Planes and model matrix
 * @param planeMask [in] Bit i set to test plane i of CullState::planes
 * @param box       [in] Terrain-space box
 *
 * @return true if the box should be culled
 */
bool frustum_cull(CullState const& cull, std::uint8_t planeMask, Range3D const& box) noexcept;

} // namespace udlod
