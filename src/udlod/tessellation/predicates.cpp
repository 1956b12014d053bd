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
#include "predicates.h"

#include <array>

namespace udlod
{

bool divide(ViewState const& view, Cell const& cell) noexcept
{
    float const size      = float(cell.size);
    float const threshold = 0.5f * size * view.config.scale * view.config.viewDistance;
    float const originX   = float(cell.coords.x()) * size;
    float const originY   = float(cell.coords.y()) * size;

    for (std::uint32_t corner = 0; corner < 4; ++corner)
    {
        float const gridX = originX + float(corner & 1u) * size;
        float const gridY = originY + float((corner >> 1u) & 1u) * size;

        Vector3 const world    = view.cull.model.transformPoint(grid_to_terrain(view, gridX, gridY));
        float   const distance = (world - view.cull.viewerPosition).length();

        if (distance * view.distanceBias < threshold)
        {
            return true;
        }
    }

    return false;
}

Range3D cell_bounds(ViewState const& view, Cell const& cell) noexcept
{
    float const size    = float(cell.size) * view.config.scale;
    float const originX = float(cell.coords.x()) * size;
    float const originZ = float(cell.coords.y()) * size;

    return { {originX,        view.cullMinHeight, originZ},
             {originX + size, view.cullMaxHeight, originZ + size} };
}

bool frustum_cull(CullState const& cull, std::uint8_t const planeMask, Range3D const& box) noexcept
{
    std::array<Vector3, 8> corners;
    for (std::uint32_t i = 0; i < corners.size(); ++i)
    {
        Vector3 const local{ (i & 1u) ? box.max().x() : box.min().x(),
                             (i & 2u) ? box.max().y() : box.min().y(),
                             (i & 4u) ? box.max().z() : box.min().z() };
        corners[i] = cull.model.transformPoint(local);
    }

    for (std::uint32_t planeIdx = 0; planeIdx < cull.planes.size(); ++planeIdx)
    {
        if ((planeMask & (1u << planeIdx)) == 0)
        {
            continue;
        }

        Vector4 const& plane = cull.planes[planeIdx];

        int inside = 0;
        for (Vector3 const& corner : corners)
        {
            if (Magnum::Math::dot(plane.xyz(), corner) + plane.w() > 0.0f)
            {
                ++inside;
            }
        }

        if (inside == 0)
        {
            return true; // Every corner is behind this plane
        }
    }

    return false;
}

} // namespace udlod
