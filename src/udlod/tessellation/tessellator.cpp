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
#include "tessellator.h"
#include "predicates.h"
#include "stitch.h"

#include <udlod/core/math_2pow.h>
#include <udlod/util/logging.h>

#include <spdlog/fmt/fmt.h>

#include <stdexcept>
#include <utility>

namespace udlod
{

Tessellator::Tessellator(TessellationSettings const& settings, std::unique_ptr<IDensityPolicy> pDensity)
 : m_settings{settings}
 , m_pDensity{std::move(pDensity)}
{
    if (m_pDensity == nullptr)
    {
        throw ConfigError("Tessellator requires a density policy");
    }
}

void Tessellator::begin(ViewConfig const& config, CullState const& cull)
{
    m_state = EState::Idle;

    m_view = make_view_state(config, cull, m_settings);

    m_work.reserve(m_settings.workCapacity);
    m_buckets.reserve(m_settings.bucketCapacity);

    m_culled.store(0, std::memory_order_relaxed);
    m_trimmed.store(0, std::memory_order_relaxed);

    m_refinesDone = 0;
    m_state = EState::Ready;
}

bool Tessellator::is_culled(Cell const& cell) const noexcept
{
    return    m_settings.frustumCulling
           && frustum_cull(m_view.cull, m_view.cullPlaneMask, cell_bounds(m_view, cell));
}

void Tessellator::check_invocations(std::uint32_t const invocations) const
{
    if (invocations != m_work.queued())
    {
        throw std::invalid_argument(fmt::format("pass dispatched with {} invocations, but {} cells are queued",
                                                invocations, m_work.queued()));
    }
}

template <typename FUNC_T>
void Tessellator::run_pass(exec::IDispatcher &rDispatcher, std::uint32_t const invocations, FUNC_T &rKernel)
{
    try
    {
        exec::dispatch(rDispatcher, invocations, rKernel);
    }
    catch (...)
    {
        // Lists are partially written, a new begin() is required
        m_state = EState::Idle;
        throw;
    }
    m_work.swap();
}

std::uint32_t Tessellator::seed(exec::IDispatcher &rDispatcher)
{
    if (m_state != EState::Ready)
    {
        throw std::logic_error("seed() must directly follow begin()");
    }

    std::uint32_t const rootCount = m_view.config.rootCount;
    std::uint32_t const rootSize  = m_view.rootSize;

    auto kernel = [this, rootCount, rootSize] (std::uint32_t const invocation)
    {
        m_work.push({ Vector2ui{invocation % rootCount, invocation / rootCount}, rootSize });
    };

    run_pass(rDispatcher, rootCount * rootCount, kernel);

    m_state = EState::Refining;
    return m_work.queued();
}

std::uint32_t Tessellator::refine(exec::IDispatcher &rDispatcher, std::uint32_t const invocations)
{
    if (m_state != EState::Refining || m_refinesDone >= m_view.config.maxDepth)
    {
        throw std::logic_error(fmt::format("refine() called out of order, {} of {} refines done",
                                           m_refinesDone, m_view.config.maxDepth));
    }
    check_invocations(invocations);

    std::uint64_t const extent = m_view.config.worldExtent;

    auto kernel = [this, extent] (std::uint32_t const invocation)
    {
        Cell const cell = m_work[invocation];

        if (is_culled(cell))
        {
            m_culled.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        if ( ! divide(m_view, cell) )
        {
            m_buckets.emit(make_leaf_patch(m_view, *m_pDensity, cell));
            return;
        }

        for (std::uint32_t sibling = 0; sibling < 4; ++sibling)
        {
            Cell const child = child_of(cell, sibling);

            if (   std::uint64_t(child.coords.x()) * child.size >= extent
                || std::uint64_t(child.coords.y()) * child.size >= extent)
            {
                m_trimmed.fetch_add(1, std::memory_order_relaxed);
                continue;
            }

            m_work.push(child);
        }
    };

    run_pass(rDispatcher, invocations, kernel);

    ++m_refinesDone;
    return m_work.queued();
}

void Tessellator::flush(exec::IDispatcher &rDispatcher, std::uint32_t const invocations)
{
    if (m_state != EState::Refining || m_refinesDone != m_view.config.maxDepth)
    {
        throw std::logic_error(fmt::format("flush() requires exactly {} refines, {} done",
                                           m_view.config.maxDepth, m_refinesDone));
    }
    check_invocations(invocations);

    auto kernel = [this] (std::uint32_t const invocation)
    {
        Cell const cell = m_work[invocation];

        if (is_culled(cell))
        {
            m_culled.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        m_buckets.emit(make_leaf_patch(m_view, *m_pDensity, cell));
    };

    run_pass(rDispatcher, invocations, kernel);

    m_state = EState::Done;
}

BuildStats build_patch_list(Tessellator &rTess, exec::IDispatcher &rDispatcher, ViewConfig const& config, CullState const& cull)
{
    BuildStats stats;

    rTess.begin(config, cull);

    std::uint32_t queued = rTess.seed(rDispatcher);
    stats.passes.push_back({ .invocations = config.rootCount * config.rootCount, .queued = queued, .emitted = 0 });
    UDLOD_LOG_DEBUG("Seeded {} root cells of size {}", queued, rTess.view().rootSize);

    for (std::uint8_t level = 0; level < config.maxDepth; ++level)
    {
        std::uint32_t const invocations = queued;
        std::uint32_t const leavesBefore = rTess.patches().total_size();

        queued = rTess.refine(rDispatcher, invocations);

        std::uint32_t const emitted = rTess.patches().total_size() - leavesBefore;
        stats.passes.push_back({ .invocations = invocations, .queued = queued, .emitted = emitted });
        UDLOD_LOG_DEBUG("Refine {}: {} cells in, {} queued, {} leaves", level, invocations, queued, emitted);
    }

    std::uint32_t const leavesBefore = rTess.patches().total_size();
    rTess.flush(rDispatcher, queued);
    stats.passes.push_back({ .invocations = queued, .queued = 0,
                             .emitted = rTess.patches().total_size() - leavesBefore });

    // Tally the finished list
    PatchBuckets const& patches  = rTess.patches();
    int          const  rootLog2 = math::log2_of_pow2(rTess.view().rootSize);

    stats.leavesPerDepth.assign(std::size_t(config.maxDepth) + 1, 0);
    for (std::uint8_t density = 0; density < gc_densityLevels; ++density)
    {
        stats.leavesPerBucket[density] = patches.bucket_size(density);
        for (Patch const& patch : patches.bucket(density))
        {
            int const depth = rootLog2 - math::log2_of_pow2(patch.size);
            ++stats.leavesPerDepth[std::size_t(depth)];
        }
    }

    stats.culled      = rTess.culled_count();
    stats.trimmed     = rTess.trimmed_count();
    stats.totalLeaves = patches.total_size();

    UDLOD_LOG_DEBUG("Built {} patches in {} passes, buckets [{}, {}, {}, {}], {} culled, {} trimmed",
                    stats.totalLeaves, stats.passes.size(),
                    stats.leavesPerBucket[0], stats.leavesPerBucket[1],
                    stats.leavesPerBucket[2], stats.leavesPerBucket[3],
                    stats.culled, stats.trimmed);

    return stats;
}

} // namespace udlod
