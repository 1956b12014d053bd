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
 * @brief Seed, refine, and flush passes that build a patch list for one view
 *
 * A build is a breadth-first traversal of the quadtree done one level per pass:
 *
 * * seed    - Queue every root cell
 * * refine  - Run once per level. Each queued cell either queues its 4 children or is emitted as
 *             a leaf patch into the final list
 * * flush   - Emit every cell still queued after the last refine
 *
 * Each pass is a kernel dispatched once per queued cell with no ordering between invocations.
 * The host reads back how many cells were queued to size the next dispatch.
 */
#pragma once

#include "density.h"
#include "patch_lists.h"
#include "view_config.h"

#include <udlod/executor/dispatcher.h>

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace udlod
{

/**
 * @brief Owns the lists and pass state of one terrain view
 *
 * Multiple views are served by multiple Tessellators; they can share one dispatcher.
 */
class Tessellator
{
public:

    enum class EState : std::uint8_t
    {
        /// Not started, or a pass threw
        Idle,

        /// begin() called, ready to seed
        Ready,

        /// Seeded, or refined fewer than maxDepth times
        Refining,

        /// Flushed; patches() holds the finished list
        Done
    };

    /**
     * @param settings [in] Capacities, bias, and culling options kept over many builds
     * @param pDensity [in] Density policy used for every patch of every build
     */
    Tessellator(TessellationSettings const& settings, std::unique_ptr<IDensityPolicy> pDensity);

    /**
     * @brief Validate a view and reset lists and counters for a new build
     *
     * Lists are only reallocated if capacities changed.
     *
     * @throws ConfigError
     */
    void begin(ViewConfig const& config, CullState const& cull);

    /**
     * @brief Queue all rootCount^2 root cells
     *
     * @return Number of cells queued, the invocation count of the first refine
     *
     * @throws std::logic_error if begin() wasn't called
     */
    std::uint32_t seed(exec::IDispatcher &rDispatcher);

    /**
     * @brief Subdivide or emit each queued cell
     *
     * @param invocations [in] Must be the count returned by the previous pass
     *
     * @return Number of children queued, the invocation count of the next pass
     *
     * @throws std::logic_error         if called out of order or more than maxDepth times
     * @throws std::invalid_argument    if invocations doesn't match the queued count
     * @throws CapacityError            if the working queue or a bucket is full
     */
    std::uint32_t refine(exec::IDispatcher &rDispatcher, std::uint32_t invocations);

    /**
     * @brief Emit all remaining queued cells as leaves; must follow exactly maxDepth refines
     *
     * @param invocations [in] Must be the count returned by the last refine
     *
     * @throws std::logic_error, std::invalid_argument, CapacityError
     */
    void flush(exec::IDispatcher &rDispatcher, std::uint32_t invocations);

    PatchBuckets const& patches() const noexcept { return m_buckets; }

    ViewState const& view() const noexcept { return m_view; }

    EState state() const noexcept { return m_state; }

    /// Number of refine passes run since begin()
    std::uint8_t refines_done() const noexcept { return m_refinesDone; }

    /// Cells dropped by frustum culling since begin()
    std::uint32_t culled_count() const noexcept { return m_culled.load(std::memory_order_acquire); }

    /// Children not queued because they start beyond the world extent, since begin()
    std::uint32_t trimmed_count() const noexcept { return m_trimmed.load(std::memory_order_acquire); }

private:

    bool is_culled(Cell const& cell) const noexcept;

    void check_invocations(std::uint32_t invocations) const;

    template <typename FUNC_T>
    void run_pass(exec::IDispatcher &rDispatcher, std::uint32_t invocations, FUNC_T &rKernel);

    TessellationSettings            m_settings;
    std::unique_ptr<IDensityPolicy> m_pDensity;

    ViewState                       m_view;

    WorkQueue                       m_work;
    PatchBuckets                    m_buckets;

    std::atomic<std::uint32_t>      m_culled{0};
    std::atomic<std::uint32_t>      m_trimmed{0};

    EState                          m_state{EState::Idle};
    std::uint8_t                    m_refinesDone{0};
};

/**
 * @brief Counts recorded by build_patch_list
 */
struct BuildStats
{
    struct Pass
    {
        std::uint32_t invocations;

        /// Cells queued for the next pass
        std::uint32_t queued;

        /// Leaf patches written to the final list
        std::uint32_t emitted;
    };

    /// Seed, each refine, then flush
    std::vector<Pass>                           passes;

    std::array<std::uint32_t, gc_densityLevels> leavesPerBucket{};

    /// Index 0 is root size, index maxDepth is the smallest size
    std::vector<std::uint32_t>                  leavesPerDepth;

    std::uint32_t                               culled{0};
    std::uint32_t                               trimmed{0};
    std::uint32_t                               totalLeaves{0};
};

/**
 * @brief Run a complete build: begin, seed, maxDepth refines, then flush
 *
 * @throws ConfigError, CapacityError
 */
BuildStats build_patch_list(Tessellator &rTess, exec::IDispatcher &rDispatcher, ViewConfig const& config, CullState const& cull);

} // namespace udlod
