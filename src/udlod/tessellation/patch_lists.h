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
 * @brief Fixed-capacity lists filled concurrently through atomic bump allocators
 */
#pragma once

#include "patch.h"

#include <Corrade/Containers/Array.h>
#include <Corrade/Containers/ArrayView.h>

#include <longeron/utility/asserts.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <stdexcept>

namespace udlod
{

/**
 * @brief Thrown when an allocation would write past a list's preallocated range
 */
class CapacityError : public std::length_error
{
public:
    using std::length_error::length_error;
};

/**
 * @brief Breadth-first queue of cells, one quadtree level at a time
 *
 * Holds two buffers: the level being read by the current pass, and the level its invocations
 * append children to. swap() at the end of a pass makes the appended cells readable.
 *
 * push() is thread-safe. Slots are handed out in no particular order.
 */
class WorkQueue
{
public:

    /**
     * @brief Allocate both buffers and clear; capacity is per level
     */
    void reserve(std::uint32_t capacity);

    void clear() noexcept;

    /**
     * @brief Append a cell to the level being written
     *
     * @return Slot the cell was written to
     *
     * @throws CapacityError
     */
    std::uint32_t push(Cell const& cell);

    /**
     * @brief Make the written level readable and start writing a new empty level
     *
     * Must not be called while a pass is pushing.
     */
    void swap() noexcept;

    Cell const& operator[](std::uint32_t const slot) const noexcept
    {
        LGRN_ASSERTM(slot < m_readCount, "Reading a slot that was not written by the previous pass");
        return m_read[slot];
    }

    /// Cells readable by the current pass; the previous pass's produced count
    std::uint32_t queued() const noexcept { return m_readCount; }

    /// Cells pushed so far by the current pass
    std::uint32_t pending() const noexcept { return m_writeCount.load(std::memory_order_acquire); }

    std::uint32_t capacity() const noexcept { return std::uint32_t(m_write.size()); }

private:
    Corrade::Containers::Array<Cell>    m_read;
    Corrade::Containers::Array<Cell>    m_write;
    std::atomic<std::uint32_t>          m_writeCount{0};
    std::uint32_t                       m_readCount{0};
};

/**
 * @return Index into the shared final list of a bucket-local index
 */
constexpr std::uint32_t bucket_address(std::uint8_t const density, std::uint32_t const local, std::uint32_t const stride) noexcept
{
    return std::uint32_t(density) * stride + local;
}

/**
 * @brief Final list of leaf patches, partitioned into one bucket per density level
 *
 * All buckets live in one array; bucket N starts at N * stride. Each bucket has its own atomic
 * counter so emitting to different buckets never contends.
 */
class PatchBuckets
{
public:

    /**
     * @brief Allocate gc_densityLevels * stride patches and clear
     */
    void reserve(std::uint32_t stride);

    void clear() noexcept;

    /**
     * @brief Write a patch into the bucket of its density, thread-safe
     *
     * @return Address the patch was written to
     *
     * @throws CapacityError
     */
    std::uint32_t emit(Patch const& patch);

    /**
     * @return Patches of one density level, in no particular order
     */
    Corrade::Containers::ArrayView<Patch const> bucket(std::uint8_t density) const noexcept;

    std::uint32_t bucket_size(std::uint8_t density) const noexcept;

    std::uint32_t total_size() const noexcept;

    std::uint32_t stride() const noexcept { return m_stride; }

    /**
     * @return Whole backing array, including unused slots of each bucket
     */
    Corrade::Containers::ArrayView<Patch const> storage() const noexcept { return m_patches; }

private:
    Corrade::Containers::Array<Patch>                           m_patches;
    std::array<std::atomic<std::uint32_t>, gc_densityLevels>    m_counts{};
    std::uint32_t                                               m_stride{0};
};

} // namespace udlod
