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
#include "patch_lists.h"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <utility>

namespace udlod
{

void WorkQueue::reserve(std::uint32_t const capacity)
{
    if (capacity != m_write.size())
    {
        m_read  = Corrade::Containers::Array<Cell>{Corrade::ValueInit, capacity};
        m_write = Corrade::Containers::Array<Cell>{Corrade::ValueInit, capacity};
    }
    clear();
}

void WorkQueue::clear() noexcept
{
    m_writeCount.store(0, std::memory_order_relaxed);
    m_readCount = 0;
}

std::uint32_t WorkQueue::push(Cell const& cell)
{
    std::uint32_t const slot = m_writeCount.fetch_add(1, std::memory_order_relaxed);
    if (slot >= m_write.size())
    {
        throw CapacityError(fmt::format("work queue full, capacity of {} cells per level", m_write.size()));
    }

    m_write[slot] = cell;
    return slot;
}

void WorkQueue::swap() noexcept
{
    std::swap(m_read, m_write);
    m_readCount = std::min<std::uint32_t>(m_writeCount.exchange(0, std::memory_order_acq_rel),
                                          std::uint32_t(m_read.size()));
}

void PatchBuckets::reserve(std::uint32_t const stride)
{
    if (stride != m_stride)
    {
        m_patches = Corrade::Containers::Array<Patch>{Corrade::ValueInit, std::size_t(stride) * gc_densityLevels};
        m_stride  = stride;
    }
    clear();
}

void PatchBuckets::clear() noexcept
{
    for (std::atomic<std::uint32_t> &rCount : m_counts)
    {
        rCount.store(0, std::memory_order_relaxed);
    }
}

std::uint32_t PatchBuckets::emit(Patch const& patch)
{
    LGRN_ASSERTM(patch.density < gc_densityLevels, "Density level out of range");

    std::uint32_t const local = m_counts[patch.density].fetch_add(1, std::memory_order_relaxed);
    if (local >= m_stride)
    {
        throw CapacityError(fmt::format("density bucket {} full, capacity of {} patches",
                                        patch.density, m_stride));
    }

    std::uint32_t const address = bucket_address(patch.density, local, m_stride);
    m_patches[address] = patch;
    return address;
}

std::uint32_t PatchBuckets::bucket_size(std::uint8_t const density) const noexcept
{
    LGRN_ASSERTM(density < gc_densityLevels, "Density level out of range");
    return std::min(m_counts[density].load(std::memory_order_acquire), m_stride);
}

std::uint32_t PatchBuckets::total_size() const noexcept
{
    std::uint32_t total = 0;
    for (std::uint8_t density = 0; density < gc_densityLevels; ++density)
    {
        total += bucket_size(density);
    }
    return total;
}

Corrade::Containers::ArrayView<Patch const> PatchBuckets::bucket(std::uint8_t const density) const noexcept
{
    std::uint32_t const first = bucket_address(density, 0, m_stride);
    return m_patches.slice(first, first + bucket_size(density));
}

} // namespace udlod
