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
#include "dispatcher.h"

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include <algorithm>

namespace udlod::exec
{

void SerialDispatcher::dispatch(std::uint32_t const count, Kernel_t const kernel, void *pUserData)
{
    for (std::uint32_t invocation = 0; invocation < count; ++invocation)
    {
        kernel(invocation, pUserData);
    }
}

TbbDispatcher::TbbDispatcher(int const threadCount, std::uint32_t const grainSize)
 : m_arena{ (threadCount > 0) ? threadCount : int(tbb::task_arena::automatic) }
 , m_grainSize{ std::max<std::uint32_t>(grainSize, 1u) }
{ }

void TbbDispatcher::dispatch(std::uint32_t const count, Kernel_t const kernel, void *pUserData)
{
    if (count == 0)
    {
        return;
    }

    using Range_t = tbb::blocked_range<std::uint32_t>;

    m_arena.execute([this, count, kernel, pUserData] ()
    {
        tbb::parallel_for(Range_t{0, count, m_grainSize}, [kernel, pUserData] (Range_t const& range)
        {
            for (std::uint32_t invocation = range.begin(); invocation != range.end(); ++invocation)
            {
                kernel(invocation, pUserData);
            }
        });
    });
}

} // namespace udlod::exec
