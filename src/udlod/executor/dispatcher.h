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
 * @brief Parallel-for style dispatchers that run a kernel once per invocation ID
 */
#pragma once

#include <tbb/task_arena.h>

#include <cstdint>

namespace udlod::exec
{

/**
 * @brief Runs a kernel over invocation IDs [0, count) with no ordering guarantees
 *
 * dispatch() acts as a full barrier: it only returns after every invocation has finished and
 * all of their writes are visible to the caller. The first exception thrown by a kernel is
 * rethrown from dispatch().
 */
class IDispatcher
{
public:

    using Kernel_t = void (*)(std::uint32_t invocation, void *pUserData);

    virtual ~IDispatcher() = default;

    virtual void dispatch(std::uint32_t count, Kernel_t kernel, void *pUserData) = 0;
};

/**
 * @brief Dispatch a callable (usually a lambda) by passing it through pUserData
 */
template <typename FUNC_T>
void dispatch(IDispatcher &rDispatcher, std::uint32_t const count, FUNC_T &rFunc)
{
    rDispatcher.dispatch(count, [] (std::uint32_t const invocation, void *pUserData)
    {
        (*static_cast<FUNC_T*>(pUserData))(invocation);
    }, &rFunc);
}

/**
 * @brief Runs all invocations in order on the calling thread
 */
class SerialDispatcher final : public IDispatcher
{
public:

    void dispatch(std::uint32_t count, Kernel_t kernel, void *pUserData) override;
};

/**
 * @brief Spreads invocations across a oneTBB task arena
 */
class TbbDispatcher final : public IDispatcher
{
public:

    /**
     * @param threadCount [in] Max worker threads, 0 lets TBB decide
     * @param grainSize   [in] Minimum invocations handled by one task
     */
    explicit TbbDispatcher(int threadCount = 0, std::uint32_t grainSize = 64);

    void dispatch(std::uint32_t count, Kernel_t kernel, void *pUserData) override;

    int max_concurrency() const { return m_arena.max_concurrency(); }

private:

    tbb::task_arena m_arena;
    std::uint32_t   m_grainSize;
};

} // namespace udlod::exec
