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
#pragma once

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#endif
#include <spdlog/spdlog.h>

namespace udlod
{
using Logger_t = std::shared_ptr<spdlog::logger>;

/// Unique logger per thread. Threads that never call set_thread_logger use spdlog's default
inline thread_local Logger_t t_logger = spdlog::default_logger();

inline void set_thread_logger(Logger_t logger)
{
    t_logger = std::move(logger);
}

} // namespace udlod

#define UDLOD_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(udlod::t_logger, __VA_ARGS__)
#define UDLOD_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(udlod::t_logger, __VA_ARGS__)
#define UDLOD_LOG_INFO(...) SPDLOG_LOGGER_INFO(udlod::t_logger, __VA_ARGS__)
#define UDLOD_LOG_WARN(...) SPDLOG_LOGGER_WARN(udlod::t_logger, __VA_ARGS__)
#define UDLOD_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(udlod::t_logger, __VA_ARGS__)
#define UDLOD_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(udlod::t_logger, __VA_ARGS__)
