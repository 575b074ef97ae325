/**
 * Open Space Program
 * Copyright © 2019-2023 Open Space Program Project
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

#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#include <spdlog/spdlog.h>

#include <memory>
#include <utility>

namespace astro
{

using Logger_t = std::shared_ptr<spdlog::logger>;

// Unique logger per thread. Falls back to spdlog's default logger so library
// code can log before an application sets anything up.
inline thread_local Logger_t t_logger = spdlog::default_logger();

inline void set_thread_logger(Logger_t logger)
{
    t_logger = std::move(logger);
}

} // namespace astro

#define ASTRO_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(astro::t_logger, __VA_ARGS__)
#define ASTRO_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(astro::t_logger, __VA_ARGS__)
#define ASTRO_LOG_INFO(...) SPDLOG_LOGGER_INFO(astro::t_logger, __VA_ARGS__)
#define ASTRO_LOG_WARN(...) SPDLOG_LOGGER_WARN(astro::t_logger, __VA_ARGS__)
#define ASTRO_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(astro::t_logger, __VA_ARGS__)
#define ASTRO_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(astro::t_logger, __VA_ARGS__)
