/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
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
 * @file platform.hpp
 * @brief Platform detection, compiler hints, and assertion macros.
 *
 * The daemon relies on inotify(7), epoll(7) and /proc, so only Linux is
 * supported; the detection macros exist so headers can fail loudly.
 */

#ifndef DND_PLATFORM_HPP_
#define DND_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace dnd {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define DND_PLATFORM_LINUX 1
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define DND_LIKELY(x) __builtin_expect(!!(x), 1)
#define DND_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define DND_UNUSED __attribute__((unused))
#define DND_PRINTF_FMT(fmt_idx, va_idx) \
  __attribute__((format(printf, fmt_idx, va_idx)))
#else
#define DND_LIKELY(x) (x)
#define DND_UNLIKELY(x) (x)
#define DND_UNUSED
#define DND_PRINTF_FMT(fmt_idx, va_idx)
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "DND_ASSERT failed: %s at %s:%d\n", cond, file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define DND_ASSERT(cond) ((void)0)
#else
#define DND_ASSERT(cond)                                                    \
  ((cond) ? ((void)0) : ::dnd::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace dnd

#endif  // DND_PLATFORM_HPP_
