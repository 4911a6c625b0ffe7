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
 */

#ifndef TETHER_PLATFORM_HPP_
#define TETHER_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace tether {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define TETHER_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define TETHER_PLATFORM_MACOS 1
#endif

// The relay needs BSD sockets and poll(2).
#if defined(TETHER_PLATFORM_LINUX) || defined(TETHER_PLATFORM_MACOS)
#define TETHER_HAS_NETWORK 1
#else
#define TETHER_HAS_NETWORK 0
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define TETHER_LIKELY(x) __builtin_expect(!!(x), 1)
#define TETHER_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define TETHER_UNUSED __attribute__((unused))
#define TETHER_PRINTF_FMT(fmt_idx, arg_idx) \
  __attribute__((format(printf, fmt_idx, arg_idx)))
#else
#define TETHER_LIKELY(x) (x)
#define TETHER_UNLIKELY(x) (x)
#define TETHER_UNUSED
#define TETHER_PRINTF_FMT(fmt_idx, arg_idx)
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
  (void)std::fprintf(stderr, "TETHER_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define TETHER_ASSERT(cond) ((void)0)
#else
#define TETHER_ASSERT(cond) \
  ((cond) ? ((void)0) : ::tether::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Macro Helpers
// ============================================================================

#define TETHER_CONCAT_IMPL(a, b) a##b
#define TETHER_CONCAT(a, b) TETHER_CONCAT_IMPL(a, b)

}  // namespace tether

#endif  // TETHER_PLATFORM_HPP_
