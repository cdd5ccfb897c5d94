#pragma once

/// @file config.hpp
/// @author Aleksandr Loshkarev
/// @brief Configuration macros for the serdex library.
///
/// Controls:
///   - Branch prediction hints
///   - Nesting depth limit for the JSON deserializer
///   - Protocol assertions (always enabled)

#include <cstdio>
#include <cstdlib>

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define SERDEX_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define SERDEX_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define SERDEX_NOINLINE    __attribute__((noinline))
#elif defined(_MSC_VER)
    #define SERDEX_LIKELY(x)   (x)
    #define SERDEX_UNLIKELY(x) (x)
    #define SERDEX_NOINLINE    __declspec(noinline)
#else
    #define SERDEX_LIKELY(x)   (x)
    #define SERDEX_UNLIKELY(x) (x)
    #define SERDEX_NOINLINE
#endif

// =====================================================================
// Recursion depth limit
// =====================================================================
// Applies to both the live container stack and the nesting of values
// buffered into the lookback arena.

#if !defined(SERDEX_MAX_DEPTH)
    #define SERDEX_MAX_DEPTH 512
#endif

// =====================================================================
// Protocol assertions
// =====================================================================
// A protocol violation (reading a value twice, skipping a close, calling
// an operation in the wrong stack state) is a bug in the calling code,
// never a property of the input. These checks stay on in release builds.

namespace serdex::detail {

[[noreturn]] SERDEX_NOINLINE inline void protocol_violation(
        const char* message, const char* file, int line) noexcept {
    std::fprintf(stderr, "serdex: protocol violation: %s (%s:%d)\n",
                 message, file, line);
    std::fflush(stderr);
    std::abort();
}

} // namespace serdex::detail

#define SERDEX_ASSERT(cond, message)                                        \
    do {                                                                    \
        if (SERDEX_UNLIKELY(!(cond))) {                                     \
            ::serdex::detail::protocol_violation((message), __FILE__, __LINE__); \
        }                                                                   \
    } while (0)
