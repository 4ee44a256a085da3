#pragma once

#if defined(_MSC_VER) && !defined(__clang__)
#define RILL_ALWAYS_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#define RILL_ALWAYS_INLINE inline __attribute__((always_inline))
#else
#define RILL_ALWAYS_INLINE inline
#endif

// RILL_BASE_API marks symbols exported from RillBase when it is built as a shared library.
#ifndef RILL_BASE_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(RILL_BASE_SHARED_BUILD)
#define RILL_BASE_API __declspec(dllexport)
#elif defined(RILL_BASE_SHARED)
#define RILL_BASE_API __declspec(dllimport)
#else
#define RILL_BASE_API
#endif
#elif defined(RILL_BASE_SHARED_BUILD) || defined(RILL_BASE_SHARED)
#define RILL_BASE_API __attribute__((visibility("default")))
#else
#define RILL_BASE_API
#endif
#endif

namespace RILL
{
    /// @brief Marks a code path the caller guarantees is never taken, such as the end of a
    /// switch covering every enumerator.
    [[noreturn]] inline void Unreachable()
    {
#if defined(_MSC_VER) && !defined(__clang__)
        __assume(false);
#else
        __builtin_unreachable();
#endif
    }
}// namespace RILL
