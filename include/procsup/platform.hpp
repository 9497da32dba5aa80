#pragma once

/// @file platform.hpp
/// @brief Platform and standard feature detection macros.

#include <version>

// Values are 0 or 1 for use in #if expressions.

#if defined(__APPLE__) && defined(__MACH__)
/// @brief True when building for macOS.
#define PROCSUP_PLATFORM_MACOS 1
#else
/// @brief True when building for macOS.
#define PROCSUP_PLATFORM_MACOS 0
#endif

#if defined(__linux__)
/// @brief True when building for Linux.
#define PROCSUP_PLATFORM_LINUX 1
#else
/// @brief True when building for Linux.
#define PROCSUP_PLATFORM_LINUX 0
#endif

#if defined(__unix__) || PROCSUP_PLATFORM_MACOS || PROCSUP_PLATFORM_LINUX
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when building for a POSIX-like platform.
#define PROCSUP_PLATFORM_POSIX 1
#else
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when building for a POSIX-like platform.
#define PROCSUP_PLATFORM_POSIX 0
#endif

#if !PROCSUP_PLATFORM_POSIX
#error "procsup supervises POSIX processes only"
#endif

#if __cplusplus < 202002L
#error "procsup requires at least C++20"
#endif

#if defined(__has_feature)
#if __has_feature(thread_sanitizer)
/// @brief True when compiled with ThreadSanitizer.
#define PROCSUP_HAS_THREAD_SANITIZER 1
#endif
#endif
#if !defined(PROCSUP_HAS_THREAD_SANITIZER) && defined(__SANITIZE_THREAD__)
#define PROCSUP_HAS_THREAD_SANITIZER 1
#endif
#if !defined(PROCSUP_HAS_THREAD_SANITIZER)
#define PROCSUP_HAS_THREAD_SANITIZER 0
#endif
