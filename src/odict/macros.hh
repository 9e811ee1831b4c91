#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: OD_COMPILER_MSVC, OD_COMPILER_CLANG, OD_COMPILER_GCC, OD_COMPILER_POSIX

#if defined(_MSC_VER)
#define OD_COMPILER_MSVC
#elif defined(__clang__)
#define OD_COMPILER_CLANG
#elif defined(__GNUC__)
#define OD_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(OD_COMPILER_CLANG) || defined(OD_COMPILER_GCC)
#define OD_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: OD_OS_WINDOWS, OD_OS_LINUX, OD_OS_APPLE, OD_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define OD_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define OD_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define OD_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define OD_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// From CMake: OD_DEBUG, OD_RELEASE, OD_RELWITHDEBINFO
// Optional: OD_ENABLE_ASSERT_IN_RELEASE
//
// OD_ASSERT_ENABLED is 1 when OD_ASSERT / OD_ASSERTF are checked, 0 otherwise.
// The _ALWAYS variants ignore this switch.

#ifndef OD_ASSERT_ENABLED
#if defined(OD_DEBUG) || defined(OD_RELWITHDEBINFO) || defined(OD_ENABLE_ASSERT_IN_RELEASE)
#define OD_ASSERT_ENABLED 1
#else
#define OD_ASSERT_ENABLED 0
#endif
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// OD_FORCE_INLINE - Force function to be inlined
#define OD_FORCE_INLINE OD_IMPL_FORCE_INLINE

// OD_COLD_FUNC - Mark function as rarely executed (growth paths, assertion failures)
// Usage: OD_COLD_FUNC void grow() { ... }
#define OD_COLD_FUNC OD_IMPL_COLD_FUNC

// OD_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: expr is NOT evaluated, sizeof is an unevaluated context
#define OD_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(OD_COMPILER_MSVC)

#define OD_IMPL_FORCE_INLINE __forceinline
#define OD_IMPL_COLD_FUNC

#elif defined(OD_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define OD_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define OD_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif
