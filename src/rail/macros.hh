#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: RAIL_COMPILER_MSVC, RAIL_COMPILER_CLANG, RAIL_COMPILER_GCC, RAIL_COMPILER_POSIX

#if defined(_MSC_VER)
#define RAIL_COMPILER_MSVC
#elif defined(__clang__)
#define RAIL_COMPILER_CLANG
#elif defined(__GNUC__)
#define RAIL_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(RAIL_COMPILER_CLANG) || defined(RAIL_COMPILER_GCC)
#define RAIL_COMPILER_POSIX
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// Conditionally defined: RAIL_HAS_RTTI, RAIL_HAS_CPP_EXCEPTIONS
// From CMake: RAIL_DEBUG, RAIL_RELEASE, RAIL_RELWITHDEBINFO, RAIL_ENABLE_ASSERT_IN_RELEASE

#ifdef RAIL_COMPILER_MSVC
#ifdef _CPPRTTI
#define RAIL_HAS_RTTI
#endif
#ifdef _CPPUNWIND
#define RAIL_HAS_CPP_EXCEPTIONS
#endif
#elif defined(RAIL_COMPILER_CLANG)
#if __has_feature(cxx_rtti)
#define RAIL_HAS_RTTI
#endif
#if __EXCEPTIONS && __has_feature(cxx_exceptions)
#define RAIL_HAS_CPP_EXCEPTIONS
#endif
#elif defined(RAIL_COMPILER_GCC)
#ifdef __GXX_RTTI
#define RAIL_HAS_RTTI
#endif
#if __EXCEPTIONS
#define RAIL_HAS_CPP_EXCEPTIONS
#endif
#endif

// lift/transform turn exceptions thrown by user functions into failures
#ifndef RAIL_HAS_CPP_EXCEPTIONS
#error "rail-core requires C++ exceptions to be enabled"
#endif

// RAIL_ASSERT_ENABLED - 1 if RAIL_ASSERT is checked in this configuration
// Release builds strip RAIL_ASSERT unless RAIL_ENABLE_ASSERT_IN_RELEASE is set.
// Builds without any mode define (e.g. a plain cmake configure) count as debug.
// RAIL_ASSERT_ALWAYS is never affected.
#ifndef RAIL_ASSERT_ENABLED
#if defined(RAIL_RELEASE) && !defined(RAIL_ENABLE_ASSERT_IN_RELEASE)
#define RAIL_ASSERT_ENABLED 0
#else
#define RAIL_ASSERT_ENABLED 1
#endif
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: RAIL_OS_LINUX (debugger detection reads /proc)

#if defined(__linux__) || defined(linux)
#define RAIL_OS_LINUX
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// RAIL_FORCE_INLINE - Force function to be inlined
#define RAIL_FORCE_INLINE RAIL_IMPL_FORCE_INLINE

// RAIL_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: RAIL_COLD_FUNC void handle_error() { ... }
#define RAIL_COLD_FUNC RAIL_IMPL_COLD_FUNC

// RAIL_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: expr is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define RAIL_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(RAIL_COMPILER_MSVC)

#define RAIL_IMPL_FORCE_INLINE __forceinline
#define RAIL_IMPL_COLD_FUNC

#elif defined(RAIL_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define RAIL_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define RAIL_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif
