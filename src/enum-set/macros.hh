#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: ES_COMPILER_MSVC, ES_COMPILER_CLANG, ES_COMPILER_GCC, ES_COMPILER_MINGW, ES_COMPILER_POSIX

#if defined(_MSC_VER)
#define ES_COMPILER_MSVC
#elif defined(__clang__)
#define ES_COMPILER_CLANG
#elif defined(__GNUC__)
#define ES_COMPILER_GCC
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define ES_COMPILER_MINGW
#else
#error "Unknown compiler"
#endif

#if defined(ES_COMPILER_CLANG) || defined(ES_COMPILER_GCC) || defined(ES_COMPILER_MINGW)
#define ES_COMPILER_POSIX
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// From CMake: ES_DEBUG, ES_RELEASE, ES_RELWITHDEBINFO, ES_ASSERT_ENABLED

// builds outside of our CMake setup get assertions unless NDEBUG says otherwise
#ifndef ES_ASSERT_ENABLED
#ifdef NDEBUG
#define ES_ASSERT_ENABLED 0
#else
#define ES_ASSERT_ENABLED 1
#endif
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: ES_OS_WINDOWS, ES_OS_LINUX, ES_OS_APPLE, ES_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define ES_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__) || defined(macintosh)
#define ES_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define ES_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define ES_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// ES_FORCE_INLINE - Force function to be inlined
#define ES_FORCE_INLINE ES_IMPL_FORCE_INLINE

// ES_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: ES_COLD_FUNC void handle_error() { ... }
#define ES_COLD_FUNC ES_IMPL_COLD_FUNC

// ES_MACRO_JOIN(a, b) - Concatenate two tokens at preprocessing time
// Usage: ES_MACRO_JOIN(foo_, bar) -> foo_bar
// Note: Indirection ensures arguments are expanded before concatenation
#define ES_MACRO_JOIN(arg1, arg2) ES_IMPL_MACRO_JOIN(arg1, arg2)

// ES_STRINGIFY_EXPR(...) - Convert tokens to a string literal, expanding macros first
// Usage: ES_STRINGIFY_EXPR(A, B, C) -> "A, B, C"
// Note: variadic so that comma-separated lists survive as a single literal
#define ES_STRINGIFY_EXPR(...) ES_IMPL_STRINGIFY_EXPR(__VA_ARGS__)

// ES_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Usage: ES_UNUSED(result);
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define ES_UNUSED(expr) (void)(sizeof((expr)))

// ES_FORCE_SEMICOLON - Force a semicolon after macro invocation
// Usage: #define MY_MACRO() do_something(); ES_FORCE_SEMICOLON
#define ES_FORCE_SEMICOLON static_assert(true)


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(ES_COMPILER_MSVC)

#define ES_IMPL_FORCE_INLINE __forceinline

#define ES_IMPL_COLD_FUNC

#elif defined(ES_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define ES_IMPL_FORCE_INLINE __attribute__((always_inline)) inline

#define ES_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif

#define ES_IMPL_MACRO_JOIN(arg1, arg2) arg1##arg2
#define ES_IMPL_STRINGIFY_EXPR(...) #__VA_ARGS__
