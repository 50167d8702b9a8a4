#pragma once

// Lean header with minimal dependencies: it is included by every container header.
#include <enum-set/macros.hh>
#include <enum-set/source_location.hh>

// =========================================================================================================
// ES_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
//
// Features:
//   - Simple string literal error messages (no formatting dependencies)
//   - Automatic source location capture (file, line, function)
//   - Debugger integration: breaks into debugger when attached, otherwise aborts
//   - Expression stringification for clear error reporting
//   - Active in debug and release-with-debug-info builds by default
//
// When assertions are active:
//   Assertions are enabled when ES_ASSERT_ENABLED is 1 (Debug and RelWithDebInfo).
//   In Release builds, assertions are disabled unless ES_ENABLE_ASSERT_IN_RELEASE is set in CMake.
//
// What assertions are for:
//   Assertions protect INVARIANTS, PRECONDITIONS, and POSTCONDITIONS.
//   In this library that means: an ordinal mapping that hands out ordinals >= 32,
//   or from_ordinal being called with an ordinal no member maps to.
//   Both are defects in the mapping, never in the data a set holds.
//
// What assertions are NOT for:
//   - NOT for user input validation
//   - NOT for common/expected error conditions (insert/remove report membership changes via bool)
//
// Usage:
//   ES_ASSERT(ordinal < member_count, "ordinal does not name a member");
//
#define ES_ASSERT(cond, msg) ES_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// ES_ASSERT_ALWAYS - Always-active assertion
//
// Like ES_ASSERT but remains active in all build configurations, including release builds.
// Used for the ordinal bound check of enum_set: a silently dropped bit would corrupt the mask unnoticed.
//
// Usage:
//   ES_ASSERT_ALWAYS(ordinal < 32, "enum_set supports at most 32 members");
//
#define ES_ASSERT_ALWAYS(cond, msg) ES_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// ES_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define ES_DEBUG_BREAK() ES_IMPL_DEBUG_BREAK()

// =========================================================================================================
// ES_BREAK_AND_ABORT - Debug break followed by program termination
//
// Used by ES_ASSERT after the assertion handler returned.
//
#define ES_BREAK_AND_ABORT() (ES_DEBUG_BREAK(), ::es::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace es::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler, or prints to stderr if none is installed
// Note: does not abort, caller must follow with ES_BREAK_AND_ABORT()
ES_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, es::source_location location);

// Checks if a debugger is currently attached to the process
// Windows: IsDebuggerPresent, Linux: TracerPid in /proc/self/status, false elsewhere
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace es::impl

// Platform-specific debugger break implementation
// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef ES_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define ES_IMPL_DEBUG_BREAK() (::es::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(ES_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// NOTE: we don't want to pull in any posix header here, so we simply declare raise
extern "C" int raise(int) noexcept;
#define ES_IMPL_DEBUG_BREAK() (::es::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define ES_IMPL_DEBUG_BREAK() void(0)

#endif

// ES_ASSERT_ALWAYS implementation - always enabled regardless of build configuration
#define ES_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::es::impl::handle_assert_failure(#cond, msg, ::es::source_location::current()); \
            ES_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if ES_ASSERT_ENABLED

#define ES_IMPL_ASSERT(cond, msg) ES_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the condition and message still have to compile
#define ES_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        ES_UNUSED(cond);          \
        ES_UNUSED(msg);           \
    } while (false)

#endif
