#pragma once

// Lean header with minimal dependencies, included by every rail-core header.
#include <rail/fwd.hh>
#include <rail/macros.hh>

// =========================================================================================================
// RAIL_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and reports a violation through the active assertion handler,
// then breaks into an attached debugger and aborts.
//
// When assertions are active:
//   Enabled in RAIL_DEBUG and RAIL_RELWITHDEBINFO builds (and builds without a mode define).
//   In RAIL_RELEASE builds, disabled unless RAIL_ENABLE_ASSERT_IN_RELEASE is defined.
//
// Error handling strategy of rail-core:
//   - Assertions      -> programmer errors: empty failure messages, invalid faults,
//                        reading value() of a failure, error() of a success
//   - Exceptions      -> thrown by user functions, captured into a failure by lift/transform/and_then
//   - result<T>       -> common/expected failures (validation rejections, caught faults)
//
// Important:
//   NEVER trigger assertions based on user input or external conditions!
//   Production builds can provide a custom assertion handler (see <rail/assert-handler.hh>).
//
// Usage:
//   RAIL_ASSERT(is_success(), "value() called on a failure result");
//
#define RAIL_ASSERT(cond, msg) RAIL_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// RAIL_ASSERT_ALWAYS - Always-active assertion
//
// Like RAIL_ASSERT but active in all build configurations.
// Used for argument contracts that must be reported at construction time in every build,
// e.g. a null or empty message passed to rail::failure.
//
#define RAIL_ASSERT_ALWAYS(cond, msg) RAIL_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// RAIL_DEBUG_BREAK - Breaks into the debugger if one is attached, otherwise does nothing
//
#define RAIL_DEBUG_BREAK() RAIL_IMPL_DEBUG_BREAK()

// =========================================================================================================
// RAIL_BREAK_AND_ABORT - Debug break (if attached) followed by program termination
//
#define RAIL_BREAK_AND_ABORT() (RAIL_DEBUG_BREAK(), ::rail::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace rail::impl
{
// Called when an assertion fails
// Dispatches to the topmost handler of the assertion handler stack (or prints to stderr)
// Note: does not abort, caller must follow with RAIL_BREAK_AND_ABORT()
//       a handler may throw to skip the abort
RAIL_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, rail::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace rail::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef RAIL_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define RAIL_IMPL_DEBUG_BREAK() (::rail::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(RAIL_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// declared here so we don't pull in <csignal> everywhere
extern "C" int raise(int) noexcept;
#define RAIL_IMPL_DEBUG_BREAK() (::rail::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define RAIL_IMPL_DEBUG_BREAK() void(0)

#endif

#define RAIL_IMPL_ASSERT_ALWAYS(cond, msg)                                                       \
    do                                                                                           \
    {                                                                                            \
        if (!(cond)) [[unlikely]]                                                                \
        {                                                                                        \
            ::rail::impl::handle_assert_failure(#cond, msg, ::rail::source_location::current()); \
            RAIL_BREAK_AND_ABORT();                                                              \
        }                                                                                        \
    } while (false)

#if RAIL_ASSERT_ENABLED

#define RAIL_IMPL_ASSERT(cond, msg) RAIL_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the message must still compile
#define RAIL_IMPL_ASSERT(cond, msg) \
    do                              \
    {                               \
        RAIL_UNUSED(cond);          \
        RAIL_UNUSED(msg);           \
    } while (false)

#endif
