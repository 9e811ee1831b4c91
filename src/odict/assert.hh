#pragma once

// Lean header, safe to include from every container header.
// For formatted messages use <odict/assertf.hh>.
#include <odict/macros.hh>
#include <odict/source_location.hh>

// =========================================================================================================
// OD_ASSERT - Runtime assertion with string literal message
//
// Checks a precondition, postcondition or internal invariant.
// On failure the active assertion handler is called, then the debugger breaks (if attached) and the
// program aborts. Checked when OD_ASSERT_ENABLED is 1 (debug and release-with-debug-info builds).
//
// Error handling strategy in odict:
//   - Assertions        -> programmer errors (bad index, bad insert position, empty optional access)
//   - od::optional<T>   -> expected absence (key not found, position out of range)
//
// Usage:
//   OD_ASSERT(0 <= i && i < size(), "index out of bounds");
//   OD_ASSERT(additional >= 0, "reserve amount must be non-negative");
//
#define OD_ASSERT(cond, msg) OD_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// OD_ASSERT_ALWAYS - Always-active assertion
//
// Like OD_ASSERT but checked in every build configuration.
// Used for contract violations that would otherwise corrupt a container.
//
#define OD_ASSERT_ALWAYS(cond, msg) OD_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// OD_DEBUG_BREAK - break into the debugger if one is attached, otherwise no-op
//
#define OD_DEBUG_BREAK() OD_IMPL_DEBUG_BREAK()

// =========================================================================================================
// OD_BREAK_AND_ABORT - debug break (if attached) followed by termination
//
#define OD_BREAK_AND_ABORT() (OD_DEBUG_BREAK(), ::od::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace od::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler (or prints to stderr)
// Note: does not abort, caller must follow with OD_BREAK_AND_ABORT()
OD_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, od::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace od::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef OD_COMPILER_MSVC

#define OD_IMPL_DEBUG_BREAK() (::od::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(OD_COMPILER_POSIX)

// SIGTRAP (5) signals a breakpoint; we declare raise instead of pulling in <csignal>
extern "C" int raise(int) noexcept;
#define OD_IMPL_DEBUG_BREAK() (::od::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define OD_IMPL_DEBUG_BREAK() void(0)

#endif

#define OD_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::od::impl::handle_assert_failure(#cond, msg, ::od::source_location::current()); \
            OD_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if OD_ASSERT_ENABLED

#define OD_IMPL_ASSERT(cond, msg) OD_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// condition and message must still compile
#define OD_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        OD_UNUSED(cond);          \
        OD_UNUSED(msg);           \
    } while (false)

#endif
