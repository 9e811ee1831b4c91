#pragma once

#include <odict/assert.hh>

#include <format>

// =========================================================================================================
// OD_ASSERTF - Runtime assertion with std::format message
//
// Same semantics as OD_ASSERT, but the message is a format string with arguments.
// Arguments are only evaluated when the condition fails.
//
// Usage:
//   OD_ASSERTF(pos <= size(), "insert position {} out of range [0, {}]", pos, size());
//
#define OD_ASSERTF(cond, msg, ...) OD_IMPL_ASSERTF(cond, msg, ##__VA_ARGS__)

// =========================================================================================================
// OD_ASSERTF_ALWAYS - Always-active formatted assertion
//
#define OD_ASSERTF_ALWAYS(cond, msg, ...) OD_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)


// =========================================================================================================
// Implementation details
// =========================================================================================================

#define OD_IMPL_ASSERTF_ALWAYS(cond, msg, ...)                                                            \
    do                                                                                                    \
    {                                                                                                     \
        if (!(cond)) [[unlikely]]                                                                         \
        {                                                                                                 \
            ::od::impl::handle_assert_failure(#cond, std::format(msg __VA_OPT__(, ) __VA_ARGS__).c_str(), \
                                              ::od::source_location::current());                          \
            OD_BREAK_AND_ABORT();                                                                         \
        }                                                                                                 \
    } while (false)

#if OD_ASSERT_ENABLED

#define OD_IMPL_ASSERTF(cond, msg, ...) OD_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)

#else

#define OD_IMPL_ASSERTF(cond, msg, ...)                         \
    do                                                          \
    {                                                           \
        OD_UNUSED(cond);                                        \
        OD_UNUSED(std::format(msg __VA_OPT__(, ) __VA_ARGS__)); \
    } while (false)

#endif
