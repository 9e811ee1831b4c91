#include "assert.hh"

#include <odict/assert-handler.hh>
#include <odict/stacktrace.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <vector>

#ifdef OD_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef OD_OS_LINUX
#include <cstring>
#endif

namespace
{
// NOTE: not thread-safe, see assert-handler.hh
std::vector<std::move_only_function<void(od::impl::assertion_info const&)>> g_assertion_handlers;

void default_assert_handler(od::impl::assertion_info const& info)
{
    std::cerr << "Assertion failed: " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";

    std::cerr << "\nStacktrace:\n";
    std::cerr << std::to_string(od::stacktrace::current()) << '\n';
}
} // namespace

void od::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void od::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

od::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

od::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

OD_COLD_FUNC void od::impl::handle_assert_failure(char const* expression, char const* message, od::source_location location)
{
    assertion_info const info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // abort happens at the call site
}

bool od::impl::is_debugger_connected() noexcept
{
#ifdef OD_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(OD_OS_LINUX)
    // TracerPid is non-zero while a debugger is attached
    if (auto* f = std::fopen("/proc/self/status", "r"))
    {
        char buf[1024];
        while (std::fgets(buf, sizeof(buf), f))
        {
            if (std::strncmp(buf, "TracerPid:", 10) == 0)
            {
                int pid = 0;
                std::sscanf(buf + 10, "%d", &pid);
                std::fclose(f);
                return pid != 0;
            }
        }
        std::fclose(f);
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void od::impl::perform_abort() noexcept
{
    std::abort();
}
