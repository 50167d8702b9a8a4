#include "assert.hh"

#include <enum-set/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>

#ifdef ES_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
using assertion_handler = std::move_only_function<void(es::impl::assertion_info const&)>;

// innermost scoped_assertion_handler is at the back
std::vector<assertion_handler> g_handlers;

void report_to_stderr(es::impl::assertion_info const& info)
{
    std::cerr << "enum-set assertion failed: " << info.expression << '\n'
              << "  " << info.message << '\n'
              << "  at " << info.location.file_name() << ':' << info.location.line() << " in "
              << info.location.function_name() << std::endl;
}
} // namespace

es::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    g_handlers.push_back(std::move(handler));
}

es::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    g_handlers.pop_back();
}

ES_COLD_FUNC void es::impl::handle_assert_failure(char const* expression, char const* message, es::source_location location)
{
    assertion_info const info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    if (g_handlers.empty())
        report_to_stderr(info);
    else
        g_handlers.back()(info);
}

bool es::impl::is_debugger_connected() noexcept
{
#ifdef ES_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(ES_OS_LINUX)
    // "TracerPid:\t<pid>" is non-zero while a debugger is attached
    auto* const status = std::fopen("/proc/self/status", "r");
    if (!status)
        return false;

    auto traced = false;
    char line[256];
    while (std::fgets(line, sizeof(line), status))
    {
        if (std::strncmp(line, "TracerPid:", 10) == 0)
        {
            traced = std::atoi(line + 10) != 0;
            break;
        }
    }
    std::fclose(status);
    return traced;
#else
    return false;
#endif
}

[[noreturn]] void es::impl::perform_abort() noexcept
{
    std::abort();
}
