/**
 * @file debug_info.cpp
 * @brief Stack trace printing for panic reports.
 *
 * POSIX builds walk the stack with `backtrace` and resolve symbols through `dladdr`
 * and the C++ ABI demangler. Other platforms print a notice only.
 */
#include "hsh_base.hpp"

#include <cstdint>
#include <vector>

#if H5SHARE_IS_POSIX
#include <cxxabi.h>   // For __cxa_demangle
#include <dlfcn.h>    // For dladdr
#include <execinfo.h> // For backtrace
#endif

namespace h5share::debug
{

namespace
{

// Writing with fmt may throw on allocation failure; a stack trace must never throw.
template <typename... Args>
void safe_format_to_stderr(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, fmt_str, std::forward<Args>(args)...);
    }
    catch (...)
    {
        std::fputs("[stack trace formatting failed]\n", stderr);
    }
}

#if H5SHARE_IS_POSIX
std::string demangle(const char *symbol)
{
    if (symbol == nullptr)
        return "??";
    int status = 0;
    char *dem = abi::__cxa_demangle(symbol, nullptr, nullptr, &status);
    if (status == 0 && dem != nullptr)
    {
        std::string out(dem);
        std::free(dem);
        return out;
    }
    return symbol;
}
#endif

} // namespace

void print_stack_trace() noexcept
{
    safe_format_to_stderr("Stack Trace (most recent call first):\n");
#if H5SHARE_IS_POSIX
    constexpr int kMaxFrames = 128;
    void *callstack[kMaxFrames];
    const int nframes = backtrace(callstack, kMaxFrames);
    if (nframes <= 0)
    {
        safe_format_to_stderr("  [No stack frames available]\n");
        return;
    }

    // Frame 0 is this function.
    for (int i = 1; i < nframes; ++i)
    {
        const auto addr = reinterpret_cast<uintptr_t>(callstack[i]);
        Dl_info dlinfo;
        if (dladdr(callstack[i], &dlinfo) != 0)
        {
            const auto base = reinterpret_cast<uintptr_t>(dlinfo.dli_fbase);
            try
            {
                safe_format_to_stderr(
                    "  #{:<3} {} ({}+0x{:x})\n", i, demangle(dlinfo.dli_sname),
                    dlinfo.dli_fname ? format_tools::filename_only(dlinfo.dli_fname)
                                     : std::string_view("??"),
                    addr - base);
            }
            catch (...)
            {
                safe_format_to_stderr("  #{:<3} 0x{:x}\n", i, addr);
            }
        }
        else
        {
            safe_format_to_stderr("  #{:<3} 0x{:x}\n", i, addr);
        }
    }
#else
    safe_format_to_stderr("  [stack trace not supported on this platform]\n");
#endif
    std::fflush(stderr);
}

} // namespace h5share::debug
