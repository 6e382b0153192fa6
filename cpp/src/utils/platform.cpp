/**
 * @file platform.cpp
 * @brief Cross-platform implementations for the `h5share::platform` utilities:
 *        process and thread ids, executable name and environment access.
 */
#include "hsh_base.hpp"

#include <cstdlib>
#include <thread>
#include <vector>

#if H5SHARE_IS_POSIX
#include <climits>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#if defined(H5SHARE_PLATFORM_APPLE)
#include <mach-o/dyld.h> // _NSGetExecutablePath
#endif

namespace h5share::platform
{

long get_pid() noexcept
{
#if defined(H5SHARE_PLATFORM_WIN64)
    return static_cast<long>(GetCurrentProcessId());
#else
    return static_cast<long>(getpid());
#endif
}

uint64_t get_native_thread_id() noexcept
{
#if defined(H5SHARE_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(H5SHARE_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(H5SHARE_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string get_executable_name() noexcept
{
    try
    {
        std::string full_path;
#if defined(H5SHARE_PLATFORM_WIN64)
        std::vector<char> buf(MAX_PATH);
        DWORD len = GetModuleFileNameA(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
        if (len == 0)
        {
            return "unknown_win";
        }
        full_path.assign(buf.data(), len);
#elif defined(H5SHARE_PLATFORM_LINUX)
        std::vector<char> buf(PATH_MAX);
        ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
        {
            return "unknown_linux";
        }
        full_path.assign(buf.data(), static_cast<size_t>(count));
#elif defined(H5SHARE_PLATFORM_APPLE)
        uint32_t size = 0;
        if (_NSGetExecutablePath(nullptr, &size) == -1 && size > 0)
        {
            std::vector<char> buf(size);
            if (_NSGetExecutablePath(buf.data(), &size) == 0)
            {
                full_path = buf.data();
            }
        }
        if (full_path.empty())
        {
            return "unknown_macos";
        }
#else
        return "unknown";
#endif
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    return "unknown";
}

std::optional<std::string> get_env(const char *name)
{
    if (name == nullptr)
        return std::nullopt;
    const char *value = std::getenv(name);
    if (value == nullptr)
        return std::nullopt;
    return std::string(value);
}

bool set_env(const char *name, const std::optional<std::string> &value) noexcept
{
    if (name == nullptr)
        return false;
#if defined(H5SHARE_PLATFORM_WIN64)
    // An empty value removes the variable on Windows.
    return _putenv_s(name, value ? value->c_str() : "") == 0;
#else
    if (value)
        return ::setenv(name, value->c_str(), 1) == 0;
    return ::unsetenv(name) == 0;
#endif
}

} // namespace h5share::platform
