#pragma once
/**
 * @file hsh_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * Every file that needs platform macros (H5SHARE_PLATFORM_WIN64, H5SHARE_IS_POSIX, etc.)
 * should include this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_WIN64, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "h5share_utils_export.h"

#if defined(PLATFORM_WIN64) || (!defined(PLATFORM_LINUX) && !defined(PLATFORM_APPLE) && defined(_WIN64))

#define H5SHARE_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#elif defined(PLATFORM_APPLE) || (!defined(PLATFORM_LINUX) && defined(__APPLE__) && defined(__MACH__))

#define H5SHARE_PLATFORM_APPLE 1

#elif defined(PLATFORM_LINUX) || defined(__linux__)

#define H5SHARE_PLATFORM_LINUX 1

#else

#define H5SHARE_PLATFORM_UNKNOWN 1

#endif

#if defined(H5SHARE_PLATFORM_WIN64)
#define H5SHARE_IS_WINDOWS 1
#define H5SHARE_IS_POSIX 0
#else
#define H5SHARE_IS_WINDOWS 0
#define H5SHARE_IS_POSIX 1
#endif

namespace h5share::platform
{

/// @brief Returns the current process id.
H5SHARE_UTILS_EXPORT long get_pid() noexcept;

/// @brief Returns the name of the running executable, or "unknown" if it cannot be determined.
H5SHARE_UTILS_EXPORT std::string get_executable_name() noexcept;

/// @brief Returns the native id of the calling thread.
H5SHARE_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Reads an environment variable.
 * @return The value, or std::nullopt when the variable is not set.
 */
H5SHARE_UTILS_EXPORT std::optional<std::string> get_env(const char *name);

/**
 * @brief Sets (value present) or removes (std::nullopt) an environment variable.
 *
 * Not synchronized with concurrent getenv() calls in other threads; callers that
 * share a variable across threads must serialize access themselves.
 *
 * @return `true` on success.
 */
H5SHARE_UTILS_EXPORT bool set_env(const char *name, const std::optional<std::string> &value) noexcept;

} // namespace h5share::platform
