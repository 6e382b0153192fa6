/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Command-Queue Pattern**
 * 1.  Calls from application threads (`LOGGER_INFO(...)`) format the message and
 *     push a command onto a queue. Formatting happens on the caller's thread; I/O
 *     never does.
 * 2.  A single worker thread is the sole consumer of the queue. It writes to the
 *     active sink and applies control commands (sink switch, flush) in order.
 * 3.  `Sink` is the destination interface; `ConsoleSink` (stderr) and `FileSink`
 *     are provided.
 * 4.  The queue is bounded. Past the limit log messages are dropped and counted;
 *     the worker reports the number of dropped messages once the backlog clears.
 *
 * **Lifecycle**
 * The Logger is a lifecycle module (`Logger::GetLifecycleModule()`). Calling a
 * configuration method before the module has started is a programming error and
 * panics. Log calls made before startup or after shutdown are discarded.
 *
 * **Usage**
 * ```cpp
 * LOGGER_INFO("opened '{}' in mode {}", path, mode);
 *
 * auto &logger = h5share::utils::Logger::instance();
 * logger.set_logfile("/tmp/h5share.log");
 * logger.set_level(h5share::utils::Logger::Level::L_DEBUG);
 * ```
 ******************************************************************************/
#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "h5share_utils_export.h"
#include "utils/module_def.hpp"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (256u)
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace h5share::utils
{

class H5SHARE_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    /**
     * @brief Returns the ModuleDef to register the Logger with the LifecycleManager.
     */
    static ModuleDef GetLifecycleModule();

    /// @brief True once the lifecycle module has been started (stays true after shutdown).
    static bool lifecycle_initialized() noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    // --- Sinks ---
    // Sink switches are executed by the worker thread; these calls block until the
    // switch has been applied and report whether it succeeded.

    /// @brief Switch logging to the console (stderr).
    bool set_console();

    /**
     * @brief Switch logging to a file (created if missing, appended otherwise).
     * @param use_flock Wrap each write in an advisory lock (POSIX).
     */
    bool set_logfile(const std::filesystem::path &path, bool use_flock = false);

    /// @brief Blocks until all messages queued before this call have been written.
    void flush();

    /// @brief Drains the queue and stops the worker. Called by the lifecycle module.
    void shutdown();

    // --- Configuration & Diagnostics ---
    void set_level(Level lvl);
    Level level() const;

    void set_max_queue_size(size_t max_size);
    size_t get_max_queue_size() const;

    /// @brief Number of log messages dropped because the queue was full.
    size_t get_total_dropped() const;

    /**
     * @brief Parses "trace", "debug", "info", "warn"/"warning", "error", "system"
     *        (case-insensitive).
     */
    static std::optional<Level> parse_level(std::string_view name) noexcept;

    // --- Formatting API ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    bool should_log(Level lvl) const noexcept;

  private:
    Logger();
    ~Logger();

    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;

    friend void do_logger_startup(const char *);
    friend void do_logger_shutdown(const char *);

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            fmt::memory_buffer mb;
            fmt::format_to(std::back_inserter(mb), "[FORMAT ERROR] {}", ex.what());
            enqueue_log(lvl, std::move(mb));
        }
    }
}

} // namespace h5share::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::h5share::utils::Logger::instance().log_fmt<::h5share::utils::Logger::Level::L_TRACE>(        \
        fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::h5share::utils::Logger::instance().log_fmt<::h5share::utils::Logger::Level::L_DEBUG>(        \
        fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::h5share::utils::Logger::instance().log_fmt<::h5share::utils::Logger::Level::L_INFO>(         \
        fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::h5share::utils::Logger::instance().log_fmt<::h5share::utils::Logger::Level::L_WARNING>(      \
        fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::h5share::utils::Logger::instance().log_fmt<::h5share::utils::Logger::Level::L_ERROR>(        \
        fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::h5share::utils::Logger::instance().log_fmt<::h5share::utils::Logger::Level::L_SYSTEM>(       \
        fmt __VA_OPT__(, ) __VA_ARGS__)
