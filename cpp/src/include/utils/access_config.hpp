#pragma once

/**
 * @file access_config.hpp
 * @brief AccessConfig: process-wide defaults for retries, logging and file options.
 *
 * ## Lifecycle
 *
 * @code
 *   LifecycleGuard lifecycle(MakeModDefList(
 *       Logger::GetLifecycleModule(),
 *       AccessConfig::GetLifecycleModule(),
 *       LockingPolicy::GetLifecycleModule()));
 * @endcode
 *
 * Startup order: `Logger → AccessConfig → LockingPolicy`
 *
 * ## Config loading (priority low → high)
 *
 *  1. Built-in defaults (10 ms retry period, no timeout, level "info", console
 *     logging, creation-order tracking on)
 *  2. A JSON file: the path given to `set_config_path()`, otherwise the file named
 *     by `H5SHARE_CONFIG_FILE`. A missing or malformed file is logged and ignored.
 *  3. `H5SHARE_RETRY_PERIOD_MS`, `H5SHARE_RETRY_TIMEOUT_MS` ("none" or a negative
 *     value = no timeout), `H5SHARE_LOG_LEVEL`
 *
 * ## JSON keys
 *
 * @code{.json}
 *   {
 *     "retry":   { "period_ms": 10, "timeout_ms": null },
 *     "logging": { "level": "info", "file": "/var/log/h5share.log" },
 *     "file":    { "track_order": true }
 *   }
 * @endcode
 */

#include "hsh_base.hpp"
#include "h5/file_options.hpp"
#include "utils/retry.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace h5share::utils
{

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

/**
 * @class AccessConfig
 * @brief Singleton lifecycle module holding resolved access defaults.
 *
 * Values are resolved once at startup and are read-only afterwards, so the getters
 * take no lock.
 */
class H5SHARE_UTILS_EXPORT AccessConfig
{
  public:
    /**
     * @brief Overrides the config file path. Must be called before the module starts.
     *        An empty path restores the `H5SHARE_CONFIG_FILE` lookup.
     */
    static void set_config_path(const std::filesystem::path &path);

    /**
     * @brief Returns the ModuleDef for use with LifecycleGuard.
     * Dependencies: Logger.
     */
    static ModuleDef GetLifecycleModule();

    /// True between module startup and shutdown.
    static bool lifecycle_initialized() noexcept;

    /**
     * @brief Returns the global instance.
     * @pre The lifecycle module is started (panics otherwise).
     */
    static AccessConfig &get_instance();

    /// Default retry policy for operations that do not pass their own.
    const RetryPolicy &retry_policy() const noexcept;

    /// Default options for `File::open` (mode read, everything else unresolved).
    h5::FileOptions default_file_options() const;

    const std::string &log_level() const noexcept;

    /// Empty when logging stays on the console.
    const std::filesystem::path &log_file() const noexcept;

    /// The file the values were loaded from; empty when only defaults/env were used.
    const std::filesystem::path &source_file() const noexcept;

    AccessConfig(const AccessConfig &) = delete;
    AccessConfig &operator=(const AccessConfig &) = delete;

  private:
    AccessConfig();
    ~AccessConfig();

    void load_(const std::filesystem::path &override_path);

    friend void do_access_config_startup(const char *);
    friend void do_access_config_shutdown(const char *);

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

} // namespace h5share::utils
