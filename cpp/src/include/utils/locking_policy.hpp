#pragma once
/**
 * @file locking_policy.hpp
 * @brief Process-wide bookkeeping of the HDF5 advisory file locking setting.
 *
 * HDF5 decides whether to take OS-level advisory locks from the environment
 * variable `HDF5_USE_FILE_LOCKING`. That variable is a single per-process setting,
 * so it must not change while files opened under the previous value are still open.
 *
 * `LockingPolicy` tracks the number of open HDF5 handles and the policy they were
 * opened under:
 *
 * - First open of a sequence (open count 0): the current environment value is
 *   captured as the restore point, then the requested policy is written.
 * - Later opens: a request equal to the active policy is a no-op; a different one
 *   throws `h5::ConfigurationConflictError`.
 * - Last close: the environment is put back exactly as it was captured.
 *
 * One mutex covers the policy request, the open itself and the count update, so no
 * other thread can change the environment between a request and its open.
 * Lock order: this mutex first, then the HDF5 library mutex.
 *
 * Cross-process coordination of the variable is not attempted; each process only
 * keeps its own environment consistent.
 */
#include "hsh_base.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace h5share::utils
{

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

/// Name of the environment variable HDF5 reads.
inline constexpr const char *kFileLockingEnvVar = "HDF5_USE_FILE_LOCKING";

/**
 * @brief Interprets an `HDF5_USE_FILE_LOCKING` value.
 * @return nullopt for an absent variable; true for "TRUE", "1", "BEST_EFFORT"
 *         (case-insensitive); false for anything else.
 */
H5SHARE_UTILS_EXPORT std::optional<bool>
parse_locking_value(const std::optional<std::string> &raw) noexcept;

/// Spelling written to the environment: "TRUE", "FALSE", or nullopt (unset).
H5SHARE_UTILS_EXPORT std::optional<std::string> locking_value_string(std::optional<bool> enable);

class H5SHARE_UTILS_EXPORT LockingPolicy
{
  public:
    /**
     * @brief Returns the ModuleDef for use with LifecycleGuard.
     * Dependencies: Logger, AccessConfig.
     */
    static ModuleDef GetLifecycleModule();

    static bool lifecycle_initialized() noexcept;

    /**
     * @brief Identifies the current module session. It changes at every shutdown,
     *        which forgets the handles still counted.
     */
    static std::uint64_t session() noexcept;

    /**
     * @brief Returns the process-wide instance.
     * @pre The lifecycle module is started (panics otherwise).
     */
    static LockingPolicy &instance();

    LockingPolicy(const LockingPolicy &) = delete;
    LockingPolicy &operator=(const LockingPolicy &) = delete;

    /**
     * @brief Applies `enable` as the active policy.
     *
     * With no handle open the environment is captured and overwritten. With handles
     * open a matching request is a no-op.
     * @throws h5::ConfigurationConflictError if handles are open under another policy.
     */
    void request_locking_enabled(std::optional<bool> enable);

    /**
     * @brief Requests `enable`, runs `open_fn` and counts one more open handle, all
     *        under the policy mutex.
     *
     * If `open_fn` throws, nothing is counted and, when no other handle is open, the
     * environment is put back to what it was before this call: the captured restore
     * point if this call captured it, else the value of an earlier standalone request.
     */
    void run_open(std::optional<bool> enable, const std::function<void()> &open_fn);

    /**
     * @brief Runs `close_fn` and counts one handle less. At zero the captured
     *        environment is restored.
     *
     * The count is decremented even if `close_fn` throws; the exception is rethrown
     * afterwards.
     */
    void release_one(const std::function<void()> &close_fn);

    /// Number of currently open handles.
    [[nodiscard]] std::size_t open_count() const;

    /// Policy the open handles were opened under (the ambient value when none are open).
    [[nodiscard]] std::optional<bool> locking_enabled() const;

    /// Current value of the environment variable, interpreted.
    [[nodiscard]] std::optional<bool> ambient_setting() const;

  private:
    LockingPolicy();
    ~LockingPolicy();

    /// Returns true if this request captured the restore point.
    bool request_locked(std::optional<bool> enable);
    void restore_locked();
    void shutdown_();

    friend void do_locking_policy_startup(const char *);
    friend void do_locking_policy_shutdown(const char *);

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

} // namespace h5share::utils
