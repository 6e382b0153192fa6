#include "hsh_service.hpp"
#include "h5/errors.hpp"
#include "utils/locking_policy.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>

namespace h5share::utils
{

static std::atomic<bool> g_locking_policy_initialized{false};
// Bumped at every shutdown; handles opened in an earlier session are no longer counted.
static std::atomic<std::uint64_t> g_locking_policy_session{0};

std::optional<bool> parse_locking_value(const std::optional<std::string> &raw) noexcept
{
    if (!raw)
        return std::nullopt;
    const auto v = format_tools::trim(*raw);
    return format_tools::iequals(v, "TRUE") || v == "1" || format_tools::iequals(v, "BEST_EFFORT");
}

std::optional<std::string> locking_value_string(std::optional<bool> enable)
{
    if (!enable)
        return std::nullopt;
    return std::string(*enable ? "TRUE" : "FALSE");
}

namespace
{
std::string describe(std::optional<bool> v)
{
    return v ? (*v ? "enabled" : "disabled") : "unset";
}

void write_env(const std::optional<std::string> &value)
{
    if (!platform::set_env(kFileLockingEnvVar, value))
    {
        throw std::runtime_error(fmt::format("cannot update environment variable {}",
                                             kFileLockingEnvVar));
    }
}
} // namespace

struct LockingPolicy::Impl
{
    mutable std::mutex mu;
    std::size_t open_count{0};
    std::optional<bool> active{};
    /// Raw environment value before the first request of the current sequence.
    std::optional<std::string> restore_point{};
    bool has_restore_point{false};
};

LockingPolicy::LockingPolicy() : pImpl(std::make_unique<Impl>()) {}
LockingPolicy::~LockingPolicy() = default;

bool LockingPolicy::lifecycle_initialized() noexcept
{
    return g_locking_policy_initialized.load(std::memory_order_acquire);
}

LockingPolicy &LockingPolicy::instance()
{
    if (!lifecycle_initialized())
    {
        H5SHARE_PANIC("LockingPolicy used before the LockingPolicy module was initialized "
                      "via LifecycleManager. Aborting.");
    }
    static LockingPolicy policy;
    return policy;
}

std::uint64_t LockingPolicy::session() noexcept
{
    return g_locking_policy_session.load(std::memory_order_acquire);
}

bool LockingPolicy::request_locked(std::optional<bool> enable)
{
    if (pImpl->open_count == 0)
    {
        bool captured = false;
        // A request without a following open keeps the original restore point.
        if (!pImpl->has_restore_point)
        {
            pImpl->restore_point = platform::get_env(kFileLockingEnvVar);
            pImpl->has_restore_point = true;
            captured = true;
        }
        write_env(locking_value_string(enable));
        pImpl->active = enable;
        LOGGER_DEBUG("LockingPolicy: file locking {} (was {})", describe(enable),
                     describe(parse_locking_value(pImpl->restore_point)));
        return captured;
    }
    if (enable != pImpl->active)
    {
        throw h5::ConfigurationConflictError(fmt::format(
            "file locking is {} for {} open HDF5 file(s) and cannot be {}; close all open "
            "HDF5 files before changing the locking policy",
            describe(pImpl->active), pImpl->open_count, describe(enable)));
    }
    return false;
}

void LockingPolicy::restore_locked()
{
    if (!pImpl->has_restore_point)
        return;
    write_env(pImpl->restore_point);
    pImpl->active = parse_locking_value(pImpl->restore_point);
    LOGGER_DEBUG("LockingPolicy: file locking restored to {}", describe(pImpl->active));
    pImpl->restore_point.reset();
    pImpl->has_restore_point = false;
}

void LockingPolicy::request_locking_enabled(std::optional<bool> enable)
{
    std::lock_guard lock(pImpl->mu);
    request_locked(enable);
}

void LockingPolicy::run_open(std::optional<bool> enable, const std::function<void()> &open_fn)
{
    std::lock_guard lock(pImpl->mu);
    const bool idle = pImpl->open_count == 0;
    const auto previous_env = platform::get_env(kFileLockingEnvVar);
    const auto previous_active = pImpl->active;
    const bool captured = request_locked(enable);
    try
    {
        open_fn();
    }
    catch (...)
    {
        // Undo only this call: an earlier standalone request keeps its value and
        // its restore point.
        if (idle && captured)
        {
            restore_locked();
        }
        else if (idle)
        {
            write_env(previous_env);
            pImpl->active = previous_active;
        }
        throw;
    }
    ++pImpl->open_count;
}

void LockingPolicy::release_one(const std::function<void()> &close_fn)
{
    std::lock_guard lock(pImpl->mu);
    if (pImpl->open_count == 0)
    {
        H5SHARE_PANIC("LockingPolicy::release_one() without a matching open");
    }
    std::exception_ptr close_error;
    try
    {
        close_fn();
    }
    catch (...)
    {
        close_error = std::current_exception();
    }
    if (--pImpl->open_count == 0)
        restore_locked();
    if (close_error)
        std::rethrow_exception(close_error);
}

std::size_t LockingPolicy::open_count() const
{
    std::lock_guard lock(pImpl->mu);
    return pImpl->open_count;
}

std::optional<bool> LockingPolicy::locking_enabled() const
{
    std::lock_guard lock(pImpl->mu);
    if (pImpl->open_count == 0)
        return parse_locking_value(platform::get_env(kFileLockingEnvVar));
    return pImpl->active;
}

std::optional<bool> LockingPolicy::ambient_setting() const
{
    std::lock_guard lock(pImpl->mu);
    return parse_locking_value(platform::get_env(kFileLockingEnvVar));
}

void LockingPolicy::shutdown_()
{
    std::lock_guard lock(pImpl->mu);
    if (pImpl->open_count > 0)
    {
        LOGGER_WARN("LockingPolicy: shutting down with {} HDF5 file(s) still open; restoring {}",
                    pImpl->open_count, kFileLockingEnvVar);
        pImpl->open_count = 0;
    }
    try
    {
        restore_locked();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("LockingPolicy: restore at shutdown failed: {}", e.what());
    }
    g_locking_policy_session.fetch_add(1, std::memory_order_acq_rel);
}

// ---------------------------------------------------------------------------
// Lifecycle startup / shutdown
// ---------------------------------------------------------------------------

void do_locking_policy_startup(const char * /*arg*/)
{
    g_locking_policy_initialized.store(true, std::memory_order_release);
    LOGGER_DEBUG("LockingPolicy: ambient {} = {}", kFileLockingEnvVar,
                 platform::get_env(kFileLockingEnvVar).value_or("<unset>"));
}

void do_locking_policy_shutdown(const char * /*arg*/)
{
    if (!g_locking_policy_initialized.load(std::memory_order_acquire))
        return;
    LockingPolicy::instance().shutdown_();
    g_locking_policy_initialized.store(false, std::memory_order_release);
}

ModuleDef LockingPolicy::GetLifecycleModule()
{
    ModuleDef module("h5share::utils::LockingPolicy");
    module.add_dependency("h5share::utils::Logger");
    module.add_dependency("h5share::utils::AccessConfig");
    module.set_startup(&do_locking_policy_startup);
    module.set_shutdown(&do_locking_policy_shutdown, std::chrono::milliseconds(500));
    return module;
}

} // namespace h5share::utils
