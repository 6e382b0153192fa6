#pragma once

/*******************************************************************************
 * @file lifecycle.hpp
 * @brief Dependency-aware application lifecycle management.
 *
 * Modules (Logger, AccessConfig, LockingPolicy, ...) describe themselves with a
 * `ModuleDef`: a name, the modules they depend on, and startup/shutdown callbacks.
 * `LifecycleManager` starts them in topological order and shuts them down in
 * reverse order, each shutdown bounded by the module's timeout.
 *
 * Typical use is a single `LifecycleGuard` at the top of `main()`:
 *
 * @code
 *   int main()
 *   {
 *       h5share::utils::LifecycleGuard guard(h5share::utils::MakeModDefList(
 *           h5share::utils::Logger::GetLifecycleModule(),
 *           h5share::utils::AccessConfig::GetLifecycleModule(),
 *           h5share::utils::LockingPolicy::GetLifecycleModule()));
 *       ...
 *   } // modules shut down here
 * @endcode
 *
 * Registration after initialization, duplicate names, unknown dependencies and
 * dependency cycles are programming errors and abort the process.
 ******************************************************************************/
#include "hsh_base.hpp"
#include "h5share_utils_export.h"

#include <atomic>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace h5share::utils
{

class LifecycleManagerImpl;

/**
 * @brief Collects ModuleDef rvalues into a vector (ModuleDef is move-only, so an
 *        initializer list cannot be used).
 */
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList: all arguments must be ModuleDef (rvalues or prvalues)");

    std::vector<ModuleDef> modules;
    modules.reserve(sizeof...(mods));
    (modules.emplace_back(std::forward<Mods>(mods)), ...);
    return modules;
}

class H5SHARE_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /**
     * @brief Registers a module. Must happen before initialize().
     */
    void register_module(ModuleDef &&module_def);

    /**
     * @brief Builds the dependency graph and runs every startup callback. Idempotent.
     */
    void initialize(std::source_location loc);

    /**
     * @brief Runs every shutdown callback in reverse startup order. Idempotent.
     */
    void finalize(std::source_location loc);

    [[nodiscard]] bool is_initialized();
    [[nodiscard]] bool is_finalized();

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

  private:
    LifecycleManager();
    ~LifecycleManager();

    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

inline void RegisterModule(ModuleDef &&module_def)
{
    LifecycleManager::instance().register_module(std::move(module_def));
}

inline bool IsAppInitialized()
{
    return LifecycleManager::instance().is_initialized();
}

inline bool IsAppFinalized()
{
    return LifecycleManager::instance().is_finalized();
}

inline void InitializeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().initialize(loc);
}

inline void FinalizeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().finalize(loc);
}

/**
 * @class LifecycleGuard
 * @brief RAII owner of the application lifecycle.
 *
 * The first guard constructed in a process registers its modules, initializes the
 * application and finalizes it on destruction. Any later guard is a no-op and its
 * modules are ignored.
 */
class LifecycleGuard
{
  private:
    std::source_location m_loc;

  public:
    LifecycleGuard(std::source_location loc = std::source_location::current()) : m_loc(loc)
    {
        H5SHARE_DEBUG("[H5S_LifeCycle] LifecycleGuard constructed in function {} with no "
                      "modules. ({}:{})",
                      m_loc.function_name(),
                      h5share::format_tools::filename_only(m_loc.file_name()), m_loc.line());
        init_owner_if_first({});
    }

    explicit LifecycleGuard(ModuleDef &&module,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        H5SHARE_DEBUG("[H5S_LifeCycle] LifecycleGuard constructed in function {}. ({}:{})",
                      m_loc.function_name(),
                      h5share::format_tools::filename_only(m_loc.file_name()), m_loc.line());
        std::vector<ModuleDef> modules;
        modules.emplace_back(std::move(module));
        init_owner_if_first(std::move(modules));
    }

    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        H5SHARE_DEBUG("[H5S_LifeCycle] LifecycleGuard constructed in function {}. ({}:{})",
                      m_loc.function_name(),
                      h5share::format_tools::filename_only(m_loc.file_name()), m_loc.line());
        init_owner_if_first(std::move(modules));
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
        {
            H5SHARE_DEBUG("[H5S_LifeCycle] LifecycleGuard is being destructed as owner. "
                          "Constructor was located in function {}. ({}:{})",
                          m_loc.function_name(),
                          h5share::format_tools::filename_only(m_loc.file_name()), m_loc.line());
            h5share::utils::FinalizeApp(m_loc);
        }
    }

    [[nodiscard]] bool is_owner() const noexcept { return m_is_owner; }

  private:
    static std::atomic_bool &owner_flag()
    {
        static std::atomic_bool flag{false};
        return flag;
    }

    void init_owner_if_first(std::vector<ModuleDef> &&modules)
    {
        bool expected = false;
        if (owner_flag().compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        {
            m_is_owner = true;
            for (auto &m : modules)
            {
                h5share::utils::RegisterModule(std::move(m));
            }
            h5share::utils::InitializeApp(m_loc);
        }
        else
        {
            m_is_owner = false;
            H5SHARE_DEBUG("[H5S_LifeCycle] [{}:{}] WARNING: LifecycleGuard constructed but an "
                          "owner already exists. This guard is a no-op; provided modules (if "
                          "any) were ignored. Constructor was located in function {}. ({}:{}).",
                          h5share::platform::get_executable_name(), h5share::platform::get_pid(),
                          m_loc.function_name(),
                          h5share::format_tools::filename_only(m_loc.file_name()), m_loc.line());
        }
    }

    bool m_is_owner{false};
};

} // namespace h5share::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
