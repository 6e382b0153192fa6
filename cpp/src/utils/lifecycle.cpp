/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Implementation of the dependency-aware application lifecycle manager.
 *
 * @see include/utils/lifecycle.hpp
 *
 * **Implementation Details**
 *
 * 1.  **Pimpl Classes (`ModuleDefImpl`, `LifecycleManagerImpl`)** hide the STL
 *     containers from the exported ABI.
 *
 * 2.  **Two-Phase Initialization**: modules are collected under
 *     `m_registry_mutex`; the first `initialize()` orders them (Kahn's algorithm,
 *     ties broken by registration order) and runs the startup callbacks.
 *
 * 3.  **Timed Shutdown**: every shutdown callback runs on its own thread with a
 *     real deadline (thread + flag + poll + detach). `std::async` is not used
 *     because the destructor of its future blocks even after `wait_for` reports
 *     a timeout. A hung module is abandoned and finalization continues.
 ******************************************************************************/
#include "hsh_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/module_def.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace h5share::platform;

namespace
{

void validate_module_name(std::string_view name, const char *param_name)
{
    if (name.empty())
    {
        throw std::invalid_argument(std::string("Lifecycle: ") + param_name +
                                    " must not be empty.");
    }
    if (name.size() > h5share::utils::ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(std::string("Lifecycle: ") + param_name + " exceeds maximum of " +
                                std::to_string(h5share::utils::ModuleDef::MAX_MODULE_NAME_LEN) +
                                " characters.");
    }
}

void validate_callback_arg(std::string_view arg)
{
    if (arg.size() > h5share::utils::ModuleDef::MAX_CALLBACK_PARAM_STRLEN)
    {
        throw std::length_error("Lifecycle: callback argument exceeds maximum of " +
                                std::to_string(h5share::utils::ModuleDef::MAX_CALLBACK_PARAM_STRLEN) +
                                " characters.");
    }
}

// Result of one module's shutdown callback.
struct ShutdownResult
{
    enum class Status
    {
        Done,
        Threw,
        TimedOut
    };
    Status status{Status::Done};
    std::string error;
};

// Lives as long as the thread running the callback, which may outlive the
// caller when the callback hangs and the thread is detached.
struct ShutdownCall
{
    explicit ShutdownCall(std::function<void()> f) : func(std::move(f)) {}
    std::function<void()> func;
    std::atomic<bool> done{false};
    std::exception_ptr error;
};

std::string describe_exception(const std::exception_ptr &ep)
{
    try
    {
        std::rethrow_exception(ep);
    }
    catch (const std::exception &e)
    {
        return e.what();
    }
    catch (...)
    {
        return "unknown exception";
    }
}

// Runs `func` on its own thread. A zero timeout waits without bound.
ShutdownResult run_shutdown_callback(std::function<void()> func, std::chrono::milliseconds timeout)
{
    using Status = ShutdownResult::Status;
    if (!func)
        return {};

    auto call = std::make_shared<ShutdownCall>(std::move(func));
    std::thread worker(
        [call]
        {
            try
            {
                call->func();
            }
            catch (...)
            {
                call->error = std::current_exception();
            }
            call->done.store(true, std::memory_order_release);
        });

    const auto give_up_at = std::chrono::steady_clock::now() + timeout;
    for (;;)
    {
        if (call->done.load(std::memory_order_acquire))
            break;
        if (timeout.count() > 0 && std::chrono::steady_clock::now() >= give_up_at)
        {
            worker.detach();
            return {Status::TimedOut, {}};
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    worker.join();

    if (call->error)
        return {Status::Threw, describe_exception(call->error)};
    return {};
}

} // namespace

namespace h5share::utils
{

namespace
{
struct InternalModuleShutdownDef
{
    std::function<void()> func;
    std::chrono::milliseconds timeout{0};
};

struct InternalModuleDef
{
    std::string name;
    std::vector<std::string> dependencies;
    std::function<void()> startup;
    InternalModuleShutdownDef shutdown;
};
} // namespace

// ============================================================================
// ModuleDef (Pimpl forwarding)
// ============================================================================

class ModuleDefImpl
{
  public:
    InternalModuleDef def;
};

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    validate_module_name(name, "module name");
    pImpl->def.name = std::string(name);
}

ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (!pImpl || dependency_name.empty())
        return;
    validate_module_name(dependency_name, "dependency name");
    pImpl->def.dependencies.emplace_back(dependency_name);
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    if (pImpl && startup_func)
    {
        pImpl->def.startup = [startup_func]() { startup_func(nullptr); };
    }
}

void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    validate_callback_arg(arg);
    if (pImpl && startup_func)
    {
        pImpl->def.startup = [startup_func, a = std::string(arg)]() { startup_func(a.c_str()); };
    }
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    if (pImpl && shutdown_func)
    {
        pImpl->def.shutdown.func = [shutdown_func]() { shutdown_func(nullptr); };
        pImpl->def.shutdown.timeout = timeout;
    }
}

// ============================================================================
// LifecycleManagerImpl
// ============================================================================

class LifecycleManagerImpl
{
  public:
    LifecycleManagerImpl() : m_pid(get_pid()), m_app_name(get_executable_name()) {}

    void registerModule(InternalModuleDef module_def)
    {
        if (m_is_initialized.load(std::memory_order_acquire))
        {
            H5SHARE_PANIC("[h5share-lifecycle] [{}:{}] Attempted to register module '{}' after "
                          "initialization has started.",
                          m_app_name, m_pid, module_def.name);
        }
        std::lock_guard<std::mutex> lock(m_registry_mutex);
        m_modules.push_back(std::move(module_def));
    }

    void initialize(std::source_location loc)
    {
        if (m_is_initialized.exchange(true, std::memory_order_acq_rel))
            return;

        H5SHARE_DEBUG("[h5share-lifecycle] [{}:{}] Initializing application from {}",
                      m_app_name, m_pid, h5share::debug::srcloc_to_str(loc));
        (void)loc;

        {
            std::lock_guard<std::mutex> lock(m_registry_mutex);
            try
            {
                m_order = resolveStartupOrder();
            }
            catch (const std::runtime_error &e)
            {
                H5SHARE_PANIC("[h5share-lifecycle] [{}:{}] Lifecycle dependency error: {}",
                              m_app_name, m_pid, e.what());
            }
        }

        const std::size_t total = m_order.size();
        for (std::size_t pos = 0; pos < total; ++pos)
        {
            InternalModuleDef &module = m_modules[m_order[pos]];
            H5SHARE_DEBUG("[h5share-lifecycle] [{}:{}]   ({}/{}) -> Starting module '{}'",
                          m_app_name, m_pid, pos + 1, total, module.name);
            if (!module.startup)
                continue;
            try
            {
                module.startup();
            }
            catch (const std::exception &e)
            {
                H5SHARE_PANIC("[h5share-lifecycle] [{}:{}] Module '{}' threw an exception "
                              "during startup: {}",
                              m_app_name, m_pid, module.name, e.what());
            }
            catch (...)
            {
                H5SHARE_PANIC("[h5share-lifecycle] [{}:{}] Module '{}' threw an unknown "
                              "exception during startup.",
                              m_app_name, m_pid, module.name);
            }
        }
        H5SHARE_DEBUG("[h5share-lifecycle] [{}:{}] Application initialization complete.",
                      m_app_name, m_pid);
    }

    void finalize(std::source_location loc)
    {
        if (!m_is_initialized.load(std::memory_order_acquire) ||
            m_is_finalized.exchange(true, std::memory_order_acq_rel))
        {
            return;
        }
        H5SHARE_DEBUG("[h5share-lifecycle] [{}:{}] Finalizing application from {}", m_app_name,
                      m_pid, h5share::debug::srcloc_to_str(loc));
        (void)loc;

        for (auto it = m_order.rbegin(); it != m_order.rend(); ++it)
        {
            const InternalModuleDef &module = m_modules[*it];
            if (!module.shutdown.func)
                continue;
            H5SHARE_DEBUG("[h5share-lifecycle] [{}:{}] <- Shutting down module '{}'", m_app_name,
                          m_pid, module.name);
            const auto result = run_shutdown_callback(module.shutdown.func, module.shutdown.timeout);
            switch (result.status)
            {
            case ShutdownResult::Status::Done:
                break;
            case ShutdownResult::Status::TimedOut:
                fmt::print(stderr,
                           "[h5share-lifecycle] [{}:{}] WARNING: Shutdown for module '{}' timed "
                           "out after {}ms. Thread detached.\n",
                           m_app_name, m_pid, module.name, module.shutdown.timeout.count());
                break;
            case ShutdownResult::Status::Threw:
                fmt::print(stderr,
                           "[h5share-lifecycle] [{}:{}] WARNING: Module '{}' threw during "
                           "shutdown: {}\n",
                           m_app_name, m_pid, module.name, result.error);
                break;
            }
        }
        H5SHARE_DEBUG("[h5share-lifecycle] [{}:{}] Application finalization complete.",
                      m_app_name, m_pid);
    }

    bool is_initialized() const { return m_is_initialized.load(std::memory_order_acquire); }
    bool is_finalized() const { return m_is_finalized.load(std::memory_order_acquire); }

  private:
    /**
     * Kahn's algorithm over registration indices. Among modules whose
     * dependencies are satisfied, the one registered first starts first.
     */
    std::vector<std::size_t> resolveStartupOrder() const
    {
        const std::size_t n = m_modules.size();
        std::map<std::string, std::size_t> index_of;
        for (std::size_t i = 0; i < n; ++i)
        {
            if (!index_of.emplace(m_modules[i].name, i).second)
            {
                throw std::runtime_error("Duplicate module name detected: '" + m_modules[i].name +
                                         "'.");
            }
        }

        std::vector<std::size_t> pending(n, 0);
        std::vector<std::vector<std::size_t>> dependents(n);
        for (std::size_t i = 0; i < n; ++i)
        {
            for (const auto &dep : m_modules[i].dependencies)
            {
                const auto found = index_of.find(dep);
                if (found == index_of.end())
                {
                    throw std::runtime_error("Module '" + m_modules[i].name +
                                             "' has an undefined dependency: '" + dep + "'.");
                }
                dependents[found->second].push_back(i);
                ++pending[i];
            }
        }

        std::set<std::size_t> ready;
        for (std::size_t i = 0; i < n; ++i)
        {
            if (pending[i] == 0)
                ready.insert(i);
        }

        std::vector<std::size_t> order;
        order.reserve(n);
        while (!ready.empty())
        {
            const std::size_t next = *ready.begin();
            ready.erase(ready.begin());
            order.push_back(next);
            for (std::size_t d : dependents[next])
            {
                if (--pending[d] == 0)
                    ready.insert(d);
            }
        }

        if (order.size() != n)
        {
            std::string stuck;
            for (std::size_t i = 0; i < n; ++i)
            {
                if (pending[i] == 0)
                    continue;
                if (!stuck.empty())
                    stuck += ", ";
                stuck += "'" + m_modules[i].name + "'";
            }
            throw std::runtime_error("Circular dependency detected in modules. Unresolved: " +
                                     stuck + ".");
        }
        return order;
    }

    const long m_pid;
    const std::string m_app_name;

    std::atomic<bool> m_is_initialized{false};
    std::atomic<bool> m_is_finalized{false};

    std::mutex m_registry_mutex;
    std::vector<InternalModuleDef> m_modules;
    // Indices into m_modules in startup order.
    std::vector<std::size_t> m_order;
};

// ============================================================================
// LifecycleManager
// ============================================================================

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager instance;
    return instance;
}

void LifecycleManager::register_module(ModuleDef &&module_def)
{
    if (!module_def.pImpl)
        return;
    pImpl->registerModule(std::move(module_def.pImpl->def));
}

void LifecycleManager::initialize(std::source_location loc)
{
    pImpl->initialize(loc);
}

void LifecycleManager::finalize(std::source_location loc)
{
    pImpl->finalize(loc);
}

bool LifecycleManager::is_initialized()
{
    return pImpl->is_initialized();
}

bool LifecycleManager::is_finalized()
{
    return pImpl->is_finalized();
}

} // namespace h5share::utils
