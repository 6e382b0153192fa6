#pragma once
/**
 * @file module_def.hpp
 * @brief ABI-safe module definition for LifecycleManager registration.
 */
#include "h5share_utils_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

// Disable warning C4251 on MSVC for the Pimpl unique_ptr member.
#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace h5share::utils
{

class ModuleDefImpl;
class LifecycleManager;

/**
 * @brief Function pointer type for module startup and shutdown callbacks.
 *
 * A C-style function pointer keeps the calling convention stable across shared
 * library boundaries. `arg` is the string given to set_startup()/set_shutdown(),
 * or `nullptr` when none was given.
 */
using LifecycleCallback = void (*)(const char *arg);

/**
 * @class ModuleDef
 * @brief Builder for a lifecycle module definition.
 *
 * Movable, not copyable. Ownership passes to the LifecycleManager on registration.
 * Module and dependency names are limited to `MAX_MODULE_NAME_LEN` characters;
 * longer names are rejected with `std::length_error`.
 */
class H5SHARE_UTILS_EXPORT ModuleDef
{
  public:
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;
    static constexpr size_t MAX_CALLBACK_PARAM_STRLEN = 1024;

    /**
     * @brief Constructs a module definition with a given name.
     * @throws std::invalid_argument if `name` is empty.
     * @throws std::length_error     if `name.size() > MAX_MODULE_NAME_LEN`.
     */
    explicit ModuleDef(std::string_view name);
    ~ModuleDef();

    ModuleDef(ModuleDef &&other) noexcept;
    ModuleDef &operator=(ModuleDef &&other) noexcept;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    /**
     * @brief Declares a dependency on another module.
     *
     * The named module is started before this one and shut down after it.
     * An empty name is ignored.
     */
    void add_dependency(std::string_view dependency_name);

    void set_startup(LifecycleCallback startup_func);

    /**
     * @brief Sets the startup callback with a string argument.
     * @throws std::length_error if `arg.size() > MAX_CALLBACK_PARAM_STRLEN`.
     */
    void set_startup(LifecycleCallback startup_func, std::string_view arg);

    /**
     * @brief Sets the shutdown callback.
     *
     * @param timeout Maximum time allowed for the callback. A callback still running
     *                at the deadline is abandoned (its thread is detached) and
     *                finalization continues with the next module.
     */
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout);

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace h5share::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
