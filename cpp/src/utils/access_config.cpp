/**
 * @file access_config.cpp
 * @brief AccessConfig singleton lifecycle module implementation.
 *
 * Config loading strategy (priority low → high):
 *  1. Built-in C++ defaults (Impl struct fields)
 *  2. set_config_path() file, or H5SHARE_CONFIG_FILE
 *  3. H5SHARE_RETRY_PERIOD_MS / H5SHARE_RETRY_TIMEOUT_MS / H5SHARE_LOG_LEVEL
 */
#include "hsh_service.hpp"
#include "utils/access_config.hpp"

#include <atomic>
#include <charconv>
#include <fstream>
#include <mutex>

#include <nlohmann/json.hpp>

namespace h5share::utils
{

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Module-level state
// ---------------------------------------------------------------------------

static std::atomic<bool> g_access_config_initialized{false};

static std::mutex g_config_path_mu;
static fs::path g_config_path_override; ///< Set by set_config_path() before startup.

namespace
{

/// Reads a JSON file. Returns a null value when it is missing or malformed.
nlohmann::json read_json_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return nlohmann::json{};
    try
    {
        nlohmann::json j;
        f >> j;
        return j;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        LOGGER_WARN("AccessConfig: '{}' is not valid JSON: {}", path.string(), e.what());
    }
    return nlohmann::json{};
}

std::optional<long long> parse_integer(std::string_view text)
{
    text = format_tools::trim(text);
    long long value = 0;
    const auto *end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end)
        return std::nullopt;
    return value;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// AccessConfig::Impl
// ---------------------------------------------------------------------------

struct AccessConfig::Impl
{
    RetryPolicy retry{};
    std::string log_level{"info"};
    fs::path log_file{};
    bool track_order{true};
    fs::path source_file{};

    void apply_json(const nlohmann::json &j)
    {
        if (j.contains("retry"))
        {
            const auto &r = j.at("retry");
            if (r.contains("period_ms"))
                retry.retry_period = std::chrono::milliseconds(r.at("period_ms").get<long long>());
            if (r.contains("timeout_ms"))
            {
                const auto &t = r.at("timeout_ms");
                if (t.is_null())
                    retry.timeout.reset();
                else
                    retry.timeout = std::chrono::milliseconds(t.get<long long>());
            }
        }
        if (j.contains("logging"))
        {
            const auto &l = j.at("logging");
            if (l.contains("level"))
                log_level = l.at("level").get<std::string>();
            if (l.contains("file") && l.at("file").is_string())
                log_file = l.at("file").get<std::string>();
        }
        if (j.contains("file"))
        {
            const auto &f = j.at("file");
            if (f.contains("track_order"))
                track_order = f.at("track_order").get<bool>();
        }
    }

    void apply_file(const fs::path &path, const char *origin)
    {
        nlohmann::json j = read_json_file(path);
        if (!j.is_object())
        {
            LOGGER_WARN("AccessConfig: {} '{}' not readable; using defaults", origin,
                        path.string());
            return;
        }
        try
        {
            apply_json(j);
            source_file = path;
            LOGGER_INFO("AccessConfig: loaded {} '{}'", origin, path.string());
        }
        catch (const nlohmann::json::exception &e)
        {
            LOGGER_ERROR("AccessConfig: {} '{}' has an invalid value: {}", origin, path.string(),
                         e.what());
        }
    }

    void apply_env()
    {
        if (auto env = platform::get_env("H5SHARE_RETRY_PERIOD_MS"))
        {
            if (auto v = parse_integer(*env))
                retry.retry_period = std::chrono::milliseconds(*v);
            else
                LOGGER_WARN("AccessConfig: ignoring H5SHARE_RETRY_PERIOD_MS='{}'", *env);
        }
        if (auto env = platform::get_env("H5SHARE_RETRY_TIMEOUT_MS"))
        {
            if (format_tools::iequals(format_tools::trim(*env), "none"))
                retry.timeout.reset();
            else if (auto v = parse_integer(*env))
            {
                if (*v < 0)
                    retry.timeout.reset();
                else
                    retry.timeout = std::chrono::milliseconds(*v);
            }
            else
                LOGGER_WARN("AccessConfig: ignoring H5SHARE_RETRY_TIMEOUT_MS='{}'", *env);
        }
        if (auto env = platform::get_env("H5SHARE_LOG_LEVEL"))
            log_level = *env;
    }

    void apply_logging() const
    {
        auto &logger = Logger::instance();
        if (auto lvl = Logger::parse_level(log_level))
            logger.set_level(*lvl);
        else
            LOGGER_WARN("AccessConfig: unknown log level '{}'; keeping current level", log_level);

        if (!log_file.empty() && !logger.set_logfile(log_file))
            LOGGER_ERROR("AccessConfig: cannot log to '{}'; staying on console",
                         log_file.string());
    }

    void load(const fs::path &override_path)
    {
        if (!override_path.empty())
            apply_file(override_path, "config file");
        else if (auto env = platform::get_env("H5SHARE_CONFIG_FILE"); env && !env->empty())
            apply_file(*env, "H5SHARE_CONFIG_FILE");

        apply_env();
        apply_logging();

        LOGGER_INFO("AccessConfig: retry.period_ms   = {}", retry.retry_period.count());
        LOGGER_INFO("AccessConfig: retry.timeout     = {}",
                    format_tools::format_duration(retry.timeout));
        LOGGER_INFO("AccessConfig: logging.level     = {}", log_level);
        LOGGER_INFO("AccessConfig: file.track_order  = {}", track_order);
    }
};

// ---------------------------------------------------------------------------
// AccessConfig public interface
// ---------------------------------------------------------------------------

AccessConfig::AccessConfig() : pImpl(std::make_unique<Impl>()) {}
AccessConfig::~AccessConfig() = default;

// static
void AccessConfig::set_config_path(const fs::path &path)
{
    if (g_access_config_initialized.load(std::memory_order_acquire))
    {
        LOGGER_WARN("AccessConfig::set_config_path('{}') after startup has no effect",
                    path.string());
    }
    std::lock_guard lock(g_config_path_mu);
    g_config_path_override = path;
}

// static
bool AccessConfig::lifecycle_initialized() noexcept
{
    return g_access_config_initialized.load(std::memory_order_acquire);
}

// static
AccessConfig &AccessConfig::get_instance()
{
    if (!lifecycle_initialized())
    {
        H5SHARE_PANIC("AccessConfig::get_instance() called before the AccessConfig module "
                      "was initialized via LifecycleManager. Aborting.");
    }
    static AccessConfig instance;
    return instance;
}

void AccessConfig::load_(const fs::path &override_path)
{
    pImpl->load(override_path);
}

const RetryPolicy &AccessConfig::retry_policy() const noexcept { return pImpl->retry; }
const std::string &AccessConfig::log_level() const noexcept { return pImpl->log_level; }
const fs::path &AccessConfig::log_file() const noexcept { return pImpl->log_file; }
const fs::path &AccessConfig::source_file() const noexcept { return pImpl->source_file; }

h5::FileOptions AccessConfig::default_file_options() const
{
    h5::FileOptions opts;
    opts.track_order = pImpl->track_order;
    return opts;
}

// ---------------------------------------------------------------------------
// Lifecycle startup / shutdown
// ---------------------------------------------------------------------------

void do_access_config_startup(const char * /*arg*/)
{
    fs::path override_path;
    {
        std::lock_guard lock(g_config_path_mu);
        override_path = g_config_path_override;
    }
    // get_instance() checks the flag; flip it first so loading can use the instance.
    g_access_config_initialized.store(true, std::memory_order_release);
    AccessConfig::get_instance().load_(override_path);
}

void do_access_config_shutdown(const char * /*arg*/)
{
    g_access_config_initialized.store(false, std::memory_order_release);
}

// static
ModuleDef AccessConfig::GetLifecycleModule()
{
    ModuleDef module("h5share::utils::AccessConfig");
    module.add_dependency("h5share::utils::Logger");
    module.set_startup(&do_access_config_startup);
    module.set_shutdown(&do_access_config_shutdown, std::chrono::milliseconds(500));
    return module;
}

} // namespace h5share::utils
