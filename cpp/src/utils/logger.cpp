/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 ******************************************************************************/
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "hsh_base.hpp"

#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

using namespace h5share::format_tools;

namespace h5share::utils
{

enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

// Configuration calls before startup are programming errors; after shutdown they are ignored.
static bool logger_is_loggable(const char *function_name)
{
    const auto state = g_logger_state.load(std::memory_order_acquire);
    if (state == LoggerState::Uninitialized)
    {
        H5SHARE_PANIC("Logger method '{}' was called before the Logger module was "
                      "initialized via LifecycleManager. Aborting.",
                      function_name);
    }
    return state == LoggerState::Initialized;
}

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};

using Command = std::variant<LogMessage, SetSinkCommand, FlushCommand>;

namespace
{
void promise_set_safe(const std::shared_ptr<std::promise<bool>> &p, bool value)
{
    if (!p)
        return;
    try
    {
        p->set_value(value);
    }
    catch (const std::future_error &)
    {
        // Already satisfied.
    }
}

LogMessage make_system_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = h5share::platform::get_pid(),
                      .thread_id = h5share::platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}
} // namespace

struct Logger::Impl
{
    Impl() : sink_(std::make_unique<ConsoleSink>()) {}
    ~Impl()
    {
        if (worker_thread_.joinable())
        {
            // The lifecycle module joins the worker; a still-running worker at static
            // destruction means shutdown never ran.
            H5SHARE_DEBUG("Logger Impl destructor called without prior shutdown.");
            shutdown();
        }
    }

    void start_worker()
    {
        if (!worker_thread_.joinable())
        {
            worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
        }
    }

    bool enqueue_command(Command &&cmd);
    void worker_loop();
    void write_to_sink(const LogMessage &msg);
    void shutdown();

    std::unique_ptr<Sink> sink_;
    std::thread worker_thread_;
    std::vector<Command> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    size_t m_max_queue_size{10000};
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<size_t> m_messages_dropped{0};
    std::atomic<size_t> m_total_dropped{0};
};

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            if (auto *c = std::get_if<SetSinkCommand>(&cmd))
                promise_set_safe(c->promise, false);
            else if (auto *f = std::get_if<FlushCommand>(&cmd))
                promise_set_safe(f->promise, false);
            return false;
        }

        // Control commands are never dropped; log messages are, past the soft limit.
        if (queue_.size() >= m_max_queue_size && std::holds_alternative<LogMessage>(cmd))
        {
            m_messages_dropped.fetch_add(1, std::memory_order_relaxed);
            m_total_dropped.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

void Logger::Impl::write_to_sink(const LogMessage &msg)
{
    if (!sink_)
        return;
    try
    {
        sink_->write(msg);
    }
    catch (const std::exception &e)
    {
        // The sink itself is broken; stderr is the only place left to report it.
        fmt::print(stderr, "[h5share-logger] sink '{}' write failed: {}\n", sink_->description(),
                   e.what());
    }
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool stop = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);
            stop = shutdown_requested_.load() && local_queue.empty();
        }

        const size_t dropped = m_messages_dropped.exchange(0, std::memory_order_relaxed);
        if (dropped > 0)
        {
            write_to_sink(make_system_message(
                Logger::Level::L_WARNING,
                make_buffer("Logger queue overflow: {} messages were dropped.", dropped)));
        }

        for (auto &cmd : local_queue)
        {
            if (auto *msg = std::get_if<LogMessage>(&cmd))
            {
                if (msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                    write_to_sink(*msg);
            }
            else if (auto *set_sink = std::get_if<SetSinkCommand>(&cmd))
            {
                std::string old_desc = sink_ ? sink_->description() : "null";
                std::string new_desc = set_sink->new_sink ? set_sink->new_sink->description() : "null";
                if (sink_)
                {
                    write_to_sink(make_system_message(
                        Logger::Level::L_SYSTEM, make_buffer("Switching log sink to: {}", new_desc)));
                    sink_->flush();
                }
                sink_ = std::move(set_sink->new_sink);
                write_to_sink(make_system_message(
                    Logger::Level::L_SYSTEM, make_buffer("Log sink switched from: {}", old_desc)));
                promise_set_safe(set_sink->promise, true);
            }
            else if (auto *flush = std::get_if<FlushCommand>(&cmd))
            {
                if (sink_)
                    sink_->flush();
                promise_set_safe(flush->promise, true);
            }
        }
        local_queue.clear();

        if (stop)
        {
            if (sink_)
                sink_->flush();
            g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
            break;
        }
    }
}

void Logger::Impl::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true))
            return;
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
}

// ============================================================================
// Logger public API
// ============================================================================

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_logger_state.load(std::memory_order_acquire) == LoggerState::Initialized;
}

bool Logger::set_console()
{
    if (!logger_is_loggable("Logger::set_console"))
        return false;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    if (!pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>(), promise}))
        return false;
    return future.get();
}

bool Logger::set_logfile(const std::filesystem::path &path, bool use_flock)
{
    if (!logger_is_loggable("Logger::set_logfile"))
        return false;
    std::unique_ptr<Sink> sink;
    try
    {
        std::error_code ec;
        const auto parent = std::filesystem::absolute(path, ec).parent_path();
        if (!ec && !parent.empty())
            std::filesystem::create_directories(parent, ec);
        sink = std::make_unique<FileSink>(path, use_flock);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Logger: failed to create file sink '{}': {}", path.string(), e.what());
        return false;
    }
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    if (!pImpl->enqueue_command(SetSinkCommand{std::move(sink), promise}))
        return false;
    return future.get();
}

void Logger::flush()
{
    if (!logger_is_loggable("Logger::flush"))
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    if (pImpl->enqueue_command(FlushCommand{promise}))
        (void)future.get();
}

void Logger::shutdown()
{
    if (!lifecycle_initialized())
        return;
    pImpl->shutdown();
}

void Logger::set_level(Level lvl)
{
    if (!logger_is_loggable("Logger::set_level"))
        return;
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_max_queue_size(size_t max_size)
{
    if (!logger_is_loggable("Logger::set_max_queue_size"))
        return;
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    pImpl->m_max_queue_size = (max_size > 0) ? max_size : 1;
}

size_t Logger::get_max_queue_size() const
{
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    return pImpl->m_max_queue_size;
}

size_t Logger::get_total_dropped() const
{
    return pImpl->m_total_dropped.load(std::memory_order_relaxed);
}

std::optional<Logger::Level> Logger::parse_level(std::string_view name) noexcept
{
    const auto n = trim(name);
    if (iequals(n, "trace"))
        return Level::L_TRACE;
    if (iequals(n, "debug"))
        return Level::L_DEBUG;
    if (iequals(n, "info"))
        return Level::L_INFO;
    if (iequals(n, "warn") || iequals(n, "warning"))
        return Level::L_WARNING;
    if (iequals(n, "error"))
        return Level::L_ERROR;
    if (iequals(n, "system"))
        return Level::L_SYSTEM;
    return std::nullopt;
}

bool Logger::should_log(Level lvl) const noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    try
    {
        return pImpl->enqueue_command(make_system_message(lvl, std::move(body)));
    }
    catch (const std::bad_alloc &)
    {
        pImpl->m_total_dropped.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
}

// C-style callbacks for the lifecycle API.
void do_logger_startup(const char *arg)
{
    (void)arg;
    Logger::instance().pImpl->start_worker();
    g_logger_state.store(LoggerState::Initialized, std::memory_order_release);
}

void do_logger_shutdown(const char *arg)
{
    (void)arg;
    LoggerState expected = LoggerState::Initialized;
    if (g_logger_state.compare_exchange_strong(expected, LoggerState::ShuttingDown,
                                               std::memory_order_acq_rel))
    {
        Logger::instance().pImpl->shutdown();
        g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
    }
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("h5share::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown, std::chrono::milliseconds(5000));
    return module;
}

} // namespace h5share::utils
