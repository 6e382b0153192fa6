#pragma once
/**
 * @file sink.hpp
 * @brief Log record and the destination interface the logger worker writes to.
 */
#include "hsh_base.hpp"

#include <string>
#include <string_view>

namespace h5share::utils
{

/// One log event. `level` holds the Logger::Level value so sinks stay independent of logger.hpp.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    long process_id;
    uint64_t thread_id;
    int level;
    fmt::memory_buffer body;
};

class Sink
{
  public:
    virtual ~Sink() = default;
    /// Called from the logger worker thread only.
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    [[nodiscard]] virtual std::string description() const = 0;
};

/// Level name used in log lines; "UNK" outside the known range.
H5SHARE_UTILS_EXPORT std::string_view log_level_label(int level) noexcept;

/// "[time] [LEVEL ] [h5share] [PID:n TID:n] body" followed by a newline.
H5SHARE_UTILS_EXPORT std::string render_log_line(const LogMessage &msg);

} // namespace h5share::utils
