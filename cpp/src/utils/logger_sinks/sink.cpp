#include "hsh_base.hpp"
#include "utils/logger_sinks/sink.hpp"

#include <array>
#include <iterator>

namespace h5share::utils
{

namespace
{
// Indexed by Logger::Level.
constexpr std::array<std::string_view, 6> kLevelLabels{"TRACE", "DEBUG", "INFO",
                                                        "WARN",  "ERROR", "SYSTEM"};
} // namespace

std::string_view log_level_label(int level) noexcept
{
    if (level < 0 || static_cast<std::size_t>(level) >= kLevelLabels.size())
        return "UNK";
    return kLevelLabels[static_cast<std::size_t>(level)];
}

std::string render_log_line(const LogMessage &msg)
{
    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out), "[{}] [{:<6}] [h5share] [PID:{} TID:{}] ",
                   format_tools::formatted_time(msg.timestamp), log_level_label(msg.level),
                   msg.process_id, msg.thread_id);
    out.append(msg.body.data(), msg.body.data() + msg.body.size());
    out.push_back('\n');
    return fmt::to_string(out);
}

} // namespace h5share::utils
