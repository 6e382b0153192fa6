#pragma once
/**
 * @file console_sink.hpp
 * @brief Sink writing rendered log lines to stderr.
 */
#include "sink.hpp"

#include <cstdio>

namespace h5share::utils
{

class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override
    {
        const auto line = render_log_line(msg);
        std::fwrite(line.data(), 1, line.size(), stderr);
    }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }
};

} // namespace h5share::utils
