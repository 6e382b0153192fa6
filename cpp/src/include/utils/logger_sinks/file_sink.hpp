#pragma once

#include "sink.hpp"

#include <filesystem>
#include <string>

namespace h5share::utils
{

/**
 * @class FileSink
 * @brief Appends formatted log lines to a file.
 *
 * Each message is written with a single write() on an O_APPEND descriptor so lines
 * from several processes sharing one log file do not interleave. With `use_flock`
 * the write is additionally wrapped in an advisory lock (POSIX).
 */
class FileSink : public Sink
{
  public:
    /**
     * @throws std::runtime_error if the file cannot be opened.
     */
    FileSink(const std::filesystem::path &path, bool use_flock);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

  private:
    std::filesystem::path m_path;
    bool m_use_flock = false;
#if defined(H5SHARE_PLATFORM_WIN64)
    void *m_file_handle = nullptr;
#else
    int m_fd = -1;
#endif
};

} // namespace h5share::utils
