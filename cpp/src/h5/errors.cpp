#include "hsh_base.hpp"

#include "h5/errors.hpp"
#include "h5_library.hpp"

namespace h5share::h5
{

H5IoError::H5IoError(std::string operation, std::string path, std::vector<H5ErrorRecord> records)
    : utils::RetryableError(make_message(operation, path, records)),
      m_operation(std::move(operation)), m_path(std::move(path)), m_records(std::move(records))
{
}

std::string H5IoError::make_message(const std::string &operation, const std::string &path,
                                    const std::vector<H5ErrorRecord> &records)
{
    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out), "{} failed for '{}'", operation, path);
    if (records.empty())
        return fmt::to_string(out);

    // The innermost record names the real cause; the outermost the API call.
    const auto &outer = records.front();
    const auto &inner = records.back();
    fmt::format_to(std::back_inserter(out), " ({}: {}", outer.func, outer.desc);
    if (&outer != &inner)
        fmt::format_to(std::back_inserter(out), "; cause {}: {} [{}]", inner.func, inner.desc,
                       inner.minor);
    fmt::format_to(std::back_inserter(out), ")");
    return fmt::to_string(out);
}

bool H5IoError::mentions(const std::string &needle) const noexcept
{
    for (const auto &rec : m_records)
    {
        if (rec.desc.find(needle) != std::string::npos)
            return true;
    }
    return false;
}

bool H5IoError::is_already_open_for_write() const noexcept
{
    return mentions("file is already open for write");
}

bool H5IoError::is_lock_conflict() const noexcept
{
    const auto cantlock = static_cast<int64_t>(H5E_CANTLOCKFILE);
    for (const auto &rec : m_records)
    {
        if (rec.minor_id == cantlock)
            return true;
    }
    return false;
}

} // namespace h5share::h5
