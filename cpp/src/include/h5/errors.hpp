#pragma once
/**
 * @file errors.hpp
 * @brief Exception taxonomy of the HDF5 access layer.
 *
 * | Exception                    | Base             | Retried by default |
 * |------------------------------|------------------|--------------------|
 * | InvalidModeError             | invalid_argument | no                 |
 * | ConfigurationConflictError   | runtime_error    | no                 |
 * | RetryableAccessError         | RetryableError   | yes                |
 * | H5IoError                    | RetryableError   | yes                |
 * | DefiniteNotFoundError        | ImmediateError   | never (propagated) |
 * | utils::RetryTimeoutError     | runtime_error    | never (propagated) |
 */
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "h5share_utils_export.h"
#include "utils/retry.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251 4275)
#endif

namespace h5share::h5
{

/// Open mode string outside r, w, w-, x, a.
class H5SHARE_UTILS_EXPORT InvalidModeError : public std::invalid_argument
{
  public:
    using std::invalid_argument::invalid_argument;
};

/// Locking policy change requested while handles opened under another policy are open.
class H5SHARE_UTILS_EXPORT ConfigurationConflictError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// Item not there yet, or not yet valid: the writer may still be producing it.
class H5SHARE_UTILS_EXPORT RetryableAccessError : public utils::RetryableError
{
  public:
    using utils::RetryableError::RetryableError;
};

/// A structurally required ancestor is missing; the item can never appear.
class H5SHARE_UTILS_EXPORT DefiniteNotFoundError : public utils::ImmediateError
{
  public:
    using utils::ImmediateError::ImmediateError;
};

/**
 * @brief One entry of the HDF5 error stack, innermost last.
 *
 * Class ids are stored as plain integers so this header does not need `hdf5.h`.
 */
struct H5ErrorRecord
{
    int64_t major_id{-1};
    int64_t minor_id{-1};
    std::string major;
    std::string minor;
    std::string func;
    std::string file;
    unsigned line{0};
    std::string desc;
};

/**
 * @class H5IoError
 * @brief An HDF5 C API call failed. Carries the captured HDF5 error stack.
 *
 * Treated as transient: while a writer mutates a file, readers routinely observe
 * failures that disappear on the next attempt.
 */
class H5SHARE_UTILS_EXPORT H5IoError : public utils::RetryableError
{
  public:
    H5IoError(std::string operation, std::string path, std::vector<H5ErrorRecord> records);

    [[nodiscard]] const std::string &operation() const noexcept { return m_operation; }
    [[nodiscard]] const std::string &path() const noexcept { return m_path; }
    [[nodiscard]] const std::vector<H5ErrorRecord> &records() const noexcept { return m_records; }

    /**
     * @brief The file is held open for writing by another process (or handle).
     *
     * HDF5 1.10 reports this as a generic "file open failed" whose description
     * carries the text "file is already open for write"; there is no dedicated
     * minor class for it, so this predicate still relies on the message text.
     */
    [[nodiscard]] bool is_already_open_for_write() const noexcept;

    /// The OS refused the advisory file lock (minor class H5E_CANTLOCKFILE).
    [[nodiscard]] bool is_lock_conflict() const noexcept;

    /// True if any record's description contains `needle`.
    [[nodiscard]] bool mentions(const std::string &needle) const noexcept;

  private:
    static std::string make_message(const std::string &operation, const std::string &path,
                                    const std::vector<H5ErrorRecord> &records);

    std::string m_operation;
    std::string m_path;
    std::vector<H5ErrorRecord> m_records;
};

} // namespace h5share::h5

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
