#pragma once
/**
 * @file h5_library.hpp
 * @brief Internal glue around the HDF5 C library: serialization, id ownership,
 *        error stack capture.
 *
 * The distribution HDF5 build is not thread-safe. Every HDF5 call made by this
 * library runs under `library_mutex()`. It is recursive so that a helper holding it
 * can call another helper that takes it too.
 */
#include <hdf5.h>

#include <mutex>
#include <string>
#include <vector>

#include "h5/errors.hpp"
#include "h5/file_options.hpp"

namespace h5share::h5::detail
{

/// Process-wide lock around the HDF5 library.
std::recursive_mutex &library_mutex();

using LibraryLock = std::lock_guard<std::recursive_mutex>;

/// Disables HDF5's automatic error printing once per process. Idempotent.
void silence_error_printing();

/// Copies and clears the current HDF5 error stack. Caller holds `library_mutex()`.
std::vector<H5ErrorRecord> capture_error_stack();

/**
 * @brief Throws `H5IoError` built from the current HDF5 error stack.
 * Caller holds `library_mutex()`.
 */
[[noreturn]] void throw_h5_error(const std::string &operation, const std::string &path);

/**
 * @class H5Id
 * @brief Owns one HDF5 identifier (property list, group, dataset, ...) and
 *        releases it with `H5Idec_ref`.
 */
class H5Id
{
  public:
    H5Id() noexcept = default;
    explicit H5Id(hid_t id) noexcept : m_id(id) {}
    ~H5Id() { reset(); }

    H5Id(const H5Id &) = delete;
    H5Id &operator=(const H5Id &) = delete;
    H5Id(H5Id &&other) noexcept : m_id(other.release()) {}
    H5Id &operator=(H5Id &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            m_id = other.release();
        }
        return *this;
    }

    [[nodiscard]] hid_t get() const noexcept { return m_id; }
    [[nodiscard]] bool valid() const noexcept { return m_id >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    hid_t release() noexcept
    {
        const hid_t id = m_id;
        m_id = H5I_INVALID_HID;
        return id;
    }

    void reset() noexcept;

  private:
    hid_t m_id{H5I_INVALID_HID};
};

/// Result of walking a slash-separated path one link at a time.
enum class PathStatus
{
    Exists,
    LeafMissing,     ///< every ancestor is a group, only the last link is absent
    AncestorMissing, ///< an intermediate link is absent
    AncestorNotGroup ///< an intermediate link names a dataset or datatype
};

/**
 * @brief Classifies `path` relative to `loc` without raising HDF5 errors for
 *        missing intermediate groups. Caller holds `library_mutex()`.
 * @throws H5IoError if a link query itself fails.
 */
PathStatus probe_path(hid_t loc, const std::string &path);

/// Maps the public bound onto the HDF5 enum.
H5F_libver_t to_h5_libver(LibverBound bound) noexcept;

} // namespace h5share::h5::detail
