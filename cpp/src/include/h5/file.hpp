#pragma once
/**
 * @file file.hpp
 * @brief File: an HDF5 file handle negotiated for single-writer/multi-reader sharing.
 *
 * `File::open` resolves the requested options into one HDF5 open call:
 *
 * 1. Locking. `enable_locking` defaults to true unless the mode is read and SWMR is
 *    not requested. The value goes through `LockingPolicy`, which rejects a change
 *    while other files are open under a different setting.
 * 2. SWMR requested without a version bound pins the bound to `latest`.
 * 3. The file is opened. If a plain read (`swmr` left unset) fails because a writer
 *    has the file open, the open is retried once as a SWMR read with bound `latest`.
 *    If that also fails the original error is thrown.
 * 4. The handle is counted. A writer that asked for SWMR then switches the file to
 *    SWMR writing; if that fails the handle is closed again and the error thrown.
 *
 * Any other failure propagates unchanged. Retrying until a file becomes available
 * is the job of `open_file()` (or of the item locator), not of `File::open`.
 *
 * @code
 *   auto file = File::open("scan.h5", {.mode = OpenMode::Append, .swmr = true});
 *   ...
 *   file.flush();
 * @endcode
 */
#include <hdf5.h>

#include <cstdint>
#include <filesystem>
#include <string>

#include "h5/file_options.hpp"
#include "h5/item.hpp"
#include "h5share_utils_export.h"
#include "utils/retry.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace h5share::h5
{

/// Whether this HDF5 build supports single-writer/multi-reader access.
inline constexpr bool kHasSwmr = H5_VERSION_GE(1, 10, 0);

class H5SHARE_UTILS_EXPORT File
{
  public:
    /**
     * @brief Opens `path` following the negotiation described above.
     * @throws ConfigurationConflictError locking policy differs from open files
     * @throws H5IoError                  HDF5 refused the open or the SWMR switch
     * @pre The LockingPolicy lifecycle module is started.
     */
    static File open(const std::filesystem::path &path, const FileOptions &options = {});

    /// Same, with the mode given as "r", "w", "w-", "x" or "a" (InvalidModeError otherwise).
    static File open(const std::filesystem::path &path, std::string_view mode,
                     std::optional<bool> swmr = std::nullopt);

    File() noexcept = default;
    ~File();

    File(const File &) = delete;
    File &operator=(const File &) = delete;
    File(File &&other) noexcept;
    File &operator=(File &&other) noexcept;

    /// Closes the file and releases it from the locking bookkeeping. Idempotent.
    void close();

    [[nodiscard]] bool is_open() const noexcept { return m_id >= 0; }
    [[nodiscard]] hid_t id() const noexcept { return m_id; }
    [[nodiscard]] const std::filesystem::path &path() const noexcept { return m_path; }
    [[nodiscard]] OpenMode mode() const noexcept { return m_mode; }
    [[nodiscard]] SharingMode sharing_mode() const noexcept { return m_sharing; }
    [[nodiscard]] bool swmr_mode() const noexcept { return m_sharing == SharingMode::Swmr; }

    /// Flushes buffered data of this file to storage.
    void flush();

    /// The root group.
    [[nodiscard]] Item root() const;

  private:
    void release() noexcept;

    hid_t m_id{H5I_INVALID_HID};
    std::filesystem::path m_path;
    OpenMode m_mode{OpenMode::Read};
    SharingMode m_sharing{SharingMode::Plain};
    /// LockingPolicy session the handle was counted in.
    std::uint64_t m_policy_session{0};
};

/**
 * @brief `File::open` driven through the retry engine: a file that is missing or
 *        still being created by a writer is retried until `policy.timeout`.
 */
H5SHARE_UTILS_EXPORT File open_file(const std::filesystem::path &path, const FileOptions &options,
                                    const utils::RetryPolicy &policy);

} // namespace h5share::h5

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
