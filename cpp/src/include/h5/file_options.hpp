#pragma once
/**
 * @file file_options.hpp
 * @brief Open mode, sharing mode and library version bound of an HDF5 file handle.
 */
#include <optional>
#include <string>
#include <string_view>

#include "h5share_utils_export.h"

namespace h5share::h5
{

enum class OpenMode
{
    Read,                 ///< "r": read only, file must exist
    WriteTruncate,        ///< "w": create, truncate if it exists
    WriteFailIfExists,    ///< "w-": create, fail if it exists
    WriteCreateExclusive, ///< "x": create, fail if it exists
    Append                ///< "a": read/write if it exists, create otherwise
};

enum class SharingMode
{
    Plain,
    Swmr ///< single writer, multiple readers
};

/// Lower bound of the HDF5 file format versions used for new objects.
enum class LibverBound
{
    Earliest,
    V108,
    V110,
    Latest
};

/**
 * @brief Parses an HDF5 mode string.
 * @throws InvalidModeError for anything but r, w, w-, x, a.
 */
H5SHARE_UTILS_EXPORT OpenMode parse_open_mode(std::string_view text);
H5SHARE_UTILS_EXPORT const char *to_string(OpenMode mode) noexcept;

/**
 * @brief Parses "earliest", "v108", "v110", "latest".
 * @throws std::invalid_argument otherwise.
 */
H5SHARE_UTILS_EXPORT LibverBound parse_libver(std::string_view text);
H5SHARE_UTILS_EXPORT const char *to_string(LibverBound bound) noexcept;

H5SHARE_UTILS_EXPORT const char *to_string(SharingMode mode) noexcept;

inline bool is_write_mode(OpenMode mode) noexcept
{
    return mode != OpenMode::Read;
}

/**
 * @brief Everything a caller may ask of `File::open`.
 *
 * Unset optionals are resolved by the negotiator: `swmr` stays "unspecified" (which
 * enables the SWMR read fallback), `libver` is pinned to Latest when SWMR is used,
 * and `enable_locking` defaults to `mode != Read || swmr == true`.
 */
struct FileOptions
{
    OpenMode mode{OpenMode::Read};
    std::optional<bool> swmr{};
    std::optional<LibverBound> libver{};
    std::optional<bool> enable_locking{};
    bool track_order{true};
};

} // namespace h5share::h5
