#pragma once
/**
 * @file item_locator.hpp
 * @brief Waits for items a concurrent writer has not finished yet.
 *
 * A reader asking for "/scan_3" while the writer is still producing it may find the
 * link missing, or the group present but incomplete. Both are retried:
 *
 * - leaf missing                           → RetryableAccessError (retried)
 * - present but `validate(item)` is false  → RetryableAccessError (retried)
 * - HDF5 call failed mid-write             → H5IoError (retried)
 * - ancestor missing or not a group        → DefiniteNotFoundError (immediate)
 *
 * The default validator accepts an item once it contains an "end_time" child, the
 * marker a writer adds when a record is complete. Pass an empty validator to accept
 * any existing item.
 *
 * Two families of entry points:
 * - on an open `File`: only the lookup is retried;
 * - on a path: every attempt reopens the file, and the file is returned together
 *   with the items in a scope object so both are released together.
 */
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "h5/file.hpp"
#include "h5/item.hpp"
#include "h5share_utils_export.h"
#include "utils/retry.hpp"

namespace h5share::h5
{

using ItemValidator = std::function<bool(const Item &)>;

/// True if `item` contains an "end_time" child. Any HDF5 failure counts as "not yet".
H5SHARE_UTILS_EXPORT bool default_validator(const Item &item);

/// File and item released together; the item is closed before the file.
struct ItemScope
{
    File file;
    Item item;
};

/// File and its accepted top-level items, released together.
struct ItemsScope
{
    File file;
    std::vector<Item> items;
};

/**
 * @brief One lookup attempt, no retry.
 * @throws RetryableAccessError, DefiniteNotFoundError, H5IoError
 */
H5SHARE_UTILS_EXPORT Item locate_item(const File &file, const std::string &item_path,
                                      const ItemValidator &validate = default_validator);

/**
 * @brief One enumeration attempt of the root's children, filtered by `validate`
 *        (no filter when empty). Fails as a whole if any child cannot be opened.
 */
H5SHARE_UTILS_EXPORT std::vector<Item>
locate_top_level_items(const File &file, const ItemValidator &validate = default_validator);

/// `locate_item` retried under `policy`.
H5SHARE_UTILS_EXPORT Item open_item(const File &file, const std::string &item_path,
                                    const ItemValidator &validate,
                                    const utils::RetryPolicy &policy);

/// `locate_top_level_items` retried under `policy`.
H5SHARE_UTILS_EXPORT std::vector<Item> open_top_level_items(const File &file,
                                                            const ItemValidator &validate,
                                                            const utils::RetryPolicy &policy);

/**
 * @brief Opens `path` and locates `item_path`, reopening the file on every attempt.
 * @throws utils::RetryTimeoutError when `policy.timeout` elapses first.
 */
H5SHARE_UTILS_EXPORT ItemScope open_item(const std::filesystem::path &path,
                                         const std::string &item_path,
                                         const ItemValidator &validate,
                                         const utils::RetryPolicy &policy,
                                         const FileOptions &options = {});

H5SHARE_UTILS_EXPORT ItemsScope open_top_level_items(const std::filesystem::path &path,
                                                     const ItemValidator &validate,
                                                     const utils::RetryPolicy &policy,
                                                     const FileOptions &options = {});

/// Path-based lookup with the validator and retry policy from AccessConfig defaults.
H5SHARE_UTILS_EXPORT ItemScope open_item(const std::filesystem::path &path,
                                         const std::string &item_path);

H5SHARE_UTILS_EXPORT ItemsScope open_top_level_items(const std::filesystem::path &path);

} // namespace h5share::h5
