#include "hsh_service.hpp"

#include "h5/errors.hpp"
#include "h5/item_locator.hpp"
#include "h5_library.hpp"

namespace h5share::h5
{

bool default_validator(const Item &item)
{
    try
    {
        return item.contains("end_time");
    }
    catch (const H5IoError &e)
    {
        LOGGER_TRACE("default_validator: '{}' not readable yet: {}", item.path(), e.what());
        return false;
    }
}

Item locate_item(const File &file, const std::string &item_path, const ItemValidator &validate)
{
    if (!file.is_open())
        throw std::logic_error("locate_item: file is not open");

    Item item;
    {
        detail::LibraryLock lock(detail::library_mutex());
        switch (detail::probe_path(file.id(), item_path))
        {
        case detail::PathStatus::Exists:
            break;
        case detail::PathStatus::LeafMissing:
            throw RetryableAccessError(
                fmt::format("'{}' does not exist yet in '{}'", item_path, file.path().string()));
        case detail::PathStatus::AncestorMissing:
            throw DefiniteNotFoundError(fmt::format("'{}' cannot exist in '{}': a parent group "
                                                    "is missing",
                                                    item_path, file.path().string()));
        case detail::PathStatus::AncestorNotGroup:
            throw DefiniteNotFoundError(fmt::format("'{}' cannot exist in '{}': a parent is not "
                                                    "a group",
                                                    item_path, file.path().string()));
        }
        item = Item::open(file.id(), item_path);
    }

    if (validate && !validate(item))
    {
        throw RetryableAccessError(
            fmt::format("'{}' in '{}' is not complete yet", item_path, file.path().string()));
    }
    return item;
}

std::vector<Item> locate_top_level_items(const File &file, const ItemValidator &validate)
{
    if (!file.is_open())
        throw std::logic_error("locate_top_level_items: file is not open");

    const Item root = file.root();
    std::vector<Item> items;
    for (const auto &name : root.child_names())
    {
        Item item = Item::open(root.id(), name);
        if (validate && !validate(item))
            continue;
        items.push_back(std::move(item));
    }
    return items;
}

Item open_item(const File &file, const std::string &item_path, const ItemValidator &validate,
               const utils::RetryPolicy &policy)
{
    return utils::retry([&] { return locate_item(file, item_path, validate); }, policy);
}

std::vector<Item> open_top_level_items(const File &file, const ItemValidator &validate,
                                       const utils::RetryPolicy &policy)
{
    return utils::retry([&] { return locate_top_level_items(file, validate); }, policy);
}

ItemScope open_item(const std::filesystem::path &path, const std::string &item_path,
                    const ItemValidator &validate, const utils::RetryPolicy &policy,
                    const FileOptions &options)
{
    return utils::retry(
        [&]
        {
            File file = File::open(path, options);
            Item item = locate_item(file, item_path, validate);
            return ItemScope{std::move(file), std::move(item)};
        },
        policy);
}

ItemsScope open_top_level_items(const std::filesystem::path &path, const ItemValidator &validate,
                                const utils::RetryPolicy &policy, const FileOptions &options)
{
    return utils::retry(
        [&]
        {
            File file = File::open(path, options);
            auto items = locate_top_level_items(file, validate);
            return ItemsScope{std::move(file), std::move(items)};
        },
        policy);
}

ItemScope open_item(const std::filesystem::path &path, const std::string &item_path)
{
    const auto &config = utils::AccessConfig::get_instance();
    return open_item(path, item_path, default_validator, config.retry_policy(),
                     config.default_file_options());
}

ItemsScope open_top_level_items(const std::filesystem::path &path)
{
    const auto &config = utils::AccessConfig::get_instance();
    return open_top_level_items(path, default_validator, config.retry_policy(),
                                config.default_file_options());
}

} // namespace h5share::h5
