#include "hsh_service.hpp"

#include "h5/item.hpp"
#include "h5_library.hpp"

namespace h5share::h5
{

using detail::H5Id;
using detail::LibraryLock;

const char *to_string(ItemKind kind) noexcept
{
    switch (kind)
    {
    case ItemKind::Group:
        return "group";
    case ItemKind::Dataset:
        return "dataset";
    case ItemKind::NamedDatatype:
        return "datatype";
    case ItemKind::Other:
        break;
    }
    return "other";
}

namespace
{
std::string object_name(hid_t id, const std::string &fallback)
{
    const ssize_t len = H5Iget_name(id, nullptr, 0);
    if (len <= 0)
        return fallback;
    std::string name(static_cast<size_t>(len) + 1, '\0');
    H5Iget_name(id, name.data(), name.size());
    name.resize(static_cast<size_t>(len));
    return name;
}
} // namespace

Item::Item(hid_t id, std::string path) noexcept : m_id(id), m_path(std::move(path)) {}

Item::~Item()
{
    close();
}

Item::Item(Item &&other) noexcept : m_id(other.m_id), m_path(std::move(other.m_path))
{
    other.m_id = H5I_INVALID_HID;
}

Item &Item::operator=(Item &&other) noexcept
{
    if (this != &other)
    {
        close();
        m_id = other.m_id;
        m_path = std::move(other.m_path);
        other.m_id = H5I_INVALID_HID;
    }
    return *this;
}

Item Item::open(hid_t loc, const std::string &path)
{
    detail::silence_error_printing();
    LibraryLock lock(detail::library_mutex());
    const hid_t id = H5Oopen(loc, path.c_str(), H5P_DEFAULT);
    if (id < 0)
        detail::throw_h5_error("H5Oopen", path);
    return Item(id, object_name(id, path));
}

void Item::close() noexcept
{
    if (m_id < 0)
        return;
    // Closing the file (strong close degree) may already have released the object.
    H5Id owned(m_id);
    m_id = H5I_INVALID_HID;
}

std::string Item::name() const
{
    if (m_path.empty() || m_path == "/")
        return "/";
    const auto pos = m_path.find_last_of('/');
    return pos == std::string::npos ? m_path : m_path.substr(pos + 1);
}

ItemKind Item::kind() const
{
    LibraryLock lock(detail::library_mutex());
    switch (H5Iget_type(m_id))
    {
    case H5I_GROUP:
        return ItemKind::Group;
    case H5I_DATASET:
        return ItemKind::Dataset;
    case H5I_DATATYPE:
        return ItemKind::NamedDatatype;
    default:
        return ItemKind::Other;
    }
}

bool Item::contains(const std::string &child) const
{
    if (kind() != ItemKind::Group)
        return false;
    LibraryLock lock(detail::library_mutex());
    return detail::probe_path(m_id, child) == detail::PathStatus::Exists;
}

std::vector<std::string> Item::child_names() const
{
    LibraryLock lock(detail::library_mutex());

    H5G_info_t info;
    if (H5Gget_info(m_id, &info) < 0)
        detail::throw_h5_error("H5Gget_info", m_path);

    H5_index_t index = H5_INDEX_NAME;
    {
        H5Id gcpl(H5Gget_create_plist(m_id));
        unsigned flags = 0;
        if (gcpl && H5Pget_link_creation_order(gcpl.get(), &flags) >= 0 &&
            (flags & H5P_CRT_ORDER_TRACKED) != 0)
        {
            index = H5_INDEX_CRT_ORDER;
        }
        H5Eclear2(H5E_DEFAULT);
    }

    std::vector<std::string> names;
    names.reserve(static_cast<size_t>(info.nlinks));
    for (hsize_t i = 0; i < info.nlinks; ++i)
    {
        const ssize_t len =
            H5Lget_name_by_idx(m_id, ".", index, H5_ITER_INC, i, nullptr, 0, H5P_DEFAULT);
        if (len < 0)
            detail::throw_h5_error("H5Lget_name_by_idx", m_path);
        std::string link(static_cast<size_t>(len) + 1, '\0');
        if (H5Lget_name_by_idx(m_id, ".", index, H5_ITER_INC, i, link.data(), link.size(),
                               H5P_DEFAULT) < 0)
        {
            detail::throw_h5_error("H5Lget_name_by_idx", m_path);
        }
        link.resize(static_cast<size_t>(len));
        names.push_back(std::move(link));
    }
    return names;
}

void Item::read_one(hid_t mem_type, void *out) const
{
    if (kind() != ItemKind::Dataset)
        throw std::logic_error(fmt::format("'{}' is not a dataset", m_path));

    LibraryLock lock(detail::library_mutex());
    H5Id space(H5Dget_space(m_id));
    if (!space)
        detail::throw_h5_error("H5Dget_space", m_path);
    const hssize_t npoints = H5Sget_simple_extent_npoints(space.get());
    if (npoints != 1)
    {
        throw std::logic_error(
            fmt::format("'{}' holds {} elements, expected a scalar", m_path, npoints));
    }
    if (H5Dread(m_id, mem_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, out) < 0)
        detail::throw_h5_error("H5Dread", m_path);
}

} // namespace h5share::h5
