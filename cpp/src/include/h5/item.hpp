#pragma once
/**
 * @file item.hpp
 * @brief RAII handle to an object (group, dataset, named datatype) inside an open file.
 *
 * An Item does not keep its file open. Files are opened with the "strong" close
 * degree, so closing the File invalidates every Item obtained from it; keep the File
 * (or the ItemScope returned by the locator) alive while items are in use.
 */
#include <hdf5.h>

#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

#include "h5share_utils_export.h"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace h5share::h5
{

enum class ItemKind
{
    Group,
    Dataset,
    NamedDatatype,
    Other
};

H5SHARE_UTILS_EXPORT const char *to_string(ItemKind kind) noexcept;

class H5SHARE_UTILS_EXPORT Item
{
  public:
    Item() noexcept = default;
    ~Item();

    Item(const Item &) = delete;
    Item &operator=(const Item &) = delete;
    Item(Item &&other) noexcept;
    Item &operator=(Item &&other) noexcept;

    /**
     * @brief Opens the object at `path` relative to `loc` (a file or group id).
     * @throws H5IoError if HDF5 cannot open it.
     */
    static Item open(hid_t loc, const std::string &path);

    [[nodiscard]] bool is_open() const noexcept { return m_id >= 0; }
    [[nodiscard]] hid_t id() const noexcept { return m_id; }

    /// Absolute path inside the file, e.g. "/entry/data".
    [[nodiscard]] const std::string &path() const noexcept { return m_path; }

    /// Last path component ("/" for the root group).
    [[nodiscard]] std::string name() const;

    [[nodiscard]] ItemKind kind() const;

    /**
     * @brief True if `child` (relative, may contain '/') exists below this group.
     *        Always false for non-groups.
     */
    [[nodiscard]] bool contains(const std::string &child) const;

    /**
     * @brief Names of the immediate children, in creation order when the group
     *        tracks it, in name order otherwise.
     * @throws H5IoError
     */
    [[nodiscard]] std::vector<std::string> child_names() const;

    /**
     * @brief Reads a scalar (or single-element) dataset.
     * @throws H5IoError, std::logic_error if this is not a one-element dataset.
     */
    template <typename T> [[nodiscard]] T read_scalar() const
    {
        static_assert(std::is_arithmetic_v<T>, "read_scalar<T> needs an arithmetic T");
        T value{};
        read_one(native_type<T>(), &value);
        return value;
    }

    void close() noexcept;

  private:
    Item(hid_t id, std::string path) noexcept;

    void read_one(hid_t mem_type, void *out) const;

    template <typename T> static hid_t native_type()
    {
        if constexpr (std::is_same_v<T, bool>)
            return H5T_NATIVE_HBOOL;
        else if constexpr (std::is_same_v<T, float>)
            return H5T_NATIVE_FLOAT;
        else if constexpr (std::is_same_v<T, double>)
            return H5T_NATIVE_DOUBLE;
        else if constexpr (std::is_same_v<T, long double>)
            return H5T_NATIVE_LDOUBLE;
        else if constexpr (std::is_signed_v<T>)
        {
            if constexpr (sizeof(T) == 1)
                return H5T_NATIVE_INT8;
            else if constexpr (sizeof(T) == 2)
                return H5T_NATIVE_INT16;
            else if constexpr (sizeof(T) == 4)
                return H5T_NATIVE_INT32;
            else
                return H5T_NATIVE_INT64;
        }
        else
        {
            if constexpr (sizeof(T) == 1)
                return H5T_NATIVE_UINT8;
            else if constexpr (sizeof(T) == 2)
                return H5T_NATIVE_UINT16;
            else if constexpr (sizeof(T) == 4)
                return H5T_NATIVE_UINT32;
            else
                return H5T_NATIVE_UINT64;
        }
    }

    hid_t m_id{H5I_INVALID_HID};
    std::string m_path;
};

} // namespace h5share::h5

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
