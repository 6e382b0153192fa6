#include "hsh_base.hpp"

#include "h5/file_options.hpp"
#include "h5_library.hpp"

namespace h5share::h5::detail
{

std::recursive_mutex &library_mutex()
{
    static std::recursive_mutex mutex;
    return mutex;
}

void silence_error_printing()
{
    static std::once_flag once;
    std::call_once(once,
                   []
                   {
                       LibraryLock lock(library_mutex());
                       // Errors are captured into exceptions instead of printed.
                       H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
                   });
}

namespace
{

std::string message_text(hid_t msg_id)
{
    if (msg_id < 0)
        return {};
    const ssize_t len = H5Eget_msg(msg_id, nullptr, nullptr, 0);
    if (len <= 0)
        return {};
    std::string text(static_cast<size_t>(len) + 1, '\0');
    H5Eget_msg(msg_id, nullptr, text.data(), text.size());
    text.resize(static_cast<size_t>(len));
    return text;
}

herr_t collect_record(unsigned /*n*/, const H5E_error2_t *err, void *client_data)
{
    auto *records = static_cast<std::vector<H5ErrorRecord> *>(client_data);
    H5ErrorRecord rec;
    rec.major_id = static_cast<int64_t>(err->maj_num);
    rec.minor_id = static_cast<int64_t>(err->min_num);
    rec.major = message_text(err->maj_num);
    rec.minor = message_text(err->min_num);
    rec.func = err->func_name ? err->func_name : "";
    rec.file = err->file_name ? err->file_name : "";
    rec.line = err->line;
    rec.desc = err->desc ? err->desc : "";
    records->push_back(std::move(rec));
    return 0;
}

} // namespace

std::vector<H5ErrorRecord> capture_error_stack()
{
    std::vector<H5ErrorRecord> records;
    const hid_t stack = H5Eget_current_stack();
    if (stack < 0)
        return records;
    // Upward walk: API entry point first, innermost cause last.
    if (H5Ewalk2(stack, H5E_WALK_UPWARD, &collect_record, &records) < 0)
        H5SHARE_DEBUG("H5Ewalk2 failed; error records may be incomplete");
    H5Eclose_stack(stack);
    return records;
}

void throw_h5_error(const std::string &operation, const std::string &path)
{
    throw H5IoError(operation, path, capture_error_stack());
}

void H5Id::reset() noexcept
{
    if (m_id < 0)
        return;
    LibraryLock lock(library_mutex());
    if (H5Iis_valid(m_id) > 0)
        H5Idec_ref(m_id);
    m_id = H5I_INVALID_HID;
}

PathStatus probe_path(hid_t loc, const std::string &path)
{
    std::string prefix = (!path.empty() && path.front() == '/') ? "/" : "";
    std::size_t pos = 0;
    while (pos < path.size())
    {
        const std::size_t next = path.find('/', pos);
        const std::size_t end = (next == std::string::npos) ? path.size() : next;
        if (end == pos)
        {
            pos = end + 1;
            continue;
        }
        if (!prefix.empty() && prefix.back() != '/')
            prefix += '/';
        prefix.append(path, pos, end - pos);

        bool is_leaf = true;
        for (std::size_t i = end; i < path.size(); ++i)
        {
            if (path[i] != '/')
            {
                is_leaf = false;
                break;
            }
        }

        const htri_t exists = H5Lexists(loc, prefix.c_str(), H5P_DEFAULT);
        if (exists < 0)
            throw_h5_error("H5Lexists", prefix);
        if (exists == 0)
            return is_leaf ? PathStatus::LeafMissing : PathStatus::AncestorMissing;

        if (!is_leaf)
        {
            H5Id obj(H5Oopen(loc, prefix.c_str(), H5P_DEFAULT));
            if (!obj)
                throw_h5_error("H5Oopen", prefix);
            if (H5Iget_type(obj.get()) != H5I_GROUP)
                return PathStatus::AncestorNotGroup;
        }
        pos = end + 1;
    }
    return PathStatus::Exists;
}

H5F_libver_t to_h5_libver(LibverBound bound) noexcept
{
    switch (bound)
    {
    case LibverBound::Earliest:
        return H5F_LIBVER_EARLIEST;
    case LibverBound::V108:
        return H5F_LIBVER_V18;
    case LibverBound::V110:
        return H5F_LIBVER_V110;
    case LibverBound::Latest:
        break;
    }
    return H5F_LIBVER_LATEST;
}

} // namespace h5share::h5::detail
