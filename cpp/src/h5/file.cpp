#include "hsh_service.hpp"

#include "h5/errors.hpp"
#include "h5/file.hpp"
#include "h5_library.hpp"

namespace h5share::h5
{

using detail::H5Id;
using detail::LibraryLock;

namespace
{

struct ResolvedOpen
{
    OpenMode mode;
    bool swmr;
    std::optional<LibverBound> libver;
    bool track_order;
};

H5Id make_fapl(const ResolvedOpen &req, const std::string &path)
{
    H5Id fapl(H5Pcreate(H5P_FILE_ACCESS));
    if (!fapl)
        detail::throw_h5_error("H5Pcreate(file access)", path);
    // Closing the file closes every object still open in it.
    if (H5Pset_fclose_degree(fapl.get(), H5F_CLOSE_STRONG) < 0)
        detail::throw_h5_error("H5Pset_fclose_degree", path);
    if (req.libver &&
        H5Pset_libver_bounds(fapl.get(), detail::to_h5_libver(*req.libver), H5F_LIBVER_LATEST) < 0)
    {
        detail::throw_h5_error("H5Pset_libver_bounds", path);
    }
    return fapl;
}

H5Id make_fcpl(const ResolvedOpen &req, const std::string &path)
{
    H5Id fcpl(H5Pcreate(H5P_FILE_CREATE));
    if (!fcpl)
        detail::throw_h5_error("H5Pcreate(file create)", path);
    if (req.track_order)
    {
        const unsigned flags = H5P_CRT_ORDER_TRACKED | H5P_CRT_ORDER_INDEXED;
        if (H5Pset_link_creation_order(fcpl.get(), flags) < 0 ||
            H5Pset_attr_creation_order(fcpl.get(), flags) < 0)
        {
            detail::throw_h5_error("H5Pset_link_creation_order", path);
        }
    }
    return fcpl;
}

/// One HDF5 open or create call. Returns the new file id.
hid_t open_once(const std::filesystem::path &fs_path, const ResolvedOpen &req)
{
    const std::string path = fs_path.string();
    LibraryLock lock(detail::library_mutex());
    H5Id fapl = make_fapl(req, path);

    auto create = [&](unsigned flags)
    {
        H5Id fcpl = make_fcpl(req, path);
        const hid_t id = H5Fcreate(path.c_str(), flags, fcpl.get(), fapl.get());
        if (id < 0)
            detail::throw_h5_error("H5Fcreate", path);
        return id;
    };
    auto open = [&](unsigned flags)
    {
        const hid_t id = H5Fopen(path.c_str(), flags, fapl.get());
        if (id < 0)
            detail::throw_h5_error("H5Fopen", path);
        return id;
    };

    switch (req.mode)
    {
    case OpenMode::Read:
        return open(req.swmr ? (H5F_ACC_RDONLY | H5F_ACC_SWMR_READ) : H5F_ACC_RDONLY);
    case OpenMode::WriteTruncate:
        return create(H5F_ACC_TRUNC);
    case OpenMode::WriteFailIfExists:
    case OpenMode::WriteCreateExclusive:
        return create(H5F_ACC_EXCL);
    case OpenMode::Append:
        break;
    }
    std::error_code ec;
    if (std::filesystem::exists(fs_path, ec))
        return open(H5F_ACC_RDWR);
    return create(H5F_ACC_EXCL);
}

} // namespace

File File::open(const std::filesystem::path &path, const FileOptions &options)
{
    detail::silence_error_printing();

    ResolvedOpen req{options.mode, options.swmr.value_or(false), options.libver,
                     options.track_order};
    if (req.swmr && !kHasSwmr)
    {
        LOGGER_WARN("File: this HDF5 build has no SWMR support; opening '{}' without it",
                    path.string());
        req.swmr = false;
    }
    const bool swmr_unset = !options.swmr.has_value();
    const bool enable_locking =
        options.enable_locking.value_or(is_write_mode(req.mode) || req.swmr);
    if (req.swmr && !req.libver)
        req.libver = LibverBound::Latest;

    File file;
    file.m_path = path;
    file.m_mode = req.mode;

    auto &policy = utils::LockingPolicy::instance();
    policy.run_open(
        enable_locking,
        [&]
        {
            std::exception_ptr original;
            try
            {
                file.m_id = open_once(path, req);
                file.m_sharing = req.swmr ? SharingMode::Swmr : SharingMode::Plain;
                return;
            }
            catch (const H5IoError &e)
            {
                // TODO: switch to a structured check once HDF5 reports this condition
                // with its own minor error class instead of only the message text.
                if (!(req.mode == OpenMode::Read && swmr_unset && kHasSwmr &&
                      e.is_already_open_for_write()))
                    throw;
                original = std::current_exception();
                LOGGER_DEBUG("File: '{}' is open for write elsewhere; retrying as SWMR reader",
                             path.string());
            }

            ResolvedOpen fallback = req;
            fallback.swmr = true;
            fallback.libver = LibverBound::Latest;
            try
            {
                file.m_id = open_once(path, fallback);
                file.m_sharing = SharingMode::Swmr;
            }
            catch (const H5IoError &e)
            {
                LOGGER_DEBUG("File: SWMR read fallback for '{}' failed: {}", path.string(),
                             e.what());
                std::rethrow_exception(original);
            }
        });
    file.m_policy_session = utils::LockingPolicy::session();

    if (is_write_mode(req.mode) && req.swmr)
    {
        std::optional<H5IoError> swmr_error;
        {
            LibraryLock lock(detail::library_mutex());
            if (H5Fstart_swmr_write(file.m_id) < 0)
                swmr_error.emplace("H5Fstart_swmr_write", path.string(),
                                   detail::capture_error_stack());
        }
        if (swmr_error)
        {
            // Outside the library lock: close() takes the policy mutex first.
            file.release();
            throw *swmr_error;
        }
        file.m_sharing = SharingMode::Swmr;
    }

    LOGGER_DEBUG("File: opened '{}' mode={} sharing={} locking={}", path.string(),
                 to_string(file.m_mode), to_string(file.m_sharing), enable_locking);
    return file;
}

File File::open(const std::filesystem::path &path, std::string_view mode,
                std::optional<bool> swmr)
{
    FileOptions options;
    options.mode = parse_open_mode(mode);
    options.swmr = swmr;
    return open(path, options);
}

File::~File()
{
    release();
}

File::File(File &&other) noexcept
    : m_id(other.m_id), m_path(std::move(other.m_path)), m_mode(other.m_mode),
      m_sharing(other.m_sharing), m_policy_session(other.m_policy_session)
{
    other.m_id = H5I_INVALID_HID;
}

File &File::operator=(File &&other) noexcept
{
    if (this != &other)
    {
        release();
        m_id = other.m_id;
        m_path = std::move(other.m_path);
        m_mode = other.m_mode;
        m_sharing = other.m_sharing;
        m_policy_session = other.m_policy_session;
        other.m_id = H5I_INVALID_HID;
    }
    return *this;
}

void File::close()
{
    if (m_id < 0)
        return;
    const hid_t id = m_id;
    m_id = H5I_INVALID_HID;
    auto close_id = [&]
    {
        LibraryLock lock(detail::library_mutex());
        if (H5Fclose(id) < 0)
            detail::throw_h5_error("H5Fclose", m_path.string());
    };
    // A handle that outlived the policy session it was counted in has already been
    // forgotten by the shutdown; only the HDF5 id is left to close.
    if (utils::LockingPolicy::lifecycle_initialized() &&
        m_policy_session == utils::LockingPolicy::session())
        utils::LockingPolicy::instance().release_one(close_id);
    else
        close_id();
    LOGGER_DEBUG("File: closed '{}'", m_path.string());
}

void File::release() noexcept
{
    try
    {
        close();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("File: closing '{}' failed: {}", m_path.string(), e.what());
    }
}

void File::flush()
{
    LibraryLock lock(detail::library_mutex());
    if (H5Fflush(m_id, H5F_SCOPE_LOCAL) < 0)
        detail::throw_h5_error("H5Fflush", m_path.string());
}

Item File::root() const
{
    return Item::open(m_id, "/");
}

File open_file(const std::filesystem::path &path, const FileOptions &options,
               const utils::RetryPolicy &policy)
{
    return utils::retry([&] { return File::open(path, options); }, policy);
}

} // namespace h5share::h5
