#include "hsh_base.hpp"

#include "h5/errors.hpp"
#include "h5/file_options.hpp"

namespace h5share::h5
{

OpenMode parse_open_mode(std::string_view text)
{
    if (text == "r")
        return OpenMode::Read;
    if (text == "w")
        return OpenMode::WriteTruncate;
    if (text == "w-")
        return OpenMode::WriteFailIfExists;
    if (text == "x")
        return OpenMode::WriteCreateExclusive;
    if (text == "a")
        return OpenMode::Append;
    throw InvalidModeError(
        fmt::format("invalid file mode '{}' (expected one of r, w, w-, x, a)", text));
}

const char *to_string(OpenMode mode) noexcept
{
    switch (mode)
    {
    case OpenMode::Read:
        return "r";
    case OpenMode::WriteTruncate:
        return "w";
    case OpenMode::WriteFailIfExists:
        return "w-";
    case OpenMode::WriteCreateExclusive:
        return "x";
    case OpenMode::Append:
        return "a";
    }
    return "?";
}

LibverBound parse_libver(std::string_view text)
{
    const auto t = format_tools::trim(text);
    if (format_tools::iequals(t, "earliest"))
        return LibverBound::Earliest;
    if (format_tools::iequals(t, "v108"))
        return LibverBound::V108;
    if (format_tools::iequals(t, "v110"))
        return LibverBound::V110;
    if (format_tools::iequals(t, "latest"))
        return LibverBound::Latest;
    throw std::invalid_argument(fmt::format(
        "invalid library version bound '{}' (expected earliest, v108, v110, latest)", text));
}

const char *to_string(LibverBound bound) noexcept
{
    switch (bound)
    {
    case LibverBound::Earliest:
        return "earliest";
    case LibverBound::V108:
        return "v108";
    case LibverBound::V110:
        return "v110";
    case LibverBound::Latest:
        return "latest";
    }
    return "?";
}

const char *to_string(SharingMode mode) noexcept
{
    return mode == SharingMode::Swmr ? "swmr" : "plain";
}

} // namespace h5share::h5
