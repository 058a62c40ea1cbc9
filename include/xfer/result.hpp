#pragma once
////////////////////////////////////////////////////////////////////////////////
// Standardized Error Handling
//
// Everything returns std::expected<T, std::error_code>. Kernel failures carry
// the system category; failures that a download request can observe are
// folded into the xfer "transfer" category so that callers only ever have to
// tell NotFound apart from IoError.
////////////////////////////////////////////////////////////////////////////////

#include <cerrno>
#include <expected>
#include <string>
#include <system_error>
#include <type_traits>

namespace xfer
{
template <typename T = void>
using Result = std::expected<T, std::error_code>;

inline std::unexpected<std::error_code> ErrorFromErrno(int err)
{
    return std::unexpected(std::error_code(err, std::system_category()));
}

inline std::error_code MakeErrorCode(int err)
{
    return std::error_code{err > 0 ? err : -err, std::system_category()};
}

enum class TransferErrc
{
    // 0 is reserved for "no error" by std::error_code
    NotFound = 1,
    IoError = 2,
};

namespace detail
{

struct transfer_category_t final : std::error_category
{
    const char* name() const noexcept override { return "transfer"; }

    std::string message(const int ev) const override
    {
        switch (static_cast<TransferErrc>(ev))
        {
            case TransferErrc::NotFound:
                return "file not found";
            case TransferErrc::IoError:
                return "i/o error";
        }
        return "unknown transfer error";
    }
};

}  // namespace detail

inline const std::error_category& transfer_category()
{
    static detail::transfer_category_t cat;
    return cat;
}

inline std::error_code make_error_code(TransferErrc e)
{
    return {static_cast<int>(e), transfer_category()};
}

inline std::unexpected<std::error_code> Fail(TransferErrc e)
{
    return std::unexpected(make_error_code(e));
}

/// Maps a raw errno onto the transfer category. Errors that mean "there is
/// nothing to serve under this name" become NotFound, the rest IoError.
inline TransferErrc ClassifyErrno(int err)
{
    switch (err > 0 ? err : -err)
    {
        case ENOENT:
        case ENOTDIR:
        case EISDIR:
        case ENAMETOOLONG:
        case ELOOP:
            return TransferErrc::NotFound;
        default:
            return TransferErrc::IoError;
    }
}

inline bool IsNotFound(const std::error_code& ec)
{
    return ec == make_error_code(TransferErrc::NotFound);
}

}  // namespace xfer

template <>
struct std::is_error_code_enum<xfer::TransferErrc> : std::true_type
{
};
