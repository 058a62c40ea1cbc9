#include "xfer/file_store.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>

#include <sys/stat.h>

#include "xfer/io.hpp"
#include "xfer/logger.hpp"

namespace xfer
{

namespace
{

std::unexpected<std::error_code> FailFromErrno(std::string_view what, const std::filesystem::path& path, int err)
{
    const auto kind = ClassifyErrno(err);
    if (kind == TransferErrc::IoError)
    {
        XFER_LOG_ERROR("{} {} failed: {}", what, path.string(), std::strerror(err));
    }
    return Fail(kind);
}

}  // namespace

bool IsValidFileName(std::string_view name)
{
    if (name.empty() || name == "." || name == "..")
    {
        return false;
    }
    return name.find('/') == std::string_view::npos && name.find('\0') == std::string_view::npos;
}

LocalFileStore::LocalFileStore(const std::filesystem::path& root)
    : root_(std::filesystem::absolute(root).lexically_normal())
{
}

Result<std::filesystem::path> LocalFileStore::ResolvePath(std::string_view name) const
{
    if (!IsValidFileName(name))
    {
        return Fail(TransferErrc::NotFound);
    }
    return root_ / std::filesystem::path(name);
}

Result<FileHandle> LocalFileStore::Resolve(std::string_view name) const
{
    auto path = ResolvePath(name);
    if (!path)
    {
        return std::unexpected(path.error());
    }

    struct stat st{};
    if (::lstat(path->c_str(), &st) < 0)
    {
        return FailFromErrno("lstat", *path, errno);
    }
    if (!S_ISREG(st.st_mode))
    {
        return Fail(TransferErrc::NotFound);
    }

    return FileHandle{
        .name = std::string(name),
        .path = std::move(*path),
        .size = static_cast<uint64_t>(st.st_size),
    };
}

Result<uint64_t> LocalFileStore::Size(const FileHandle& handle) const
{
    struct stat st{};
    if (::lstat(handle.path.c_str(), &st) < 0)
    {
        return FailFromErrno("lstat", handle.path, errno);
    }
    if (!S_ISREG(st.st_mode))
    {
        return Fail(TransferErrc::NotFound);
    }
    return static_cast<uint64_t>(st.st_size);
}

Task<Result<FileHandle>> LocalFileStore::AsyncResolve(IoContext& ctx, std::string name) const
{
    auto path = ResolvePath(name);
    if (!path)
    {
        co_return std::unexpected(path.error());
    }

    auto stx = co_await AsyncStatx(ctx, path->c_str(), AT_SYMLINK_NOFOLLOW);
    if (!stx)
    {
        co_return FailFromErrno("statx", *path, stx.error().value());
    }
    if (!S_ISREG(stx->stx_mode))
    {
        co_return Fail(TransferErrc::NotFound);
    }

    co_return FileHandle{
        .name = std::move(name),
        .path = std::move(*path),
        .size = static_cast<uint64_t>(stx->stx_size),
    };
}

}  // namespace xfer
