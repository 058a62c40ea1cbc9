#include "xfer/whole_file_loader.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

#include "xfer/io.hpp"
#include "xfer/io_helpers.hpp"
#include "xfer/logger.hpp"

namespace xfer
{

Result<std::vector<std::byte>> WholeFileLoader::Load(const FileHandle& handle)
{
    const int raw = ::open(handle.path.c_str(), O_RDONLY | O_CLOEXEC | O_NOFOLLOW);
    if (raw < 0)
    {
        const int err = errno;
        XFER_LOG_WARN("load open {} failed: {}", handle.path.string(), std::strerror(err));
        return Fail(ClassifyErrno(err));
    }
    FDGuard fd(raw);

    std::vector<std::byte> data(handle.size);
    size_t filled = 0;
    while (filled < data.size())
    {
        const size_t want = std::min(kReadSlice, data.size() - filled);
        const ssize_t n = ::pread(fd.Get(), data.data() + filled, want, static_cast<off_t>(filled));
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            XFER_LOG_ERROR("load read {} failed: {}", handle.path.string(), std::strerror(errno));
            return Fail(TransferErrc::IoError);
        }
        if (n == 0)
        {
            XFER_LOG_WARN("load {} shrank to {} of {} bytes", handle.name, filled, data.size());
            return Fail(TransferErrc::IoError);
        }
        filled += static_cast<size_t>(n);
    }

    return data;
}

Task<Result<std::vector<std::byte>>> WholeFileLoader::LoadOn(IoContext& ctx, FileHandle handle)
{
    const std::string path = handle.path.string();
    auto opened = co_await AsyncOpen(ctx, path.c_str(), O_RDONLY | O_CLOEXEC | O_NOFOLLOW);
    if (!opened)
    {
        XFER_LOG_WARN("load open {} failed: {}", path, opened.error().message());
        co_return Fail(ClassifyErrno(opened.error().value()));
    }
    FDGuard fd(*opened);

    std::vector<std::byte> data(handle.size);
    size_t filled = 0;
    while (filled < data.size())
    {
        const size_t want = std::min(kReadSlice, data.size() - filled);
        auto n = co_await AsyncReadFull(ctx, fd, std::span(data).subspan(filled, want), filled);
        if (!n)
        {
            XFER_LOG_ERROR("load read {} failed: {}", path, n.error().message());
            co_return Fail(TransferErrc::IoError);
        }
        if (*n < want)
        {
            XFER_LOG_WARN("load {} shrank to {} of {} bytes", handle.name, filled + *n, data.size());
            co_return Fail(TransferErrc::IoError);
        }
        filled += want;
    }

    co_return data;
}

}  // namespace xfer
