#include "xfer/streaming_transfer.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <sys/socket.h>

#include "xfer/io.hpp"
#include "xfer/logger.hpp"

namespace xfer
{

Result<> SocketSink::Write(std::span<const std::byte> bytes)
{
    while (!bytes.empty())
    {
        const ssize_t n = ::send(fd_, bytes.data(), bytes.size(), MSG_NOSIGNAL);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                return std::unexpected(std::make_error_code(std::errc::timed_out));
            }
            return ErrorFromErrno(errno);
        }
        bytes_written_ += static_cast<uint64_t>(n);
        bytes = bytes.subspan(static_cast<size_t>(n));
    }
    return {};
}

Result<FDGuard> StreamingTransfer::Open(const FileHandle& handle)
{
    const int raw = ::open(handle.path.c_str(), O_RDONLY | O_CLOEXEC | O_NOFOLLOW);
    if (raw < 0)
    {
        const int err = errno;
        XFER_LOG_WARN("stream open {} failed: {}", handle.path.string(), std::strerror(err));
        return Fail(ClassifyErrno(err));
    }
    return FDGuard(raw);
}

Result<TransferReport> StreamingTransfer::Transfer(const FileHandle& handle, ByteSink& sink) const
{
    auto fd = Open(handle);
    if (!fd)
    {
        return std::unexpected(fd.error());
    }
    TransferReport report;
    return Stream(*fd, handle, sink, report);
}

Result<TransferReport> StreamingTransfer::Stream(const FDGuard& fd, const FileHandle& handle, ByteSink& sink,
                                                 TransferReport& out) const
{
    out = {};

    // Exactly handle.size bytes: the response head already announced them.
    std::vector<std::byte> buffer(chunk_size_);
    while (out.bytes < handle.size)
    {
        const auto want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), handle.size - out.bytes));
        const ssize_t n = ::read(fd.Get(), buffer.data(), want);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            XFER_LOG_ERROR("stream read {} failed: {}", handle.path.string(), std::strerror(errno));
            return Fail(TransferErrc::IoError);
        }
        if (n == 0)
        {
            XFER_LOG_WARN("stream {} shrank to {} of {} bytes", handle.name, out.bytes, handle.size);
            return Fail(TransferErrc::IoError);
        }

        auto chunk = std::span<const std::byte>(buffer.data(), static_cast<size_t>(n));
        if (auto w = sink.Write(chunk); !w)
        {
            XFER_LOG_WARN("stream {} stopped after {} bytes: {}", handle.name, out.bytes, w.error().message());
            return Fail(TransferErrc::IoError);
        }
        if (auto f = sink.Flush(); !f)
        {
            XFER_LOG_WARN("stream {} flush failed after {} bytes: {}", handle.name, out.bytes, f.error().message());
            return Fail(TransferErrc::IoError);
        }

        out.bytes += static_cast<uint64_t>(n);
        ++out.chunks;
    }

    return out;
}

}  // namespace xfer
