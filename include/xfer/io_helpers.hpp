#pragma once

#include <algorithm>
#include <chrono>
#include <span>
#include <string_view>

#include <sys/socket.h>

#include "xfer/io.hpp"
#include "xfer/io_context.hpp"
#include "xfer/result.hpp"
#include "xfer/task.hpp"

namespace xfer
{

namespace detail
{

struct SpliceOp : UringOp
{
    int fd_in;
    int64_t off_in;
    int fd_out;
    int64_t off_out;
    unsigned int len;
    unsigned int flags;

    SpliceOp(IoContext& ctx, int in, int64_t off_in, int out, int64_t off_out, unsigned int length, unsigned int fl)
        : UringOp(&ctx), fd_in(in), off_in(off_in), fd_out(out), off_out(off_out), len(length), flags(fl)
    {
    }

    void PrepareSqe(io_uring_sqe* sqe) { io_uring_prep_splice(sqe, fd_in, off_in, fd_out, off_out, len, flags); }
};

inline SpliceOp AsyncSplice(IoContext& ctx, int fd_in, int64_t off_in, int fd_out, int64_t off_out, unsigned int len,
                            unsigned int flags = 0)
{
    return SpliceOp(ctx, fd_in, off_in, fd_out, off_out, len, flags);
}

}  // namespace detail

// -----------------------------------------------------------------------------
// Exact Send / Read Helpers
// -----------------------------------------------------------------------------

/// @brief Sends every byte of buffer, looping on partial sends. Each send is
///        bounded by timeout; a peer that stops reading yields timed_out.
///        MSG_NOSIGNAL is always set, so a vanished peer yields EPIPE, not SIGPIPE.
/// @warning The buffer must remain valid until co_await returns!
template <FileDescriptor F>
Task<Result<void>> AsyncSendExact(IoContext& ctx, const F& f, std::span<const std::byte> buffer,
                                  std::chrono::milliseconds timeout)
{
    size_t total = 0;
    const size_t target = buffer.size();

    while (total < target)
    {
        auto result = co_await AsyncSend(ctx, f, buffer.subspan(total), MSG_NOSIGNAL).WithTimeout(timeout);
        if (!result)
        {
            co_return std::unexpected(result.error());
        }

        if (*result == 0)
        {
            co_return std::unexpected(std::make_error_code(std::errc::broken_pipe));
        }

        total += *result;
    }

    co_return Result<void>{};
}

template <FileDescriptor F>
Task<Result<void>> AsyncSendExact(IoContext& ctx, const F& f, std::string_view text, std::chrono::milliseconds timeout)
{
    co_return co_await AsyncSendExact(ctx, f, std::as_bytes(std::span(text.data(), text.size())), timeout);
}

/// @brief Fills buffer from offset, looping on short reads.
/// @return Bytes read; fewer than buffer.size() only when end of file came first.
/// @warning The buffer must remain valid until co_await returns!
template <FileDescriptor F>
Task<Result<size_t>> AsyncReadFull(IoContext& ctx, const F& f, std::span<std::byte> buffer, uint64_t offset)
{
    size_t total = 0;
    while (total < buffer.size())
    {
        auto result = co_await AsyncRead(ctx, f, buffer.subspan(total), offset + total);
        if (!result)
        {
            co_return std::unexpected(result.error());
        }
        if (*result == 0)
        {
            break;
        }
        total += *result;
    }
    co_return total;
}

// -----------------------------------------------------------------------------
// Sendfile Helper
// -----------------------------------------------------------------------------

/// @brief Zero-copy file-to-socket transfer: file -> pooled pipe -> socket,
///        in 64 KiB rounds of splice(2).
/// @param on_sent Invoked with the byte count of every round delivered to the
///        socket, so callers can tell "nothing sent" from "truncated".
/// @return Success only once count bytes reached the socket. End of file before
///         count bytes is an error (the file shrank under us).
///
/// @code
///   auto sent = co_await AsyncSendfile(ctx, client, file_fd, 0, size, 5s, [&](size_t n) { total += n; });
/// @endcode
template <FileDescriptor Fout, FileDescriptor Fin, typename OnSent>
Task<Result<void>> AsyncSendfile(IoContext& ctx, const Fout& out_fd, const Fin& in_fd, off_t offset, size_t count,
                                 std::chrono::milliseconds timeout, OnSent on_sent)
{
    auto pipe_guard = ctx.GetPipePool().AcquireGuarded();
    if (!pipe_guard)
    {
        co_return std::unexpected(std::make_error_code(std::errc::too_many_files_open));
    }

    const int pipe_read = pipe_guard->Get().read_fd;
    const int pipe_write = pipe_guard->Get().write_fd;

    size_t remaining = count;
    off_t current_offset = offset;

    constexpr size_t kChunkSize = 65536;

    while (remaining > 0)
    {
        const auto to_splice = static_cast<unsigned int>(std::min(remaining, kChunkSize));

        // File -> pipe. A regular file never blocks, so no timeout here.
        size_t bytes_in_pipe = 0;
        while (bytes_in_pipe < to_splice)
        {
            auto res = co_await detail::AsyncSplice(ctx, GetRawFd(in_fd), current_offset, pipe_write, -1,
                                                    to_splice - bytes_in_pipe, 0);
            if (!res)
            {
                pipe_guard->Discard();
                co_return std::unexpected(res.error());
            }
            if (*res == 0)
            {
                break;
            }
            bytes_in_pipe += *res;
            current_offset += static_cast<off_t>(*res);
        }

        if (bytes_in_pipe == 0)
        {
            co_return std::unexpected(std::make_error_code(std::errc::no_message_available));
        }

        // Pipe -> socket, draining exactly what went in
        size_t bytes_flushed = 0;
        while (bytes_flushed < bytes_in_pipe)
        {
            auto res = co_await detail::AsyncSplice(ctx, pipe_read, -1, GetRawFd(out_fd), -1,
                                                    static_cast<unsigned int>(bytes_in_pipe - bytes_flushed),
                                                    SPLICE_F_MOVE)
                           .WithTimeout(timeout);
            if (!res || *res == 0)
            {
                pipe_guard->Discard();
                co_return std::unexpected(res ? std::make_error_code(std::errc::broken_pipe) : res.error());
            }

            bytes_flushed += *res;
            on_sent(*res);
        }

        remaining -= bytes_in_pipe;
    }

    co_return Result<void>{};
}

}  // namespace xfer
