#pragma once

#include <chrono>
#include <concepts>
#include <cstddef>
#include <span>
#include <string_view>
#include <utility>

#include <fcntl.h>

#include <sys/stat.h>

#include "xfer/io_context.hpp"
#include "xfer/ip_address.hpp"

namespace xfer
{

/// Owns a raw descriptor and closes it on scope exit.
struct FDGuard
{
    int fd = -1;
    explicit FDGuard(const int f) : fd(f) {}
    ~FDGuard()
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }
    FDGuard(FDGuard&& other) noexcept : fd(std::exchange(other.fd, -1)) {}
    FDGuard(const FDGuard&) = delete;
    FDGuard& operator=(const FDGuard&) = delete;
    [[nodiscard]] int Get() const { return fd; }
    int Release() { return std::exchange(fd, -1); }
};

// -----------------------------------------------------------------------------
// Concepts & Helpers
// -----------------------------------------------------------------------------

// Matches int, or any type with a .Get() -> int method (Socket, FDGuard)
template <typename T>
concept FileDescriptor = std::convertible_to<T, int> || requires(const T& t) {
    { t.Get() } -> std::convertible_to<int>;
};

constexpr int GetRawFd(const FileDescriptor auto& fd)
{
    if constexpr (std::convertible_to<decltype(fd), int>)
    {
        return static_cast<int>(fd);
    }
    else
    {
        return fd.Get();
    }
}

// -----------------------------------------------------------------------------
// Sockets
// -----------------------------------------------------------------------------

struct AcceptResult
{
    int fd{-1};
    net::SocketAddress addr;
};

struct AcceptOp : UringOp
{
    int fd;
    net::SocketAddress client_addr{};

    template <FileDescriptor F>
    AcceptOp(IoContext& ctx, const F& f) : UringOp(&ctx), fd(GetRawFd(f))
    {
    }

    void PrepareSqe(io_uring_sqe* sqe)
    {
        // Accepted sockets are blocking and close-on-exec. Blocking matters:
        // the BlockingStream path writes to them with plain send(2).
        io_uring_prep_accept(sqe, fd, client_addr.GetMutable(), &client_addr.addrlen, SOCK_CLOEXEC);
    }

    Result<AcceptResult> await_resume()
    {
        if (res < 0)
        {
            return std::unexpected(MakeErrorCode(res));
        }
        return AcceptResult{res, client_addr};
    }
};

/// @brief Accepts one connection on a listening socket.
///
/// @code
///   auto client = co_await AsyncAccept(ctx, listener).WithTimeout(200ms);
///   if (client) {
///       FDGuard guard(client->fd);
///   }
/// @endcode
template <FileDescriptor F>
AcceptOp AsyncAccept(IoContext& ctx, const F& f)
{
    return AcceptOp(ctx, f);
}

struct RecvOp : UringOp
{
    int fd;
    std::span<std::byte> buffer;
    int flags;

    template <FileDescriptor F>
    RecvOp(IoContext& ctx, const F& f, std::span<std::byte> buf, int flags)
        : UringOp(&ctx), fd(GetRawFd(f)), buffer(buf), flags(flags)
    {
    }

    void PrepareSqe(io_uring_sqe* sqe) { io_uring_prep_recv(sqe, fd, buffer.data(), buffer.size(), flags); }
};

/// @brief Receives into buffer. Yields 0 on orderly shutdown by the peer.
/// @warning The buffer must remain valid until co_await returns!
template <FileDescriptor F>
RecvOp AsyncRecv(IoContext& ctx, const F& f, std::span<std::byte> buffer, int flags = 0)
{
    return RecvOp{ctx, f, buffer, flags};
}

struct SendOp : UringOp
{
    int fd;
    std::span<const std::byte> buffer;
    int flags;

    template <FileDescriptor F>
    SendOp(IoContext& ctx, const F& f, std::span<const std::byte> buf, int flags)
        : UringOp(&ctx), fd(GetRawFd(f)), buffer(buf), flags(flags)
    {
    }

    void PrepareSqe(io_uring_sqe* sqe) const { io_uring_prep_send(sqe, fd, buffer.data(), buffer.size(), flags); }
};

/// @brief Sends from buffer. May be partial; see AsyncSendExact.
/// @warning The buffer must remain valid until co_await returns!
template <FileDescriptor F>
SendOp AsyncSend(IoContext& ctx, const F& f, std::span<const std::byte> buffer, int flags = 0)
{
    return SendOp{ctx, f, buffer, flags};
}

// -----------------------------------------------------------------------------
// Files
// -----------------------------------------------------------------------------

struct OpenOp : UringOp
{
    const char* path;
    int flags;
    mode_t mode;

    OpenOp(IoContext& ctx, const char* p, int f, mode_t m) : UringOp(&ctx), path(p), flags(f), mode(m) {}

    void PrepareSqe(io_uring_sqe* sqe) { io_uring_prep_openat(sqe, AT_FDCWD, path, flags, mode); }

    Result<int> await_resume()
    {
        if (res < 0)
        {
            return std::unexpected(MakeErrorCode(res));
        }
        return res;
    }
};

/// @brief Opens path relative to the working directory.
/// @warning path must stay valid until co_await returns.
inline OpenOp AsyncOpen(IoContext& ctx, const char* path, int flags, mode_t mode = 0)
{
    return OpenOp(ctx, path, flags, mode);
}

struct ReadOp : UringOp
{
    int fd;
    std::span<std::byte> buffer;
    uint64_t offset;

    template <FileDescriptor F>
    ReadOp(IoContext& ctx, const F& f, std::span<std::byte> buf, uint64_t off)
        : UringOp(&ctx), fd(GetRawFd(f)), buffer(buf), offset(off)
    {
    }

    void PrepareSqe(io_uring_sqe* sqe) { io_uring_prep_read(sqe, fd, buffer.data(), buffer.size(), offset); }
};

/// @brief Positional read. Yields 0 at end of file.
/// @warning The buffer must remain valid until co_await returns!
template <FileDescriptor F>
ReadOp AsyncRead(IoContext& ctx, const F& f, std::span<std::byte> buffer, uint64_t offset = 0)
{
    return ReadOp{ctx, f, buffer, offset};
}

struct StatxOp : UringOp
{
    const char* path;
    int flags;
    unsigned mask;
    struct statx stx{};

    StatxOp(IoContext& ctx, const char* p, int fl, unsigned m) : UringOp(&ctx), path(p), flags(fl), mask(m) {}

    void PrepareSqe(io_uring_sqe* sqe) { io_uring_prep_statx(sqe, AT_FDCWD, path, flags, mask, &stx); }

    Result<struct statx> await_resume()
    {
        if (res < 0)
        {
            return std::unexpected(MakeErrorCode(res));
        }
        return stx;
    }
};

/// @brief statx(2) without blocking the loop. Pass AT_SYMLINK_NOFOLLOW to
///        inspect a link itself rather than its target.
/// @warning path must stay valid until co_await returns.
inline StatxOp AsyncStatx(IoContext& ctx, const char* path, int flags = 0,
                          unsigned mask = STATX_TYPE | STATX_SIZE)
{
    return StatxOp(ctx, path, flags, mask);
}

// -----------------------------------------------------------------------------
// Timers
// -----------------------------------------------------------------------------

struct SleepOp : UringOp
{
    __kernel_timespec ts{};

    template <typename Rep, typename Period>
    SleepOp(IoContext& ctx, std::chrono::duration<Rep, Period> dur) : UringOp(&ctx)
    {
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(dur).count();
        ts.tv_sec = ns / 1'000'000'000;
        ts.tv_nsec = ns % 1'000'000'000;
    }

    void PrepareSqe(io_uring_sqe* sqe) { io_uring_prep_timeout(sqe, &ts, 0, 0); }

    Result<void> await_resume()
    {
        // -ETIME is the normal expiry
        if (res < 0 && res != -ETIME)
        {
            return std::unexpected(MakeErrorCode(res));
        }
        return {};
    }
};

/// @brief Suspends the coroutine without blocking the loop thread.
template <typename Rep, typename Period>
SleepOp AsyncSleep(IoContext& ctx, std::chrono::duration<Rep, Period> dur)
{
    return SleepOp(ctx, dur);
}

}  // namespace xfer
