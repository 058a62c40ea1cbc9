#pragma once
////////////////////////////////////////////////////////////////////////////////
// Network utilities for xfer
//
// Socket RAII, listener setup and the socket options the transfer paths need.
////////////////////////////////////////////////////////////////////////////////

#include <chrono>
#include <cstdint>
#include <utility>

#include <unistd.h>

#include <sys/socket.h>

#include "xfer/ip_address.hpp"
#include "xfer/result.hpp"

namespace xfer::net
{

////////////////////////////////////////////////////////////////////////////////
// Socket - RAII wrapper for file descriptors
////////////////////////////////////////////////////////////////////////////////

/// @brief Move-only owner of a socket descriptor.
///
/// @code
///   auto listener = TcpListener::Bind(*SocketAddress::V4(0, "127.0.0.1"));
///   if (!listener) return;
///   auto client = co_await AsyncAccept(ctx, *listener);
/// @endcode
class Socket
{
    int fd_ = -1;

public:
    Socket() = default;
    explicit Socket(int fd) : fd_(fd) {}

    ~Socket() noexcept
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
        }
    }

    Socket(Socket&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    Socket& operator=(Socket&& other) noexcept
    {
        if (this != &other)
        {
            if (fd_ >= 0)
            {
                ::close(fd_);
            }
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    /// @note The Socket keeps ownership; do not close the returned fd.
    [[nodiscard]] int Get() const { return fd_; }
    [[nodiscard]] bool IsValid() const { return fd_ >= 0; }
    explicit operator bool() const { return IsValid(); }

    int Release() { return std::exchange(fd_, -1); }
    void Close();

    Result<> SetReuseAddr(bool enable = true) const;
    Result<> SetReusePort(bool enable = true) const;
    Result<> SetNodelay(bool enable = true) const;

    /// @brief The address the kernel actually bound (useful after binding port 0).
    Result<SocketAddress> LocalAddress() const;
};

/// @brief Bounds blocking send(2) calls on fd (SO_SNDTIMEO). A send that
///        stalls longer than timeout fails with EAGAIN.
Result<> SetSendTimeout(int fd, std::chrono::milliseconds timeout);

////////////////////////////////////////////////////////////////////////////////
// TcpListener - Factory for server sockets
////////////////////////////////////////////////////////////////////////////////

struct TcpListener
{
    /// @brief socket + SO_REUSEADDR + SO_REUSEPORT + bind + listen.
    ///        The socket is non-blocking and ready for AsyncAccept().
    static Result<Socket> Bind(const SocketAddress& addr, int backlog = 4096);
};

}  // namespace xfer::net
