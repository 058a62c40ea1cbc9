#include "xfer/net.hpp"

#include <cerrno>

#include <netinet/tcp.h>
#include <sys/time.h>

namespace xfer::net
{

// ----------------------------------------------------------------------------
// Socket Implementation
// ----------------------------------------------------------------------------

void Socket::Close()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

Result<> Socket::SetReuseAddr(bool enable) const
{
    int opt = enable ? 1 : 0;
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0)
    {
        return ErrorFromErrno(errno);
    }
    return {};
}

Result<> Socket::SetReusePort(bool enable) const
{
    int opt = enable ? 1 : 0;
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEPORT, &opt, sizeof(opt)) < 0)
    {
        return ErrorFromErrno(errno);
    }
    return {};
}

Result<> Socket::SetNodelay(bool enable) const
{
    int opt = enable ? 1 : 0;
    if (::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0)
    {
        return ErrorFromErrno(errno);
    }
    return {};
}

Result<SocketAddress> Socket::LocalAddress() const
{
    SocketAddress out;
    out.addrlen = sizeof(out.addr);
    if (::getsockname(fd_, out.GetMutable(), &out.addrlen) < 0)
    {
        return ErrorFromErrno(errno);
    }
    return out;
}

Result<> SetSendTimeout(int fd, std::chrono::milliseconds timeout)
{
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0)
    {
        return ErrorFromErrno(errno);
    }
    return {};
}

// ----------------------------------------------------------------------------
// TcpListener Implementation
// ----------------------------------------------------------------------------

Result<Socket> TcpListener::Bind(const SocketAddress& addr, int backlog)
{
    int fd = ::socket(addr.addr.ss_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        return ErrorFromErrno(errno);
    }

    Socket sock(fd);

    if (auto r = sock.SetReuseAddr(); !r)
    {
        return std::unexpected(r.error());
    }
    if (auto r = sock.SetReusePort(); !r)
    {
        return std::unexpected(r.error());
    }

    if (::bind(fd, addr.Get(), addr.addrlen) < 0)
    {
        return ErrorFromErrno(errno);
    }

    if (::listen(fd, backlog) < 0)
    {
        return ErrorFromErrno(errno);
    }

    return sock;
}

}  // namespace xfer::net
