// xfer/notifier.hpp
#pragma once

#include <cerrno>
#include <system_error>
#include <utility>

#include <unistd.h>

#include <sys/eventfd.h>

#include "xfer/io_context.hpp"

namespace xfer
{

/// One-to-one signal between threads over an eventfd.
///
/// A coroutine on some IoContext waits; any thread signals. Signals are
/// counted, so a Signal() that happens before Wait() is not lost. Not a
/// broadcast: concurrent waiters compete for the count.
///
/// @code
///   Notifier done;
///   co_await done.Wait(ctx);   // loop thread
///   done.Signal();             // any thread
/// @endcode
class Notifier
{
public:
    Notifier() : fd_(eventfd(0, EFD_CLOEXEC))
    {
        if (fd_ < 0)
        {
            throw std::system_error(errno, std::system_category(), "eventfd");
        }
    }

    ~Notifier()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
        }
    }

    Notifier(const Notifier&) = delete;
    Notifier& operator=(const Notifier&) = delete;

    Notifier(Notifier&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    struct WaitOp : UringOp
    {
        int fd;
        uint64_t value{};

        WaitOp(IoContext* ctx, int f) : UringOp(ctx), fd(f) {}

        void PrepareSqe(io_uring_sqe* sqe) { io_uring_prep_read(sqe, fd, &value, sizeof(value), 0); }

        /// Number of signals consumed by this wait.
        Result<uint64_t> await_resume()
        {
            if (res < 0)
            {
                return std::unexpected(MakeErrorCode(res));
            }
            return value;
        }
    };

    [[nodiscard]] WaitOp Wait(IoContext& ctx) { return {&ctx, fd_}; }

    /// Thread-safe.
    void Signal(uint64_t count = 1) const { [[maybe_unused]] auto r = ::write(fd_, &count, sizeof(count)); }

private:
    int fd_;
};

}  // namespace xfer
