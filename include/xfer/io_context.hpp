#pragma once

/**
 * io_context.hpp - the per-thread event loop of the download server
 *
 * Design:
 * - One IoContext per thread. Only the owning thread submits to the ring
 *   (IORING_SETUP_SINGLE_ISSUER); other threads talk to it through Notify()
 *   and EnqueueExternalDone().
 * - The coroutine handle of the awaiting frame lives in the operation, and the
 *   operation address is the SQE user_data, so a CQE resumes its frame directly.
 * - Pending operations sit on an intrusive list so shutdown can cancel and
 *   drain them before the ring goes away.
 * - Callers own buffers; the loop itself never allocates per operation.
 *
 * !! IMPORTANT !!
 * Operations are embedded in coroutine frames. Destroying a task that is
 * suspended on I/O terminates the process (see OperationState). Bound every
 * network wait with .WithTimeout() and keep tasks in a TaskGroup until they
 * finish.
 *
 * Requirements: Linux >= 6.1 (DEFER_TASKRUN), liburing, C++23.
 */

#include <atomic>
#include <chrono>
#include <coroutine>
#include <csignal>
#include <cstdio>
#include <exception>
#include <expected>
#include <initializer_list>
#include <latch>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <liburing.h>
#include <unistd.h>

#include <sys/eventfd.h>
#include <sys/signalfd.h>

#include "xfer/operation_base.hpp"
#include "xfer/pipe_pool.hpp"
#include "xfer/result.hpp"
#include "xfer/task.hpp"

namespace xfer
{

namespace detail
{
/// Reserved user_data value for the internal eventfd wake read
constexpr uint64_t WAKE_TAG = 1;
}  // namespace detail

// -----------------------------------------------------------------------------
// IoContext - The Event Loop
// -----------------------------------------------------------------------------

class IoContext
{
#ifndef NDEBUG
    std::thread::id owner_thread_ = std::this_thread::get_id();
#endif

    void AssertOwnerThread() const
    {
#ifndef NDEBUG
        if (std::this_thread::get_id() != owner_thread_)
        {
            std::fprintf(stderr, "[xfer] FATAL: IoContext accessed from a foreign thread\n");
            std::terminate();
        }
#endif
    }

public:
    explicit IoContext(const unsigned entries = 256)
    {
        io_uring_params params{};
        params.flags |= IORING_SETUP_COOP_TASKRUN | IORING_SETUP_SINGLE_ISSUER | IORING_SETUP_DEFER_TASKRUN;

        if (const int ret = io_uring_queue_init_params(entries, &ring_, &params); ret < 0)
        {
            throw std::system_error(-ret, std::system_category(), "io_uring_queue_init_params");
        }

        ready_.reserve(entries);
        ext_done_.reserve(entries);

        wake_fd_ = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
        if (wake_fd_ < 0)
        {
            const int err = errno;
            io_uring_queue_exit(&ring_);
            throw std::system_error(err, std::system_category(), "eventfd");
        }

        SubmitWakeRead();
        io_uring_submit(&ring_);
    }

    ~IoContext() noexcept
    {
        CancelAllPending();
        if (wake_fd_ >= 0)
        {
            ::close(wake_fd_);
            wake_fd_ = -1;
        }
        io_uring_queue_exit(&ring_);
    }

    IoContext(const IoContext&) = delete;
    IoContext& operator=(const IoContext&) = delete;

    // -------------------------------------------------------------------------
    // Thread-Safe Signaling
    // -------------------------------------------------------------------------

    /**
     * Wakes the event loop from any thread. Writes to the eventfd only, so it
     * never touches the ring and is safe with SINGLE_ISSUER.
     */
    bool Notify() const noexcept
    {
        if (wake_fd_ == -1)
        {
            return false;
        }
        constexpr uint64_t val = 1;
        return ::write(wake_fd_, &val, sizeof(val)) == sizeof(val);
    }

    // -------------------------------------------------------------------------
    // Operation Tracking
    // -------------------------------------------------------------------------

    void Track(OperationState* op)
    {
        AssertOwnerThread();

        op->tracked = true;
        op->next = pending_head_;
        op->prev = nullptr;
        if (pending_head_ != nullptr)
        {
            pending_head_->prev = op;
        }
        pending_head_ = op;
    }

    void Untrack(OperationState* op)
    {
        AssertOwnerThread();

        if (op->prev != nullptr)
        {
            op->prev->next = op->next;
        }
        else if (pending_head_ == op)
        {
            pending_head_ = op->next;
        }
        if (op->next != nullptr)
        {
            op->next->prev = op->prev;
        }
        op->next = nullptr;
        op->prev = nullptr;
        op->tracked = false;
    }

    /**
     * Cancels every pending operation and waits until all of them are
     * untracked. Coroutines are NOT resumed; their handles are dropped.
     * Operations owned by another thread (offloaded work) are waited for, not
     * cancelled, since the kernel does not know about them.
     */
    void CancelAllPending()
    {
        for (const auto* op = pending_head_; op != nullptr; op = op->next)
        {
            io_uring_sqe* sqe = io_uring_get_sqe(&ring_);
            if (sqe == nullptr)
            {
                io_uring_submit(&ring_);
                sqe = io_uring_get_sqe(&ring_);
                if (sqe == nullptr)
                {
                    break;
                }
            }
            io_uring_prep_cancel(sqe, op, 0);
            io_uring_sqe_set_data(sqe, nullptr);
        }
        io_uring_submit(&ring_);

        DrainWithoutResume();
    }

    // -------------------------------------------------------------------------
    // Event Loop
    // -------------------------------------------------------------------------

    template <typename T>
    void RunUntilDone(Task<T>& t)
    {
        AssertOwnerThread();

        t.resume();
        while (running_ && !t.Done())
        {
            Step();
        }
    }

    void Run()
    {
        AssertOwnerThread();

        while (running_)
        {
            Step();
        }
    }

    /// Runs the loop and calls tick() after every batch of completions.
    template <typename Tick>
    void Run(Tick&& tick)
    {
        AssertOwnerThread();

        while (running_)
        {
            Step();
            tick();
        }
    }

    // Sticky: a Stop() that lands before Run() still ends the loop.
    void Stop() { running_ = false; }
    bool Running() const { return running_.load(std::memory_order_relaxed); }

    // ---------------------------------------------------------------------
    // Cross-thread completion injection
    // ---------------------------------------------------------------------

    /**
     * Hands an operation finished on another thread back to this loop. The op
     * is resumed on the loop thread. Returns true when the caller must Notify()
     * (no wake is in flight yet).
     */
    bool EnqueueExternalDone(OperationState* op)
    {
        std::scoped_lock lk(ext_mtx_);
        ext_done_.push_back(op);
        ext_hint_.store(true, std::memory_order_relaxed);
        if (!ext_wake_pending_)
        {
            ext_wake_pending_ = true;
            return true;
        }
        return false;
    }

    /// EnqueueExternalDone followed by Notify() when one is needed.
    void PostCompletion(OperationState* op)
    {
        if (EnqueueExternalDone(op))
        {
            Notify();
        }
    }

    // -------------------------------------------------------------------------
    // Low-level Access
    // -------------------------------------------------------------------------

    /// Pipes used by splice-based sends. Created on first use.
    PipePool& GetPipePool()
    {
        if (!pipe_pool_)
        {
            pipe_pool_.emplace(4);
        }
        return *pipe_pool_;
    }

    void EnsureSqes(const unsigned n)
    {
        AssertOwnerThread();

        if (io_uring_sq_space_left(&ring_) < n)
        {
            io_uring_submit(&ring_);

            if (io_uring_sq_space_left(&ring_) < n)
            {
                throw std::runtime_error("SQ full after submit");
            }
        }
    }

    io_uring_sqe* GetSqe()
    {
        AssertOwnerThread();

        return io_uring_get_sqe(&ring_);
    }

private:
    bool SwapExternal(std::vector<OperationState*>& local)
    {
        if (!ext_hint_.load(std::memory_order_relaxed))
        {
            return false;
        }

        std::scoped_lock lk(ext_mtx_);
        local.swap(ext_done_);
        ext_wake_pending_ = false;
        ext_hint_.store(false, std::memory_order_relaxed);
        return !local.empty();
    }

    void DrainExternal(std::vector<std::coroutine_handle<>>& out)
    {
        std::vector<OperationState*> local;
        if (!SwapExternal(local))
        {
            return;
        }

        for (auto* op : local)
        {
            Untrack(op);
            out.push_back(op->handle);
        }
    }

    void DrainExternalWithoutResume()
    {
        std::vector<OperationState*> local;
        if (!SwapExternal(local))
        {
            return;
        }

        for (auto* op : local)
        {
            Untrack(op);
            op->handle = {};
        }
    }

    /**
     * Waits for completions until nothing is tracked, without resuming.
     * The wake read is re-armed each time it fires so that operations still
     * running on other threads can report back.
     */
    void DrainWithoutResume()
    {
        DrainExternalWithoutResume();
        while (pending_head_ != nullptr)
        {
            io_uring_cqe* cqe = nullptr;
            int ret = 0;
            do
            {
                ret = io_uring_wait_cqe(&ring_, &cqe);
            } while (ret == -EINTR);

            if (ret < 0)
            {
                break;
            }

            const auto ud = io_uring_cqe_get_data64(cqe);
            io_uring_cqe_seen(&ring_, cqe);

            if (ud == detail::WAKE_TAG)
            {
                SubmitWakeRead();
                io_uring_submit(&ring_);
                DrainExternalWithoutResume();
            }
            else if (ud != 0)
            {
                auto* op = reinterpret_cast<OperationState*>(static_cast<uintptr_t>(ud));
                Untrack(op);
            }
        }
    }

    void SubmitWakeRead()
    {
        auto* sqe = io_uring_get_sqe(&ring_);
        if (sqe == nullptr)
        {
            io_uring_submit(&ring_);
            sqe = io_uring_get_sqe(&ring_);
            if (sqe == nullptr)
            {
                throw std::runtime_error("no SQE left to arm the wake read");
            }
        }

        io_uring_prep_read(sqe, wake_fd_, &wake_buffer_, sizeof(wake_buffer_), 0);
        io_uring_sqe_set_data64(sqe, detail::WAKE_TAG);
    }

    void Step()
    {
        int ret = 0;
        do
        {
            ret = io_uring_submit_and_wait(&ring_, 1);
        } while (ret == -EINTR);

        if (ret < 0 && ret != -EBUSY && ret != -EAGAIN)
        {
            throw std::system_error(-ret, std::system_category(), "io_uring_submit_and_wait");
        }

        ready_.clear();

        const bool saw_wake = ProcessReadyCompletions();

        if (saw_wake || ext_hint_.load(std::memory_order_relaxed))
        {
            DrainExternal(ready_);
        }

        // Resume outside CQE iteration (flat, no stack growth)
        for (auto h : ready_)
        {
            if (h && !h.done())
            {
                h.resume();
            }
        }
    }

    // Collects resumable handles into ready_; returns whether the wake fired.
    bool ProcessReadyCompletions()
    {
        io_uring_cqe* cqe = nullptr;
        unsigned head = 0;
        unsigned count = 0;
        bool saw_wake = false;

        io_uring_for_each_cqe(&ring_, head, cqe)
        {
            count++;
            const auto user_data = io_uring_cqe_get_data64(cqe);

            if (user_data == 0)
            {
                continue;
            }

            if (user_data == detail::WAKE_TAG)
            {
                saw_wake = true;
                SubmitWakeRead();
                continue;
            }

            auto* op = reinterpret_cast<OperationState*>(static_cast<uintptr_t>(user_data));
            Untrack(op);
            op->res = cqe->res;
            ready_.push_back(op->handle);
        }

        io_uring_cq_advance(&ring_, count);

        return saw_wake;
    }

    io_uring ring_{};
    std::vector<std::coroutine_handle<>> ready_;
    OperationState* pending_head_ = nullptr;
    std::atomic<bool> running_ = true;

    int wake_fd_ = -1;
    uint64_t wake_buffer_ = 0;

    // Completions produced by other threads (blocking pool, carriers).
    std::mutex ext_mtx_;
    std::vector<OperationState*> ext_done_;
    bool ext_wake_pending_ = false;       // protected by ext_mtx_
    std::atomic<bool> ext_hint_ = false;  // fast-path hint (may be stale)

    std::optional<PipePool> pipe_pool_;
};

// -----------------------------------------------------------------------------
// Base for Operations (explicit object parameter)
// -----------------------------------------------------------------------------

struct UringOp : OperationState
{
protected:
    explicit UringOp(IoContext* c) { ctx = c; }

    UringOp(UringOp&&) = default;

public:
    bool await_ready() const noexcept { return false; }

    void await_suspend(this auto& self, std::coroutine_handle<> h)
    {
        self.handle = h;
        auto* op = static_cast<OperationState*>(&self);
        self.ctx->Track(op);
        self.ctx->EnsureSqes(1);
        auto* sqe = self.ctx->GetSqe();
        self.PrepareSqe(sqe);
        io_uring_sqe_set_data(sqe, op);
    }

    // Default: byte count for read/write style ops
    Result<size_t> await_resume()
    {
        if (res < 0)
        {
            return std::unexpected(MakeErrorCode(res));
        }
        return static_cast<size_t>(res);
    }

    template <typename Rep, typename Period>
    auto WithTimeout(this auto&& self, std::chrono::duration<Rep, Period> dur)
        requires std::is_rvalue_reference_v<decltype(self)> &&
                 (!std::is_const_v<std::remove_reference_t<decltype(self)>>);
};

// -----------------------------------------------------------------------------
// Signal Handling
// -----------------------------------------------------------------------------

/**
 * RAII signalfd. Blocking on purpose: a non-blocking signalfd makes io_uring
 * complete reads with EAGAIN while no signal is pending.
 */
class SignalSet
{
public:
    SignalSet(std::initializer_list<int> sigs)
    {
        sigset_t mask;
        sigemptyset(&mask);
        for (const int s : sigs)
        {
            sigaddset(&mask, s);
        }

        if (pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0)
        {
            throw std::system_error(errno, std::system_category(), "pthread_sigmask");
        }

        fd_ = signalfd(-1, &mask, SFD_CLOEXEC);
        if (fd_ < 0)
        {
            throw std::system_error(errno, std::system_category(), "signalfd");
        }
    }

    ~SignalSet()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

    SignalSet(const SignalSet&) = delete;
    SignalSet& operator=(const SignalSet&) = delete;

    int Get() const { return fd_; }

private:
    int fd_ = -1;
};

struct WaitSignalOp : UringOp
{
    int fd;
    signalfd_siginfo info{};

    WaitSignalOp(IoContext& ctx, int signal_fd) : UringOp(&ctx), fd(signal_fd) {}

    void PrepareSqe(io_uring_sqe* sqe) { io_uring_prep_read(sqe, fd, &info, sizeof(info), 0); }

    Result<int> await_resume()
    {
        if (res < 0)
        {
            return std::unexpected(MakeErrorCode(res));
        }
        return static_cast<int>(info.ssi_signo);
    }
};

inline WaitSignalOp AsyncWaitSignal(IoContext& ctx, const SignalSet& signals)
{
    return WaitSignalOp(ctx, signals.Get());
}

// -----------------------------------------------------------------------------
// Timeout Wrapper
// -----------------------------------------------------------------------------

/// Links an IORING_OP_LINK_TIMEOUT behind the wrapped op. A fired timeout
/// surfaces as std::errc::timed_out.
template <typename Op>
struct WithTimeoutOp
{
    Op op;
    __kernel_timespec ts{};

    template <typename Rep, typename Period>
    WithTimeoutOp(Op&& o, std::chrono::duration<Rep, Period> dur) : op(std::move(o))
    {
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(dur).count();
        ts.tv_sec = ns / 1'000'000'000;
        ts.tv_nsec = ns % 1'000'000'000;
    }

    bool await_ready() const noexcept { return false; }

    void await_suspend(std::coroutine_handle<> h)
    {
        op.handle = h;
        op.ctx->Track(&op);
        op.ctx->EnsureSqes(2);

        auto* sqe_op = op.ctx->GetSqe();
        op.PrepareSqe(sqe_op);
        sqe_op->flags |= IOSQE_IO_LINK;
        io_uring_sqe_set_data(sqe_op, &op);

        // user_data 0: the loop skips the timer's own CQE
        auto* sqe_timer = op.ctx->GetSqe();
        io_uring_prep_link_timeout(sqe_timer, &ts, 0);
        io_uring_sqe_set_data(sqe_timer, nullptr);
    }

    auto await_resume()
    {
        auto r = op.await_resume();
        if (!r && r.error().value() == ECANCELED)
        {
            return decltype(r)(std::unexpected(std::make_error_code(std::errc::timed_out)));
        }
        return r;
    }
};

template <typename Rep, typename Period>
auto UringOp::WithTimeout(this auto&& self, std::chrono::duration<Rep, Period> dur)
    requires std::is_rvalue_reference_v<decltype(self)> &&
             (!std::is_const_v<std::remove_reference_t<decltype(self)>>)
{
    using Op = std::remove_cvref_t<decltype(self)>;
    return WithTimeoutOp<Op>(std::forward<decltype(self)>(self), dur);
}

}  // namespace xfer
