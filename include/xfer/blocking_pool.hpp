#pragma once
// xfer/blocking_pool.hpp
// Bounded worker pool for blocking file and socket work.
//
// A fixed set of OS threads drains one FIFO queue. The queue is unbounded:
// when every thread is busy, submissions wait their turn instead of being
// rejected, so the thread count is the ceiling on concurrent blocking work.

#include <atomic>
#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

#include "xfer/io_context.hpp"
#include "xfer/operation_base.hpp"

namespace xfer
{

class BlockingPool
{
public:
    using job_t = std::move_only_function<void() noexcept>;

    explicit BlockingPool(std::size_t threads)
    {
        if (threads == 0)
        {
            threads = 1;
        }
        workers_.reserve(threads);
        for (std::size_t i = 0; i < threads; ++i)
        {
            workers_.emplace_back([this] { WorkerLoop(); });
        }
    }

    ~BlockingPool() { Stop(); }

    BlockingPool(const BlockingPool&) = delete;
    BlockingPool& operator=(const BlockingPool&) = delete;

    /// Lets queued jobs finish, then joins every thread. Idempotent.
    void Stop()
    {
        bool expected = false;
        if (!stopping_.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        {
            return;
        }
        {
            std::scoped_lock lk(m_);
            cv_.notify_all();
        }
        for (auto& t : workers_)
        {
            if (t.joinable())
            {
                t.join();
            }
        }
    }

    /// Queues a job. Returns false only once Stop() has begun.
    bool Submit(job_t&& job)
    {
        std::scoped_lock lk(m_);
        if (stopping_.load(std::memory_order_relaxed))
        {
            return false;
        }
        q_.push_back(std::move(job));
        cv_.notify_one();
        return true;
    }

    template <typename F>
        requires(!std::is_same_v<std::decay_t<F>, job_t>)
    bool Submit(F&& f)
    {
        return Submit(job_t{std::forward<F>(f)});
    }

    std::size_t Threads() const { return workers_.size(); }

    /// Jobs executing right now.
    std::size_t Active() const { return active_.load(std::memory_order_relaxed); }

    /// Highest Active() ever observed. Never exceeds Threads().
    std::size_t PeakActive() const { return peak_active_.load(std::memory_order_relaxed); }

    std::size_t Queued() const
    {
        std::scoped_lock lk(m_);
        return q_.size();
    }

private:
    void WorkerLoop()
    {
        while (true)
        {
            job_t job;
            {
                std::unique_lock<std::mutex> lk(m_);
                cv_.wait(lk, [&] { return stopping_.load(std::memory_order_relaxed) || !q_.empty(); });
                if (q_.empty())
                {
                    return;
                }
                job = std::move(q_.front());
                q_.pop_front();
            }

            const auto now = active_.fetch_add(1, std::memory_order_relaxed) + 1;
            auto peak = peak_active_.load(std::memory_order_relaxed);
            while (now > peak && !peak_active_.compare_exchange_weak(peak, now, std::memory_order_relaxed))
            {
            }

            job();

            active_.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    std::atomic<bool> stopping_{false};
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<job_t> q_;

    std::atomic<std::size_t> active_{0};
    std::atomic<std::size_t> peak_active_{0};

    std::vector<std::thread> workers_;
};

// Awaitable that runs fn on the pool, then resumes the awaiting coroutine on
// ctx's thread. Tracked by ctx like an io_uring op, so destroying the frame
// mid-offload fails fast instead of letting the pool write into freed memory.
template <class Fn>
struct OffloadOp : OperationState
{
    BlockingPool* pool = nullptr;
    Fn fn;

    using R = std::invoke_result_t<Fn&>;
    std::conditional_t<std::is_void_v<R>, bool, std::optional<R>> value{};
    std::exception_ptr ep;

    template <class F>
    OffloadOp(IoContext* c, BlockingPool* p, F&& f) : pool(p), fn(std::forward<F>(f))
    {
        ctx = c;
    }

    bool await_ready() const noexcept { return false; }

    void await_suspend(std::coroutine_handle<> h)
    {
        handle = h;
        ctx->Track(this);

        auto job = [this]() noexcept
        {
            // Read ctx before publishing: once enqueued, the loop may resume
            // and destroy this frame.
            auto* origin = ctx;
            try
            {
                if constexpr (std::is_void_v<R>)
                {
                    fn();
                    value = true;
                }
                else
                {
                    value.emplace(fn());
                }
            }
            catch (...)
            {
                ep = std::current_exception();
            }

            origin->PostCompletion(this);
        };

        if (!pool->Submit(std::move(job)))
        {
            ctx->Untrack(this);
            throw std::runtime_error("blocking pool is stopped");
        }
    }

    R await_resume()
    {
        if (ep)
        {
            std::rethrow_exception(ep);
        }
        if constexpr (!std::is_void_v<R>)
        {
            return std::move(*value);
        }
    }
};

/// Runs fn on pool and resumes on ctx. Exceptions thrown by fn are rethrown
/// at the co_await.
///
/// @code
///   auto handle = co_await Offload(ctx, pool, [&] { return store.Resolve(name); });
/// @endcode
template <class Fn>
auto Offload(IoContext& ctx, BlockingPool& pool, Fn&& fn)
{
    return OffloadOp<std::decay_t<Fn>>{&ctx, &pool, std::forward<Fn>(fn)};
}

}  // namespace xfer
