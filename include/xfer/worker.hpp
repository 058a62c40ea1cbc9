#pragma once

#include <atomic>
#include <latch>
#include <stop_token>
#include <thread>
#include <utility>

#include "xfer/io_context.hpp"
#include "xfer/logger.hpp"

namespace xfer
{

/// A thread that owns one IoContext for its whole life.
///
/// The context is created on the worker thread (SINGLE_ISSUER requires it)
/// and handed to the user function, which drives the loop. RequestStop()
/// stops the loop from any thread.
class Worker
{
public:
    explicit Worker(int id, unsigned uring_entries = 256) : id_(id), uring_entries_(uring_entries) {}

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    ~Worker() = default;

    /**
     * Spawns the thread, builds its IoContext and runs func(ctx) on it.
     * Returns once the context exists, so Context() is usable right after.
     */
    template <typename F>
    void Start(F&& func)
    {
        std::latch ready{1};

        thread_ = std::jthread(
            [this, &ready, func = std::forward<F>(func)](std::stop_token st) mutable
            {
                IoContext ctx(uring_entries_);

                std::stop_callback on_stop(st,
                                           [&ctx]
                                           {
                                               ctx.Stop();
                                               (void)ctx.Notify();
                                           });

                ctx_.store(&ctx, std::memory_order_release);
                ready.count_down();

                try
                {
                    func(ctx);
                }
                catch (const std::exception& e)
                {
                    XFER_LOG_ERROR("worker {} loop failed: {}", id_, e.what());
                }

                ctx.CancelAllPending();
                ctx_.store(nullptr, std::memory_order_release);
            });

        ready.wait();
    }

    /// Runs ctx.Run(tick) until RequestStop().
    template <typename Tick>
    void RunLoop(Tick&& tick)
    {
        Start([tick = std::forward<Tick>(tick)](IoContext& ctx) mutable { ctx.Run(tick); });
    }

    void RequestStop() { thread_.request_stop(); }

    void Join()
    {
        if (thread_.joinable())
        {
            thread_.join();
        }
    }

    /// The worker's loop, or nullptr once the thread has wound down.
    [[nodiscard]] IoContext* Context() const { return ctx_.load(std::memory_order_acquire); }

    [[nodiscard]] int Id() const { return id_; }
    [[nodiscard]] std::thread::id ThreadId() const { return thread_.get_id(); }

private:
    int id_;
    unsigned uring_entries_;
    std::atomic<IoContext*> ctx_{nullptr};
    std::jthread thread_;
};

}  // namespace xfer
