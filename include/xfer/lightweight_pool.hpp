#pragma once
////////////////////////////////////////////////////////////////////////////////
// LightweightThreadPool - cooperative fibers on a few carrier threads
//
// A fiber is a Task<> running on a carrier's IoContext. Fibers are cheap and
// unbounded in number; carriers are few. File I/O inside a fiber goes through
// the carrier's ring, so a fiber waiting on a read does not hold the carrier.
// Calls that cannot be made asynchronous run inline via Carrier::Pin(): they
// pin the carrier (no other fiber on it runs meanwhile) and are counted.
////////////////////////////////////////////////////////////////////////////////

#include <atomic>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "xfer/io_context.hpp"
#include "xfer/operation_base.hpp"
#include "xfer/task.hpp"
#include "xfer/task_group.hpp"
#include "xfer/worker.hpp"

namespace xfer
{

class Carrier
{
public:
    Carrier(int id, unsigned uring_entries);
    ~Carrier();

    Carrier(const Carrier&) = delete;
    Carrier& operator=(const Carrier&) = delete;

    void Start();

    /// Stops accepting fibers, stops the loop and joins the thread. Fibers
    /// still queued or suspended are dropped.
    void Stop();

    /// Thread-safe. Queues a fiber; it starts on the carrier's next loop turn.
    /// Returns false once Stop() has begun.
    bool Post(Task<> fiber);

    /// The carrier's loop. Only valid on the carrier thread.
    IoContext& Io() { return *worker_.Context(); }

    /// Runs fn synchronously on the calling carrier, blocking every other
    /// fiber on it for the duration.
    template <typename Fn>
    auto Pin(Fn&& fn) -> std::invoke_result_t<Fn&>
    {
        pinned_.fetch_add(1, std::memory_order_relaxed);
        return fn();
    }

    int Id() const { return worker_.Id(); }
    uint64_t PinnedCalls() const { return pinned_.load(std::memory_order_relaxed); }
    uint64_t FibersStarted() const { return fibers_.load(std::memory_order_relaxed); }
    bool OnCarrierThread() const { return std::this_thread::get_id() == worker_.ThreadId(); }

private:
    void DrainMailbox(TaskGroup<>& fibers);

    Worker worker_;
    std::mutex mailbox_mtx_;
    std::vector<Task<>> mailbox_;  // protected by mailbox_mtx_
    bool accepting_ = false;       // protected by mailbox_mtx_

    std::atomic<uint64_t> pinned_{0};
    std::atomic<uint64_t> fibers_{0};
};

class LightweightThreadPool
{
public:
    explicit LightweightThreadPool(size_t carriers, unsigned uring_entries = 256);
    ~LightweightThreadPool();

    LightweightThreadPool(const LightweightThreadPool&) = delete;
    LightweightThreadPool& operator=(const LightweightThreadPool&) = delete;

    void Stop();

    /// Round-robin pick.
    Carrier& Next();

    size_t Carriers() const { return carriers_.size(); }
    Carrier& At(size_t i) { return *carriers_[i]; }

    uint64_t PinnedCalls() const;
    uint64_t FibersStarted() const;

private:
    std::vector<std::unique_ptr<Carrier>> carriers_;
    std::atomic<size_t> next_{0};
};

// Awaitable that runs factory(carrier) as a fiber on the pool and resumes the
// awaiting coroutine on its own loop with the fiber's result. Tracked by ctx
// for the whole flight, like an Offload.
template <class Factory>
struct LightweightOp : OperationState
{
    using TaskT = std::invoke_result_t<Factory&, Carrier&>;
    using R = TaskValueT<TaskT>;
    static_assert(!std::is_void_v<R>, "fiber must produce a value");

    LightweightThreadPool* pool = nullptr;
    Factory factory;
    std::optional<R> value;
    std::exception_ptr ep;

    template <class F>
    LightweightOp(IoContext* c, LightweightThreadPool* p, F&& f) : pool(p), factory(std::forward<F>(f))
    {
        ctx = c;
    }

    bool await_ready() const noexcept { return false; }

    void await_suspend(std::coroutine_handle<> h)
    {
        handle = h;
        ctx->Track(this);

        Carrier& carrier = pool->Next();
        if (!carrier.Post(Fiber(carrier, this)))
        {
            ctx->Untrack(this);
            throw std::runtime_error("lightweight thread pool is stopped");
        }
    }

    R await_resume()
    {
        if (ep)
        {
            std::rethrow_exception(ep);
        }
        return std::move(*value);
    }

private:
    static Task<> Fiber(Carrier& carrier, LightweightOp* op)
    {
        // Read ctx before publishing: once enqueued, the origin loop may
        // resume and destroy op.
        auto* origin = op->ctx;
        try
        {
            op->value.emplace(co_await op->factory(carrier));
        }
        catch (...)
        {
            op->ep = std::current_exception();
        }
        origin->PostCompletion(op);
    }
};

/// Runs factory(carrier) -> Task<R> on a carrier and yields R on ctx.
///
/// @code
///   auto data = co_await RunOnLightweightThread(ctx, pool, [&](Carrier& c) { return LoadOnCarrier(c, name); });
/// @endcode
template <class Factory>
auto RunOnLightweightThread(IoContext& ctx, LightweightThreadPool& pool, Factory&& factory)
{
    return LightweightOp<std::decay_t<Factory>>{&ctx, &pool, std::forward<Factory>(factory)};
}

}  // namespace xfer
