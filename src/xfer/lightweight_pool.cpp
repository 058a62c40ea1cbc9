#include "xfer/lightweight_pool.hpp"

#include "xfer/logger.hpp"

namespace xfer
{

// ----------------------------------------------------------------------------
// Carrier
// ----------------------------------------------------------------------------

Carrier::Carrier(int id, unsigned uring_entries) : worker_(id, uring_entries) {}

Carrier::~Carrier()
{
    Stop();
}

void Carrier::Start()
{
    {
        std::scoped_lock lk(mailbox_mtx_);
        accepting_ = true;
    }

    worker_.Start(
        [this](IoContext& ctx)
        {
            TaskGroup<> fibers;
            ctx.Run([&] { DrainMailbox(fibers); });

            // Detach whatever is still suspended before the group lets go of it
            ctx.CancelAllPending();
            if (fibers.ActiveCount() > 0)
            {
                XFER_LOG_WARN("carrier {} dropped {} running fibers", worker_.Id(), fibers.ActiveCount());
            }
        });
}

void Carrier::Stop()
{
    {
        std::scoped_lock lk(mailbox_mtx_);
        if (!accepting_)
        {
            return;
        }
        accepting_ = false;
    }
    worker_.RequestStop();
    worker_.Join();

    std::scoped_lock lk(mailbox_mtx_);
    mailbox_.clear();
}

bool Carrier::Post(Task<> fiber)
{
    std::scoped_lock lk(mailbox_mtx_);
    if (!accepting_)
    {
        return false;
    }
    mailbox_.push_back(std::move(fiber));
    // Under the lock: Stop() cannot tear the context down between the check
    // and the wake.
    if (auto* ctx = worker_.Context(); ctx != nullptr)
    {
        ctx->Notify();
    }
    return true;
}

void Carrier::DrainMailbox(TaskGroup<>& fibers)
{
    std::vector<Task<>> incoming;
    {
        std::scoped_lock lk(mailbox_mtx_);
        incoming.swap(mailbox_);
    }

    for (auto& fiber : incoming)
    {
        fibers_.fetch_add(1, std::memory_order_relaxed);
        fibers.Spawn(std::move(fiber));
    }
}

// ----------------------------------------------------------------------------
// LightweightThreadPool
// ----------------------------------------------------------------------------

LightweightThreadPool::LightweightThreadPool(size_t carriers, unsigned uring_entries)
{
    if (carriers == 0)
    {
        carriers = 1;
    }
    carriers_.reserve(carriers);
    for (size_t i = 0; i < carriers; ++i)
    {
        carriers_.push_back(std::make_unique<Carrier>(static_cast<int>(i), uring_entries));
        carriers_.back()->Start();
    }
}

LightweightThreadPool::~LightweightThreadPool()
{
    Stop();
}

void LightweightThreadPool::Stop()
{
    for (auto& c : carriers_)
    {
        c->Stop();
    }
}

Carrier& LightweightThreadPool::Next()
{
    const size_t i = next_.fetch_add(1, std::memory_order_relaxed) % carriers_.size();
    return *carriers_[i];
}

uint64_t LightweightThreadPool::PinnedCalls() const
{
    uint64_t total = 0;
    for (const auto& c : carriers_)
    {
        total += c->PinnedCalls();
    }
    return total;
}

uint64_t LightweightThreadPool::FibersStarted() const
{
    uint64_t total = 0;
    for (const auto& c : carriers_)
    {
        total += c->FibersStarted();
    }
    return total;
}

}  // namespace xfer
