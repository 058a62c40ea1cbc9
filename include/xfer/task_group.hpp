#pragma once

#include <chrono>
#include <cstdint>
#include <type_traits>
#include <utility>
#include <vector>

#include "xfer/io_context.hpp"
#include "xfer/notifier.hpp"
#include "xfer/task.hpp"

namespace xfer
{

/// Owns detached tasks (one per connection, one per fiber) on a single loop.
///
/// Spawned tasks start immediately and stay owned by the group until they
/// finish; finished frames are swept periodically. The group must outlive
/// every task it holds: join it before letting it go out of scope.
template <typename T = void>
class TaskGroup
{
public:
    explicit TaskGroup(size_t reserve_capacity = 64) { tasks_.reserve(reserve_capacity); }

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    ~TaskGroup() noexcept = default;

    // -------------------------------------------------------------------------
    // Task Spawning
    // -------------------------------------------------------------------------

    void Spawn(Task<T>&& t)
    {
        auto wrapped = [](Task<T> original, TaskGroup* group) -> Task<T>
        {
            // Decrements even when original ends with an exception
            struct CompletionGuard
            {
                TaskGroup* g;
                ~CompletionGuard() { g->OnTaskDone(); }
            } guard{group};

            if constexpr (std::is_void_v<T>)
            {
                co_await original;
            }
            else
            {
                co_return co_await original;
            }
        }(std::move(t), this);

        ++spawn_count_;
        ++active_count_;

        tasks_.push_back(std::move(wrapped));
        tasks_.back().Start();

        if ((spawn_count_ & (sweep_interval_ - 1)) == 0)
        {
            Sweep();
        }
    }

    // -------------------------------------------------------------------------
    // Lifetime Management
    // -------------------------------------------------------------------------

    size_t Sweep()
    {
        const size_t before = tasks_.size();
        std::erase_if(tasks_, [](Task<T>& t) { return t.Done(); });
        return before - tasks_.size();
    }

    // -------------------------------------------------------------------------
    // Waiting / Joining
    // -------------------------------------------------------------------------

    Task<> JoinAll(IoContext& ctx)
    {
        waiting_ = true;
        while (active_count_ > 0)
        {
            if (auto r = co_await completion_.Wait(ctx); !r)
            {
                break;
            }
        }
        waiting_ = false;
        Sweep();
    }

    /// @return false if tasks were still running when timeout expired.
    Task<bool> JoinAllTimeout(IoContext& ctx, std::chrono::milliseconds timeout)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;

        waiting_ = true;
        while (active_count_ > 0)
        {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
            {
                break;
            }

            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            if (auto r = co_await completion_.Wait(ctx).WithTimeout(left); !r)
            {
                break;
            }
        }
        waiting_ = false;

        Sweep();
        co_return active_count_ == 0;
    }

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    size_t Size() const { return tasks_.size(); }
    size_t ActiveCount() const { return active_count_; }
    uint64_t TotalSpawned() const { return spawn_count_; }

private:
    void OnTaskDone()
    {
        if (--active_count_ == 0 && waiting_)
        {
            completion_.Signal();
        }
    }

    // Declared first so it outlives tasks_: frames destroyed with the group
    // still run their completion guard.
    Notifier completion_;
    size_t sweep_interval_ = 1024;
    uint64_t spawn_count_ = 0;

    size_t active_count_ = 0;
    bool waiting_ = false;
    std::vector<Task<T>> tasks_;
};

}  // namespace xfer
