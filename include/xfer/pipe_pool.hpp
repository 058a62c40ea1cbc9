#pragma once

#include <optional>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace xfer
{

/// A pipe used as the kernel-side staging buffer of a splice transfer.
struct Pipe
{
    int read_fd = -1;
    int write_fd = -1;

    bool Valid() const { return read_fd >= 0 && write_fd >= 0; }

    void Close()
    {
        if (read_fd >= 0)
        {
            ::close(read_fd);
            read_fd = -1;
        }
        if (write_fd >= 0)
        {
            ::close(write_fd);
            write_fd = -1;
        }
    }
};

/**
 * Per-loop cache of pipes for AsyncSendfile.
 *
 * Pipes stay blocking: io_uring punts a splice that would block to its worker
 * threads, while a non-blocking pipe would surface EAGAIN instead. A pipe is
 * only returned to the pool empty; a transfer that fails midway discards it.
 */
class PipePool
{
public:
    explicit PipePool(size_t max_size = 4) : max_size_(max_size) { pool_.reserve(max_size); }

    ~PipePool()
    {
        for (auto& p : pool_)
        {
            p.Close();
        }
    }

    PipePool(const PipePool&) = delete;
    PipePool& operator=(const PipePool&) = delete;

    std::optional<Pipe> Acquire()
    {
        if (!pool_.empty())
        {
            Pipe p = pool_.back();
            pool_.pop_back();
            return p;
        }

        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) < 0)
        {
            return std::nullopt;
        }
        return Pipe{fds[0], fds[1]};
    }

    void Release(Pipe p)
    {
        if (!p.Valid())
        {
            return;
        }

        if (pool_.size() < max_size_)
        {
            pool_.push_back(p);
        }
        else
        {
            p.Close();
        }
    }

    size_t Idle() const { return pool_.size(); }

    /// Returns the pipe to the pool on scope exit unless Discard() was called.
    class Guard
    {
    public:
        Guard(PipePool& pool, Pipe p) : pool_(&pool), pipe_(p) {}
        ~Guard()
        {
            if (pool_ != nullptr)
            {
                pool_->Release(pipe_);
            }
            else
            {
                pipe_.Close();
            }
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard(Guard&& o) noexcept : pool_(std::exchange(o.pool_, nullptr)), pipe_(std::exchange(o.pipe_, Pipe{})) {}
        Guard& operator=(Guard&&) = delete;

        Pipe& Get() { return pipe_; }

        // The pipe may still hold bytes; close it instead of recycling.
        void Discard() { pool_ = nullptr; }

    private:
        PipePool* pool_;
        Pipe pipe_;
    };

    std::optional<Guard> AcquireGuarded()
    {
        auto p = Acquire();
        if (!p)
        {
            return std::nullopt;
        }
        return std::optional<Guard>(std::in_place, *this, *p);
    }

private:
    std::vector<Pipe> pool_;
    size_t max_size_;
};

}  // namespace xfer
