#pragma once
// xfer/logger.hpp
// Asynchronous logger. Producers format into a per-thread SPSC ring and poke
// an eventfd; one background thread drains every ring to the output fd.
// Logging never blocks a loop thread: a full ring drops the record and counts it.

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <format>
#include <optional>
#include <source_location>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include <unistd.h>

#include <sys/eventfd.h>
#include <sys/syscall.h>

#ifndef XFER_LOG_BUILD_LEVEL
#define XFER_LOG_BUILD_LEVEL 0
#endif

namespace xfer::alog
{

enum class Level : uint8_t
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Disabled = 4
};

inline std::atomic<Level> g_level{Level::Info};
inline std::atomic<bool> g_colors{true};

constexpr Level kBuildMinLevel = static_cast<Level>(XFER_LOG_BUILD_LEVEL);

constexpr size_t kMaxThreads = 256;  // concurrent producer threads
constexpr size_t kQueueSize = 1024;  // per-thread records (power of 2)
constexpr size_t kMsgMax = 512;      // bytes per record (incl '\n')

/// "debug" | "info" | "warn" | "error" | "off"
inline std::optional<Level> ParseLevel(std::string_view name)
{
    if (name == "debug")
    {
        return Level::Debug;
    }
    if (name == "info")
    {
        return Level::Info;
    }
    if (name == "warn")
    {
        return Level::Warn;
    }
    if (name == "error")
    {
        return Level::Error;
    }
    if (name == "off")
    {
        return Level::Disabled;
    }
    return std::nullopt;
}

namespace detail
{

struct LevelConfig
{
    const char* label;
    const char* color;
};
constexpr LevelConfig kCfg[] = {
    {"DBG", "\033[36m"},
    {"INF", "\033[32m"},
    {"WRN", "\033[33m"},
    {"ERR", "\033[31m"},
};
constexpr const char* kReset = "\033[0m";

inline const char* Basename(const char* path)
{
    const char* slash = std::strrchr(path, '/');
    return slash != nullptr ? slash + 1 : path;
}

inline uint32_t Tid()
{
    static thread_local const auto tid = static_cast<uint32_t>(::syscall(SYS_gettid));
    return tid;
}

struct Record
{
    uint16_t len;
    uint8_t level;
    char msg[kMsgMax];
};

struct SPSC
{
    static constexpr size_t Mask = kQueueSize - 1;
    static_assert((kQueueSize & (kQueueSize - 1)) == 0, "kQueueSize must be power of 2");

    std::atomic<uint32_t> head{0};  // producer writes
    std::atomic<uint32_t> tail{0};  // consumer reads
    Record buf[kQueueSize];

    bool TryPush(const Record& r) noexcept
    {
        const uint32_t h = head.load(std::memory_order_relaxed);
        const uint32_t t = tail.load(std::memory_order_acquire);
        if ((h - t) == kQueueSize)
        {
            return false;
        }
        buf[h & Mask] = r;
        head.store(h + 1, std::memory_order_release);
        return true;
    }

    bool TryPop(Record& out) noexcept
    {
        const uint32_t t = tail.load(std::memory_order_relaxed);
        const uint32_t h = head.load(std::memory_order_acquire);
        if (t == h)
        {
            return false;
        }
        out = buf[t & Mask];
        tail.store(t + 1, std::memory_order_release);
        return true;
    }
};

// A slot is leased by one thread at a time and handed back when it exits, so
// short-lived pool threads do not exhaust the table. The consumer drains every
// slot regardless of ownership.
struct ThreadSlot
{
    std::atomic<bool> owned{false};
    SPSC q;
};

inline ThreadSlot g_slots[kMaxThreads];

inline int g_wake_fd = -1;
inline std::atomic<bool> g_running{false};
inline std::jthread g_thread;
inline std::atomic<uint64_t> g_dropped{0};

struct SlotLease
{
    uint32_t slot = UINT32_MAX;

    SlotLease()
    {
        for (uint32_t i = 0; i < kMaxThreads; ++i)
        {
            bool expected = false;
            if (g_slots[i].owned.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
            {
                slot = i;
                return;
            }
        }
    }

    ~SlotLease()
    {
        if (slot != UINT32_MAX)
        {
            g_slots[slot].owned.store(false, std::memory_order_release);
        }
    }
};

inline uint32_t ThreadSlotIndex()
{
    static thread_local SlotLease lease;
    return lease.slot;
}

inline void WakeLogger() noexcept
{
    const int fd = g_wake_fd;
    if (fd < 0)
    {
        return;
    }
    constexpr uint64_t one = 1;
    [[maybe_unused]] auto r = ::write(fd, &one, sizeof(one));
}

inline void DrainTo(int out_fd)
{
    Record r{};
    for (auto& slot : g_slots)
    {
        while (slot.q.TryPop(r))
        {
            [[maybe_unused]] auto n = ::write(out_fd, r.msg, r.len);
        }
    }
}

inline void LoggerLoop(int out_fd)
{
    // g_wake_fd is blocking: the thread sleeps until a producer writes.
    while (g_running.load(std::memory_order_acquire))
    {
        uint64_t n = 0;
        if (::read(g_wake_fd, &n, sizeof(n)) < 0 && errno == EINTR)
        {
            continue;
        }
        DrainTo(out_fd);
    }
    DrainTo(out_fd);
}

template <typename... Args>
void FormatRecord(Record& r, Level lvl, std::source_location loc, std::format_string<Args...> fmt,
                  Args&&... args) noexcept
{
    r.level = static_cast<uint8_t>(lvl);

    const bool colors = g_colors.load(std::memory_order_relaxed);
    const auto& cfg = kCfg[static_cast<int>(lvl)];
    const auto ms = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());

    char* p = r.msg;
    char* end = r.msg + kMsgMax - 2;  // room for '\n'

    if (colors)
    {
        p = std::format_to_n(p, end - p, "{}[{}] [{:%T}] [{}] {}:{} | ", cfg.color, cfg.label, ms, Tid(),
                             Basename(loc.file_name()), loc.line())
                .out;
    }
    else
    {
        p = std::format_to_n(p, end - p, "[{}] [{:%T}] [{}] {}:{} | ", cfg.label, ms, Tid(),
                             Basename(loc.file_name()), loc.line())
                .out;
    }
    p = std::min(p, end);

    if (p < end)
    {
        p = std::min(std::format_to_n(p, end - p, fmt, std::forward<Args>(args)...).out, end);
    }

    if (colors && p < end)
    {
        p = std::min(std::format_to_n(p, end - p, "{}", kReset).out, end);
    }

    *p++ = '\n';
    r.len = static_cast<uint16_t>(p - r.msg);
}

}  // namespace detail

// ---- lifecycle ----

/// Starts the drain thread. Idempotent. Records logged before Start() are
/// kept in the rings and written once the thread runs.
inline void Start(int out_fd = STDERR_FILENO)
{
    bool expected = false;
    if (!detail::g_running.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
    {
        return;
    }

    const int fd = ::eventfd(0, EFD_CLOEXEC);
    if (fd < 0)
    {
        detail::g_running.store(false, std::memory_order_release);
        throw std::system_error(errno, std::system_category(), "eventfd");
    }
    detail::g_wake_fd = fd;
    detail::g_thread = std::jthread([out_fd] { detail::LoggerLoop(out_fd); });
}

/// Flushes whatever is queued and joins the drain thread.
inline void Stop()
{
    if (!detail::g_running.exchange(false, std::memory_order_acq_rel))
    {
        return;
    }
    detail::WakeLogger();
    if (detail::g_thread.joinable())
    {
        detail::g_thread.join();
    }
    if (detail::g_wake_fd >= 0)
    {
        ::close(detail::g_wake_fd);
    }
    detail::g_wake_fd = -1;
}

inline uint64_t DroppedCount()
{
    return detail::g_dropped.load(std::memory_order_relaxed);
}

inline void SetLevel(Level level)
{
    g_level.store(level, std::memory_order_relaxed);
}

// ---- logging API ----

template <Level L, typename... Args>
void Log(std::source_location loc, std::format_string<Args...> fmt, Args&&... args)
{
    if constexpr (kBuildMinLevel <= L)
    {
        if (g_level.load(std::memory_order_relaxed) > L)
        {
            return;
        }

        const uint32_t slot = detail::ThreadSlotIndex();
        if (slot == UINT32_MAX)
        {
            detail::g_dropped.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        detail::Record r{};
        detail::FormatRecord(r, L, loc, fmt, std::forward<Args>(args)...);

        if (!detail::g_slots[slot].q.TryPush(r))
        {
            detail::g_dropped.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        detail::WakeLogger();
    }
}

}  // namespace xfer::alog

// The macros capture the caller's location; a plain function would report
// this header instead.
#define XFER_LOG_DEBUG(...) ::xfer::alog::Log<::xfer::alog::Level::Debug>(std::source_location::current(), __VA_ARGS__)
#define XFER_LOG_INFO(...) ::xfer::alog::Log<::xfer::alog::Level::Info>(std::source_location::current(), __VA_ARGS__)
#define XFER_LOG_WARN(...) ::xfer::alog::Log<::xfer::alog::Level::Warn>(std::source_location::current(), __VA_ARGS__)
#define XFER_LOG_ERROR(...) ::xfer::alog::Log<::xfer::alog::Level::Error>(std::source_location::current(), __VA_ARGS__)
