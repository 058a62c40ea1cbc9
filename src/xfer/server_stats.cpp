#include "xfer/server_stats.hpp"

#include <format>
#include <iterator>

#include "xfer/result.hpp"

namespace xfer
{

void ServerStats::RecordOutcome(TransferStrategy s, const TransferOutcome& outcome)
{
    auto& c = At(s);
    c.body_bytes.fetch_add(outcome.body_bytes, std::memory_order_relaxed);

    if (outcome.Ok())
    {
        c.completed.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    if (outcome.Truncated())
    {
        c.truncated.fetch_add(1, std::memory_order_relaxed);
    }
    else if (IsNotFound(outcome.error))
    {
        c.not_found.fetch_add(1, std::memory_order_relaxed);
    }
    else
    {
        c.io_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

ServerStats::Snapshot ServerStats::GetSnapshot(TransferStrategy s) const
{
    const auto& c = At(s);
    return {
        .requests = c.requests.load(std::memory_order_relaxed),
        .completed = c.completed.load(std::memory_order_relaxed),
        .body_bytes = c.body_bytes.load(std::memory_order_relaxed),
        .not_found = c.not_found.load(std::memory_order_relaxed),
        .io_errors = c.io_errors.load(std::memory_order_relaxed),
        .truncated = c.truncated.load(std::memory_order_relaxed),
    };
}

std::string ServerStats::Format() const
{
    std::string out;
    for (size_t i = 0; i < kStrategyCount; ++i)
    {
        const auto s = static_cast<TransferStrategy>(i);
        const auto snap = GetSnapshot(s);
        if (snap.requests == 0)
        {
            continue;
        }
        std::format_to(std::back_inserter(out), "{}{}: req={} ok={} bytes={} 404={} err={} truncated={}",
                       out.empty() ? "" : "; ", ToString(s), snap.requests, snap.completed, snap.body_bytes,
                       snap.not_found, snap.io_errors, snap.truncated);
    }
    if (out.empty())
    {
        out = "idle";
    }
    return std::format("{} (unrouted={})", out, Unrouted());
}

}  // namespace xfer
