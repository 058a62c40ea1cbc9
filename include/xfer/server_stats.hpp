#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <string>

#include "xfer/strategy.hpp"

namespace xfer
{

/// What one strategy reported back to its connection.
struct TransferOutcome
{
    bool head_sent = false;    // some response bytes reached the socket
    uint64_t body_bytes = 0;   // body bytes handed to the kernel
    std::error_code error;     // empty on success

    bool Ok() const { return !error; }

    /// Failed after the 200 went out: the client sees a short body.
    bool Truncated() const { return error && head_sent; }
};

/// Per-strategy counters, updated from every loop thread.
class ServerStats
{
public:
    struct Counters
    {
        std::atomic<uint64_t> requests{0};
        std::atomic<uint64_t> completed{0};
        std::atomic<uint64_t> body_bytes{0};
        std::atomic<uint64_t> not_found{0};
        std::atomic<uint64_t> io_errors{0};
        std::atomic<uint64_t> truncated{0};
    };

    struct Snapshot
    {
        uint64_t requests;
        uint64_t completed;
        uint64_t body_bytes;
        uint64_t not_found;
        uint64_t io_errors;
        uint64_t truncated;
    };

    void RecordRequest(TransferStrategy s) { At(s).requests.fetch_add(1, std::memory_order_relaxed); }

    void RecordOutcome(TransferStrategy s, const TransferOutcome& outcome);

    /// Requests that matched no endpoint or file name before a strategy ran.
    void RecordUnrouted() { unrouted_.fetch_add(1, std::memory_order_relaxed); }

    Snapshot GetSnapshot(TransferStrategy s) const;
    uint64_t Unrouted() const { return unrouted_.load(std::memory_order_relaxed); }

    /// One line per strategy that has seen traffic.
    std::string Format() const;

private:
    Counters& At(TransferStrategy s) { return counters_[static_cast<size_t>(s)]; }
    const Counters& At(TransferStrategy s) const { return counters_[static_cast<size_t>(s)]; }

    std::array<Counters, kStrategyCount> counters_;
    std::atomic<uint64_t> unrouted_{0};
};

}  // namespace xfer
