#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <thread>

#include "xfer/result.hpp"

namespace xfer
{

// =============================================================================
// Server configuration
// =============================================================================

struct ServerConfig
{
    // Where downloadable files live
    std::filesystem::path root = ".";

    // Listener
    std::string bind_address = "0.0.0.0";
    uint16_t port = 8080;  // 0 picks an ephemeral port

    // Threading
    size_t io_threads = std::max<size_t>(1, std::thread::hardware_concurrency());
    size_t blocking_threads = std::max<size_t>(2, 2 * std::thread::hardware_concurrency());
    size_t carrier_threads = std::max<size_t>(1, std::thread::hardware_concurrency());

    // io_uring
    unsigned uring_entries = 256;

    // Transfers
    size_t chunk_size = 4096;
    std::chrono::milliseconds send_timeout{30'000};
    std::chrono::milliseconds idle_timeout{60'000};

    // Shutdown and reporting
    std::chrono::milliseconds drain_timeout{5'000};
    std::chrono::seconds stats_interval{10};  // 0 disables the periodic stats line

    static constexpr size_t kMinChunkSize = 512;
    static constexpr size_t kMaxChunkSize = 16 << 20;

    /// invalid_argument for a value the server cannot run with. Logs which.
    Result<> Validate() const;
};

}  // namespace xfer
