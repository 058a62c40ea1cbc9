#pragma once
////////////////////////////////////////////////////////////////////////////////
// FileServer - HTTP/1.1 front end for the download strategies
//
// io_threads loops accept from one shared listener; each connection lives on
// the loop that accepted it and is served one request at a time (keep-alive,
// pipelined bytes kept). The BlockingPool and the lightweight carriers are
// shared by all loops.
////////////////////////////////////////////////////////////////////////////////

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "xfer/blocking_pool.hpp"
#include "xfer/config.hpp"
#include "xfer/download_service.hpp"
#include "xfer/file_store.hpp"
#include "xfer/io_context.hpp"
#include "xfer/lightweight_pool.hpp"
#include "xfer/net.hpp"
#include "xfer/server_stats.hpp"
#include "xfer/task.hpp"
#include "xfer/task_group.hpp"
#include "xfer/worker.hpp"

namespace xfer
{

class FileServer
{
public:
    explicit FileServer(ServerConfig config);
    ~FileServer();

    FileServer(const FileServer&) = delete;
    FileServer& operator=(const FileServer&) = delete;

    /// Validates the config, binds, and starts every pool and loop. On
    /// failure nothing is left running.
    Result<> Start();

    /**
     * Stops accepting, lets in-flight requests finish for up to
     * drain_timeout, then stops the carriers and the BlockingPool.
     * Idempotent.
     */
    void Stop();

    /// The bound port; useful with port 0.
    uint16_t Port() const { return port_; }

    bool Running() const { return running_.load(std::memory_order_acquire); }

    const ServerConfig& Config() const { return config_; }
    const ServerStats& Stats() const { return stats_; }
    const BlockingPool* Pool() const { return pool_.get(); }
    const LightweightThreadPool* Carriers() const { return carriers_.get(); }

private:
    Task<> AcceptLoop(IoContext& ctx, TaskGroup<>& connections, int loop_id);
    Task<> HandleConnection(IoContext& ctx, int client_fd);
    // 400 before closing; a failed send is only logged.
    Task<> RejectRequest(IoContext& ctx, int client_fd);

    ServerConfig config_;
    LocalFileStore store_;
    ServerStats stats_;

    std::unique_ptr<BlockingPool> pool_;
    std::unique_ptr<LightweightThreadPool> carriers_;
    std::unique_ptr<DownloadService> service_;

    net::Socket listener_;
    uint16_t port_ = 0;

    std::vector<std::unique_ptr<Worker>> loops_;
    std::atomic<bool> running_{false};
};

}  // namespace xfer
