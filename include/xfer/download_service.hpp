#pragma once
////////////////////////////////////////////////////////////////////////////////
// DownloadService - runs one download request under its selected plan
//
// Every strategy yields the same bytes for the same file. They differ only in
// where the file is read (event loop, BlockingPool, lightweight carrier) and
// in how the body is framed and buffered. Serve() always leaves exactly one
// well-formed response, or a truncated 200 followed by a closed connection.
////////////////////////////////////////////////////////////////////////////////

#include <chrono>
#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "xfer/blocking_pool.hpp"
#include "xfer/file_store.hpp"
#include "xfer/io_context.hpp"
#include "xfer/lightweight_pool.hpp"
#include "xfer/server_stats.hpp"
#include "xfer/strategy.hpp"
#include "xfer/task.hpp"

namespace xfer
{

struct DownloadOptions
{
    size_t chunk_size = 4096;
    std::chrono::milliseconds send_timeout{30'000};
};

/// A whole file, read into memory on some execution context.
struct LoadedFile
{
    FileHandle handle;
    std::vector<std::byte> data;
};

class DownloadService
{
public:
    DownloadService(const FileStore& store, BlockingPool& pool, LightweightThreadPool& carriers, ServerStats& stats,
                    DownloadOptions options = {});

    /**
     * Answers GET /download/<endpoint>/<name> on client_fd.
     *
     * Runs on the connection's loop. A failure before the first response
     * byte becomes a 404 (NotFound) or 500; a failure after it leaves the
     * response truncated.
     *
     * @return true if the connection can carry another request.
     */
    Task<bool> Serve(IoContext& ctx, int client_fd, StrategyPlan plan, std::string name, bool keep_alive);

    /// Strategy body without the error response; exposed for tests. An
    /// exception escaping a strategy (allocation failure, stopped pool) is
    /// logged and reported as IoError.
    Task<TransferOutcome> Run(IoContext& ctx, int client_fd, const StrategyPlan& plan, const std::string& name,
                              bool keep_alive);

    const DownloadOptions& Options() const { return options_; }

private:
    // Each strategy records progress in out as it goes, so the caller still
    // knows whether the head left when a strategy throws.
    Task<> ServeAsyncWholeFile(IoContext& ctx, int fd, const StrategyPlan& plan, const std::string& name,
                               bool keep_alive, TransferOutcome& out);

    // Segments and the joined copy coexist during the offloaded copy: peak
    // memory is twice the file size.
    Task<> ServeAsyncChunkedBuffer(IoContext& ctx, int fd, const StrategyPlan& plan, const std::string& name,
                                   bool keep_alive, TransferOutcome& out);
    Task<> ServeAsyncChunkStream(IoContext& ctx, int fd, const StrategyPlan& plan, const std::string& name,
                                 bool keep_alive, TransferOutcome& out);
    Task<> ServeBlockingStream(IoContext& ctx, int fd, const StrategyPlan& plan, const std::string& name,
                               bool keep_alive, TransferOutcome& out);
    Task<> ServeBlockingWholeBuffer(IoContext& ctx, int fd, const StrategyPlan& plan, const std::string& name,
                                    bool keep_alive, TransferOutcome& out);
    Task<> ServeOnLightweightThread(IoContext& ctx, int fd, const StrategyPlan& plan, const std::string& name,
                                    bool keep_alive, TransferOutcome& out);

    /// Head then body, both from the loop.
    Task<> SendBuffered(IoContext& ctx, int fd, const StrategyPlan& plan, bool keep_alive,
                        std::span<const std::byte> body, TransferOutcome& out);

    /// Blocking half of BlockingStream, run on a pool thread.
    void StreamBlocking(int fd, const StrategyPlan& plan, const std::string& name, bool keep_alive,
                        TransferOutcome& out) const;

    static Task<Result<LoadedFile>> LoadOnCarrier(Carrier& carrier, const FileStore& store, std::string name);

    const FileStore& store_;
    BlockingPool& pool_;
    LightweightThreadPool& carriers_;
    ServerStats& stats_;
    DownloadOptions options_;
};

}  // namespace xfer
