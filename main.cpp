// xfer_server: HTTP file-download benchmark server
//
//   xfer_server --root=/srv/files --port=8080
//   curl -o /dev/null http://localhost:8080/download/asyncFile/big.bin

#include <chrono>
#include <csignal>
#include <cstdio>
#include <string>

#include <gflags/gflags.h>

#include "xfer/config.hpp"
#include "xfer/io.hpp"
#include "xfer/io_context.hpp"
#include "xfer/logger.hpp"
#include "xfer/server.hpp"
#include "xfer/task.hpp"

DEFINE_string(root, ".", "Directory holding the downloadable files");
DEFINE_string(bind, "0.0.0.0", "Listen address");
DEFINE_uint32(port, 8080, "Listen port (0 picks one)");
DEFINE_uint64(io_threads, 0, "Event-loop threads (0 = one per core)");
DEFINE_uint64(blocking_threads, 0, "BlockingPool threads (0 = two per core)");
DEFINE_uint64(carrier_threads, 0, "Lightweight-thread carriers (0 = one per core)");
DEFINE_uint32(uring_entries, 256, "io_uring queue depth per loop");
DEFINE_uint64(chunk_size, 4096, "Chunk size for streamed and segmented reads, in bytes");
DEFINE_uint64(send_timeout_ms, 30000, "Bound on a single stalled send");
DEFINE_uint64(idle_timeout_ms, 60000, "Close keep-alive connections idle this long");
DEFINE_uint64(drain_timeout_ms, 5000, "Grace period for in-flight requests on shutdown");
DEFINE_uint64(stats_interval, 10, "Seconds between stats lines (0 = never)");
DEFINE_string(log_level, "info", "debug, info, warn, error or off");

using namespace std::chrono_literals;

namespace
{

xfer::ServerConfig ConfigFromFlags()
{
    xfer::ServerConfig config;
    config.root = FLAGS_root;
    config.bind_address = FLAGS_bind;
    config.port = static_cast<uint16_t>(FLAGS_port);
    if (FLAGS_io_threads > 0)
    {
        config.io_threads = FLAGS_io_threads;
    }
    if (FLAGS_blocking_threads > 0)
    {
        config.blocking_threads = FLAGS_blocking_threads;
    }
    if (FLAGS_carrier_threads > 0)
    {
        config.carrier_threads = FLAGS_carrier_threads;
    }
    config.uring_entries = FLAGS_uring_entries;
    config.chunk_size = FLAGS_chunk_size;
    config.send_timeout = std::chrono::milliseconds(FLAGS_send_timeout_ms);
    config.idle_timeout = std::chrono::milliseconds(FLAGS_idle_timeout_ms);
    config.drain_timeout = std::chrono::milliseconds(FLAGS_drain_timeout_ms);
    config.stats_interval = std::chrono::seconds(FLAGS_stats_interval);
    return config;
}

xfer::Task<> ReportStats(xfer::IoContext& ctx, const xfer::FileServer& server)
{
    const auto interval = server.Config().stats_interval;
    if (interval.count() == 0)
    {
        co_return;
    }

    while (true)
    {
        if (auto slept = co_await xfer::AsyncSleep(ctx, interval); !slept)
        {
            co_return;
        }
        XFER_LOG_INFO("[stats] {} | pool active={} peak={} queued={} | pinned={} | log dropped={}",
                      server.Stats().Format(), server.Pool()->Active(), server.Pool()->PeakActive(),
                      server.Pool()->Queued(), server.Carriers()->PinnedCalls(), xfer::alog::DroppedCount());
    }
}

xfer::Task<> WaitForShutdown(xfer::IoContext& ctx, const xfer::SignalSet& signals)
{
    auto sig = co_await xfer::AsyncWaitSignal(ctx, signals);
    if (!sig)
    {
        XFER_LOG_ERROR("signal wait failed: {}", sig.error().message());
        co_return;
    }
    XFER_LOG_INFO("received {}, shutting down", *sig == SIGINT ? "SIGINT" : "SIGTERM");
}

}  // namespace

int main(int argc, char** argv)
{
    gflags::SetUsageMessage("HTTP file-download benchmark server");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    const auto level = xfer::alog::ParseLevel(FLAGS_log_level);
    if (!level)
    {
        std::fprintf(stderr, "unknown --log_level %s\n", FLAGS_log_level.c_str());
        return 2;
    }
    xfer::alog::SetLevel(*level);
    xfer::alog::Start();

    std::signal(SIGPIPE, SIG_IGN);

    // Blocked before any thread exists so every thread inherits the mask.
    xfer::SignalSet signals{SIGINT, SIGTERM};

    xfer::FileServer server(ConfigFromFlags());
    if (auto started = server.Start(); !started)
    {
        XFER_LOG_ERROR("server failed to start: {}", started.error().message());
        xfer::alog::Stop();
        return 1;
    }

    {
        xfer::IoContext ctx(64);
        auto stats = ReportStats(ctx, server);
        stats.Start();

        auto shutdown = WaitForShutdown(ctx, signals);
        ctx.RunUntilDone(shutdown);

        // The stats task is still asleep; detach it before its frame goes.
        ctx.CancelAllPending();
    }

    server.Stop();
    xfer::alog::Stop();
    gflags::ShutDownCommandLineFlags();
    return 0;
}
