#include "xfer/server.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <string>
#include <string_view>
#include <utility>

#include "xfer/http.hpp"
#include "xfer/io.hpp"
#include "xfer/io_helpers.hpp"
#include "xfer/ip_address.hpp"
#include "xfer/logger.hpp"
#include "xfer/response.hpp"
#include "xfer/strategy.hpp"

namespace xfer
{

using namespace std::chrono_literals;

namespace
{

// How often a blocked accept or an idle connection re-checks for shutdown.
constexpr auto kPollSlice = 200ms;

bool IsTimeout(const std::error_code& ec)
{
    return ec == std::errc::timed_out;
}

}  // namespace

FileServer::FileServer(ServerConfig config) : config_(std::move(config)), store_(config_.root) {}

FileServer::~FileServer()
{
    Stop();
}

Result<> FileServer::Start()
{
    if (auto valid = config_.Validate(); !valid)
    {
        return valid;
    }

    auto addr = net::SocketAddress::Parse(config_.bind_address, config_.port);
    if (!addr)
    {
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }

    auto listener = net::TcpListener::Bind(*addr);
    if (!listener)
    {
        XFER_LOG_ERROR("bind {}:{} failed: {}", config_.bind_address, config_.port, listener.error().message());
        return std::unexpected(listener.error());
    }
    listener_ = std::move(*listener);

    auto local = listener_.LocalAddress();
    if (!local)
    {
        listener_.Close();
        return std::unexpected(local.error());
    }
    port_ = local->GetPort().value_or(config_.port);
    const auto bound_ip = local->GetIp().value_or(config_.bind_address);

    pool_ = std::make_unique<BlockingPool>(config_.blocking_threads);
    carriers_ = std::make_unique<LightweightThreadPool>(config_.carrier_threads, config_.uring_entries);
    service_ = std::make_unique<DownloadService>(
        store_, *pool_, *carriers_, stats_,
        DownloadOptions{.chunk_size = config_.chunk_size, .send_timeout = config_.send_timeout});

    running_.store(true, std::memory_order_release);

    loops_.reserve(config_.io_threads);
    for (size_t i = 0; i < config_.io_threads; ++i)
    {
        auto loop = std::make_unique<Worker>(static_cast<int>(i), config_.uring_entries);
        const int id = loop->Id();
        loop->Start(
            [this, id](IoContext& ctx)
            {
                TaskGroup<> connections(1024);
                auto accept = AcceptLoop(ctx, connections, id);
                ctx.RunUntilDone(accept);
                ctx.CancelAllPending();
            });
        loops_.push_back(std::move(loop));
    }

    XFER_LOG_INFO("serving {} on {}:{} (loops={} blocking={} carriers={} chunk={})", store_.Root().string(),
                  bound_ip, port_, config_.io_threads, config_.blocking_threads,
                  config_.carrier_threads, config_.chunk_size);
    return {};
}

void FileServer::Stop()
{
    if (!running_.exchange(false, std::memory_order_acq_rel))
    {
        return;
    }

    // Accept loops notice within one poll slice, then drain their
    // connections; their loops must stay up until then.
    for (auto& loop : loops_)
    {
        loop->Join();
    }
    loops_.clear();

    // Nothing can offload any more.
    carriers_->Stop();
    pool_->Stop();
    listener_.Close();

    XFER_LOG_INFO("server stopped: {}", stats_.Format());
}

Task<> FileServer::AcceptLoop(IoContext& ctx, TaskGroup<>& connections, int loop_id)
{
    while (running_.load(std::memory_order_acquire))
    {
        auto accepted = co_await AsyncAccept(ctx, listener_).WithTimeout(kPollSlice);
        if (!accepted)
        {
            const auto& ec = accepted.error();
            if (IsTimeout(ec))
            {
                continue;
            }
            if (ec.value() == EBADF || ec.value() == ECANCELED)
            {
                break;
            }
            if (ec.value() == EMFILE || ec.value() == ENFILE)
            {
                XFER_LOG_WARN("loop {} out of descriptors, backing off", loop_id);
                co_await AsyncSleep(ctx, 10ms);
                continue;
            }
            XFER_LOG_ERROR("loop {} accept failed: {}", loop_id, ec.message());
            continue;
        }

        connections.Spawn(HandleConnection(ctx, *accepted));
    }

    XFER_LOG_DEBUG("loop {} draining {} connections", loop_id, connections.ActiveCount());
    if (!co_await connections.JoinAllTimeout(ctx, config_.drain_timeout))
    {
        XFER_LOG_WARN("loop {} dropping {} connections after drain timeout", loop_id, connections.ActiveCount());
    }
}

Task<> FileServer::RejectRequest(IoContext& ctx, int client_fd)
{
    const auto response = ResponseAssembler::BadRequest();
    if (auto sent = co_await AsyncSendExact(ctx, client_fd, std::string_view(response), config_.send_timeout); !sent)
    {
        XFER_LOG_DEBUG("400 to fd {} failed: {}", client_fd, sent.error().message());
    }
}

Task<> FileServer::HandleConnection(IoContext& ctx, int client_fd)
{
    FDGuard guard(client_fd);

    std::string pending;
    std::array<std::byte, 4096> buffer{};

    while (true)
    {
        // Read until a full head is buffered. Bytes past it belong to the
        // next pipelined request and stay in pending.
        std::optional<size_t> head_end = http::FindHeadEnd(pending);
        auto idle = std::chrono::milliseconds::zero();
        while (!head_end)
        {
            if (pending.size() >= http::kMaxHeadSize)
            {
                co_await RejectRequest(ctx, client_fd);
                co_return;
            }

            auto n = co_await AsyncRecv(ctx, client_fd, buffer).WithTimeout(kPollSlice);
            if (!n)
            {
                if (!IsTimeout(n.error()))
                {
                    co_return;
                }
                idle += kPollSlice;
                // Mid-head stalls still count; a shutdown only cuts idle connections.
                if (idle >= config_.idle_timeout || (pending.empty() && !running_.load(std::memory_order_acquire)))
                {
                    co_return;
                }
                continue;
            }
            if (*n == 0)
            {
                co_return;
            }

            idle = std::chrono::milliseconds::zero();
            pending.append(reinterpret_cast<const char*>(buffer.data()), *n);
            head_end = http::FindHeadEnd(pending);
        }

        if (*head_end > http::kMaxHeadSize)
        {
            co_await RejectRequest(ctx, client_fd);
            co_return;
        }

        auto request = http::ParseRequestHead(std::string_view(pending).substr(0, *head_end));
        pending.erase(0, *head_end);

        if (!request)
        {
            XFER_LOG_DEBUG("fd {} sent a malformed request", client_fd);
            co_await RejectRequest(ctx, client_fd);
            co_return;
        }

        const bool keep_alive = request->keep_alive && running_.load(std::memory_order_acquire);

        if (request->method != "GET")
        {
            const auto response = ResponseAssembler::MethodNotAllowed(keep_alive);
            if (auto sent = co_await AsyncSendExact(ctx, client_fd, std::string_view(response), config_.send_timeout);
                !sent || !keep_alive)
            {
                co_return;
            }
            continue;
        }

        auto route = http::MatchDownloadRoute(request->target);
        auto strategy = route ? ParseEndpoint(route->endpoint) : Result<TransferStrategy>(Fail(TransferErrc::NotFound));
        if (!strategy)
        {
            XFER_LOG_DEBUG("no route for {}", request->target);
            stats_.RecordUnrouted();
            const auto response = ResponseAssembler::NotFound(keep_alive);
            if (auto sent = co_await AsyncSendExact(ctx, client_fd, std::string_view(response), config_.send_timeout);
                !sent || !keep_alive)
            {
                co_return;
            }
            continue;
        }

        const bool reusable =
            co_await service_->Serve(ctx, client_fd, Select(*strategy), std::move(route->name), keep_alive);
        if (!reusable)
        {
            co_return;
        }
    }
}

}  // namespace xfer
