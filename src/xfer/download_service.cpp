#include "xfer/download_service.hpp"

#include <exception>
#include <string_view>
#include <utility>

#include "xfer/async_chunk_producer.hpp"
#include "xfer/io_helpers.hpp"
#include "xfer/logger.hpp"
#include "xfer/net.hpp"
#include "xfer/response.hpp"
#include "xfer/streaming_transfer.hpp"
#include "xfer/whole_file_loader.hpp"

namespace xfer
{

namespace
{

std::span<const std::byte> AsBytes(std::string_view text)
{
    return std::as_bytes(std::span(text.data(), text.size()));
}

}  // namespace

DownloadService::DownloadService(const FileStore& store, BlockingPool& pool, LightweightThreadPool& carriers,
                                 ServerStats& stats, DownloadOptions options)
    : store_(store), pool_(pool), carriers_(carriers), stats_(stats), options_(options)
{
}

Task<bool> DownloadService::Serve(IoContext& ctx, int client_fd, StrategyPlan plan, std::string name,
                                  bool keep_alive)
{
    XFER_LOG_INFO("{} [{}] on {}", ToString(plan.strategy), name, ToString(plan.context));
    stats_.RecordRequest(plan.strategy);

    auto outcome = co_await Run(ctx, client_fd, plan, name, keep_alive);
    stats_.RecordOutcome(plan.strategy, outcome);

    if (outcome.Ok())
    {
        co_return keep_alive;
    }

    if (outcome.head_sent)
    {
        // The status line is gone; the only honest signal left is a short body.
        XFER_LOG_WARN("{} [{}] truncated after {} body bytes: {}", ToString(plan.strategy), name,
                      outcome.body_bytes, outcome.error.message());
        co_return false;
    }

    const auto response = ResponseAssembler::ErrorFor(outcome.error, keep_alive);
    if (auto sent = co_await AsyncSendExact(ctx, client_fd, std::string_view(response), options_.send_timeout); !sent)
    {
        XFER_LOG_DEBUG("error response to fd {} failed: {}", client_fd, sent.error().message());
        co_return false;
    }
    co_return keep_alive;
}

Task<TransferOutcome> DownloadService::Run(IoContext& ctx, int client_fd, const StrategyPlan& plan,
                                           const std::string& name, bool keep_alive)
{
    TransferOutcome out;
    try
    {
        switch (plan.strategy)
        {
            case TransferStrategy::AsyncWholeFile:
                co_await ServeAsyncWholeFile(ctx, client_fd, plan, name, keep_alive, out);
                break;
            case TransferStrategy::AsyncChunkedBuffer:
                co_await ServeAsyncChunkedBuffer(ctx, client_fd, plan, name, keep_alive, out);
                break;
            case TransferStrategy::AsyncChunkStream:
                co_await ServeAsyncChunkStream(ctx, client_fd, plan, name, keep_alive, out);
                break;
            case TransferStrategy::BlockingStream:
                co_await ServeBlockingStream(ctx, client_fd, plan, name, keep_alive, out);
                break;
            case TransferStrategy::BlockingWholeBuffer:
                co_await ServeBlockingWholeBuffer(ctx, client_fd, plan, name, keep_alive, out);
                break;
            case TransferStrategy::BlockingWholeBufferOnLightweightThread:
                co_await ServeOnLightweightThread(ctx, client_fd, plan, name, keep_alive, out);
                break;
        }
    }
    catch (const std::exception& e)
    {
        XFER_LOG_ERROR("{} [{}] failed with exception: {}", ToString(plan.strategy), name, e.what());
        out.error = make_error_code(TransferErrc::IoError);
    }
    co_return out;
}

// ----------------------------------------------------------------------------
// Event-loop strategies
// ----------------------------------------------------------------------------

Task<> DownloadService::ServeAsyncWholeFile(IoContext& ctx, int fd, const StrategyPlan& plan,
                                            const std::string& name, bool keep_alive, TransferOutcome& out)
{
    auto handle = co_await store_.AsyncResolve(ctx, name);
    if (!handle)
    {
        out.error = handle.error();
        co_return;
    }

    auto file = co_await OpenAsync(ctx, std::move(*handle));
    if (!file)
    {
        out.error = file.error();
        co_return;
    }

    const auto head = ResponseAssembler::HeadFor(plan, file->Size(), keep_alive);
    out.head_sent = true;
    if (auto sent = co_await AsyncSendExact(ctx, fd, std::string_view(head), options_.send_timeout); !sent)
    {
        out.error = sent.error();
        co_return;
    }

    if (file->Size() == 0)
    {
        co_return;
    }

    auto body = co_await AsyncSendfile(ctx, fd, *file, 0, static_cast<size_t>(file->Size()), options_.send_timeout,
                                       [&out](size_t n) { out.body_bytes += n; });
    if (!body)
    {
        out.error = body.error();
    }
}

Task<> DownloadService::ServeAsyncChunkedBuffer(IoContext& ctx, int fd, const StrategyPlan& plan,
                                                const std::string& name, bool keep_alive, TransferOutcome& out)
{
    auto handle = co_await store_.AsyncResolve(ctx, name);
    if (!handle)
    {
        out.error = handle.error();
        co_return;
    }

    auto file = co_await OpenAsync(ctx, std::move(*handle));
    if (!file)
    {
        out.error = file.error();
        co_return;
    }

    auto segments = co_await ReadSegments(ctx, *file, options_.chunk_size);
    if (!segments)
    {
        out.error = segments.error();
        co_return;
    }

    // Joining the segments is a plain memcpy over the whole file; keep it off
    // the loop.
    auto body = co_await Offload(ctx, pool_, [&segs = *segments] { return Concatenate(segs); });
    segments->clear();
    segments->shrink_to_fit();

    co_await SendBuffered(ctx, fd, plan, keep_alive, body, out);
}

Task<> DownloadService::ServeAsyncChunkStream(IoContext& ctx, int fd, const StrategyPlan& plan,
                                              const std::string& name, bool keep_alive, TransferOutcome& out)
{
    auto handle = co_await store_.AsyncResolve(ctx, name);
    if (!handle)
    {
        out.error = handle.error();
        co_return;
    }

    auto file = co_await OpenAsync(ctx, std::move(*handle));
    if (!file)
    {
        out.error = file.error();
        co_return;
    }

    const auto head = ResponseAssembler::HeadFor(plan, file->Size(), keep_alive);
    out.head_sent = true;
    if (auto sent = co_await AsyncSendExact(ctx, fd, std::string_view(head), options_.send_timeout); !sent)
    {
        out.error = sent.error();
        co_return;
    }

    auto stream = ReadChunks(ctx, std::move(*file), options_.chunk_size);
    std::string frame;
    while (true)
    {
        auto chunk = co_await stream.Next();
        if (!chunk)
        {
            out.error = chunk.error();
            co_return;
        }
        if (!chunk->has_value())
        {
            break;
        }

        const auto& bytes = (*chunk)->bytes;
        frame = ResponseAssembler::ChunkHeader(bytes.size());
        frame.append(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        frame.append(ResponseAssembler::kChunkEnd);

        if (auto sent = co_await AsyncSendExact(ctx, fd, std::string_view(frame), options_.send_timeout); !sent)
        {
            out.error = sent.error();
            co_return;
        }
        out.body_bytes += bytes.size();

        if ((*chunk)->last)
        {
            break;
        }
    }

    if (auto sent = co_await AsyncSendExact(ctx, fd, ResponseAssembler::LastChunk(), options_.send_timeout); !sent)
    {
        out.error = sent.error();
    }
}

// ----------------------------------------------------------------------------
// BlockingPool strategies
// ----------------------------------------------------------------------------

Task<> DownloadService::ServeBlockingStream(IoContext& ctx, int fd, const StrategyPlan& plan,
                                            const std::string& name, bool keep_alive, TransferOutcome& out)
{
    // out is written on the pool thread; the completion handoff orders it
    // before the loop reads it again.
    co_await Offload(ctx, pool_,
                     [this, fd, &plan, &name, keep_alive, &out] { StreamBlocking(fd, plan, name, keep_alive, out); });
}

void DownloadService::StreamBlocking(int fd, const StrategyPlan& plan, const std::string& name, bool keep_alive,
                                     TransferOutcome& out) const
{
    auto handle = store_.Resolve(name);
    if (!handle)
    {
        out.error = handle.error();
        return;
    }

    auto file = StreamingTransfer::Open(*handle);
    if (!file)
    {
        out.error = file.error();
        return;
    }

    // The socket belongs to this thread until the offload completes; bound
    // each blocking send the way the loop bounds its own.
    if (auto r = SetSendTimeout(fd, options_.send_timeout); !r)
    {
        out.error = r.error();
        return;
    }

    SocketSink sink(fd);
    const auto head = ResponseAssembler::HeadFor(plan, handle->size, keep_alive);
    if (auto w = sink.Write(AsBytes(head)); !w)
    {
        out.head_sent = sink.BytesWritten() > 0;
        out.error = w.error();
        return;
    }
    out.head_sent = true;

    const StreamingTransfer transfer(options_.chunk_size);
    TransferReport report;
    auto streamed = transfer.Stream(*file, *handle, sink, report);
    out.body_bytes = report.bytes;
    if (!streamed)
    {
        out.error = streamed.error();
    }
}

Task<> DownloadService::ServeBlockingWholeBuffer(IoContext& ctx, int fd, const StrategyPlan& plan,
                                                 const std::string& name, bool keep_alive, TransferOutcome& out)
{
    auto loaded = co_await Offload(ctx, pool_,
                                   [this, &name]() -> Result<LoadedFile>
                                   {
                                       auto handle = store_.Resolve(name);
                                       if (!handle)
                                       {
                                           return std::unexpected(handle.error());
                                       }
                                       auto data = WholeFileLoader::Load(*handle);
                                       if (!data)
                                       {
                                           return std::unexpected(data.error());
                                       }
                                       return LoadedFile{std::move(*handle), std::move(*data)};
                                   });
    if (!loaded)
    {
        out.error = loaded.error();
        co_return;
    }

    co_await SendBuffered(ctx, fd, plan, keep_alive, loaded->data, out);
}

// ----------------------------------------------------------------------------
// Lightweight-thread strategy
// ----------------------------------------------------------------------------

Task<> DownloadService::ServeOnLightweightThread(IoContext& ctx, int fd, const StrategyPlan& plan,
                                                 const std::string& name, bool keep_alive, TransferOutcome& out)
{
    const FileStore& store = store_;
    auto loaded = co_await RunOnLightweightThread(ctx, carriers_, [&store, &name](Carrier& carrier)
                                                  { return LoadOnCarrier(carrier, store, name); });
    if (!loaded)
    {
        out.error = loaded.error();
        co_return;
    }

    co_await SendBuffered(ctx, fd, plan, keep_alive, loaded->data, out);
}

Task<Result<LoadedFile>> DownloadService::LoadOnCarrier(Carrier& carrier, const FileStore& store, std::string name)
{
    // lstat has no non-blocking form here; it pins the carrier while it runs.
    auto handle = carrier.Pin([&] { return store.Resolve(name); });
    if (!handle)
    {
        co_return std::unexpected(handle.error());
    }

    auto data = co_await WholeFileLoader::LoadOn(carrier.Io(), *handle);
    if (!data)
    {
        co_return std::unexpected(data.error());
    }
    co_return LoadedFile{std::move(*handle), std::move(*data)};
}

// ----------------------------------------------------------------------------

Task<> DownloadService::SendBuffered(IoContext& ctx, int fd, const StrategyPlan& plan, bool keep_alive,
                                     std::span<const std::byte> body, TransferOutcome& out)
{
    const auto head = ResponseAssembler::HeadFor(plan, body.size(), keep_alive);
    out.head_sent = true;
    if (auto sent = co_await AsyncSendExact(ctx, fd, std::string_view(head), options_.send_timeout); !sent)
    {
        out.error = sent.error();
        co_return;
    }

    if (auto sent = co_await AsyncSendExact(ctx, fd, body, options_.send_timeout); !sent)
    {
        out.error = sent.error();
        co_return;
    }
    out.body_bytes = body.size();
}

}  // namespace xfer
