#pragma once

#include <array>
#include <cstdint>
#include <string_view>

#include "xfer/result.hpp"

namespace xfer
{

enum class TransferStrategy : uint8_t
{
    AsyncWholeFile,
    AsyncChunkedBuffer,
    AsyncChunkStream,
    BlockingStream,
    BlockingWholeBuffer,
    BlockingWholeBufferOnLightweightThread,
};

inline constexpr size_t kStrategyCount = 6;

enum class ExecutionContext : uint8_t
{
    EventLoop,
    BoundedWorkerPool,
    LightweightThreadPool,
};

enum class Framing : uint8_t
{
    ContentLength,
    Chunked,
};

/// Where and how one request runs. Fixed once selected.
struct StrategyPlan
{
    TransferStrategy strategy;
    ExecutionContext context;  // where the file is read
    Framing framing;
    bool copy_on_worker;  // a CPU-bound copy step is offloaded to the BlockingPool
};

/// The one mapping from strategy to execution context. Anything that reads
/// the filesystem with blocking calls is placed off the event loop.
constexpr StrategyPlan Select(TransferStrategy strategy)
{
    switch (strategy)
    {
        case TransferStrategy::AsyncWholeFile:
            return {strategy, ExecutionContext::EventLoop, Framing::ContentLength, false};
        case TransferStrategy::AsyncChunkedBuffer:
            return {strategy, ExecutionContext::EventLoop, Framing::ContentLength, true};
        case TransferStrategy::AsyncChunkStream:
            return {strategy, ExecutionContext::EventLoop, Framing::Chunked, false};
        case TransferStrategy::BlockingStream:
            return {strategy, ExecutionContext::BoundedWorkerPool, Framing::ContentLength, false};
        case TransferStrategy::BlockingWholeBuffer:
            return {strategy, ExecutionContext::BoundedWorkerPool, Framing::ContentLength, false};
        case TransferStrategy::BlockingWholeBufferOnLightweightThread:
            return {strategy, ExecutionContext::LightweightThreadPool, Framing::ContentLength, false};
    }
    return {strategy, ExecutionContext::BoundedWorkerPool, Framing::ContentLength, false};
}

struct EndpointName
{
    std::string_view segment;
    TransferStrategy strategy;
};

/// URL segment after /download/ for each strategy. asyncByteArray is the
/// older spelling of asyncBuffer.
inline constexpr std::array<EndpointName, 7> kEndpoints = {{
    {"asyncFile", TransferStrategy::AsyncWholeFile},
    {"asyncBuffer", TransferStrategy::AsyncChunkedBuffer},
    {"asyncByteArray", TransferStrategy::AsyncChunkedBuffer},
    {"asyncMultiBuffer", TransferStrategy::AsyncChunkStream},
    {"stream", TransferStrategy::BlockingStream},
    {"byteArray", TransferStrategy::BlockingWholeBuffer},
    {"byteArrayVirtual", TransferStrategy::BlockingWholeBufferOnLightweightThread},
}};

/// NotFound for an unknown segment. Case-sensitive.
inline Result<TransferStrategy> ParseEndpoint(std::string_view segment)
{
    for (const auto& e : kEndpoints)
    {
        if (e.segment == segment)
        {
            return e.strategy;
        }
    }
    return Fail(TransferErrc::NotFound);
}

constexpr std::string_view ToString(TransferStrategy s)
{
    switch (s)
    {
        case TransferStrategy::AsyncWholeFile:
            return "asyncFile";
        case TransferStrategy::AsyncChunkedBuffer:
            return "asyncBuffer";
        case TransferStrategy::AsyncChunkStream:
            return "asyncMultiBuffer";
        case TransferStrategy::BlockingStream:
            return "stream";
        case TransferStrategy::BlockingWholeBuffer:
            return "byteArray";
        case TransferStrategy::BlockingWholeBufferOnLightweightThread:
            return "byteArrayVirtual";
    }
    return "unknown";
}

constexpr std::string_view ToString(ExecutionContext c)
{
    switch (c)
    {
        case ExecutionContext::EventLoop:
            return "event-loop";
        case ExecutionContext::BoundedWorkerPool:
            return "worker-pool";
        case ExecutionContext::LightweightThreadPool:
            return "lightweight";
    }
    return "unknown";
}

}  // namespace xfer
