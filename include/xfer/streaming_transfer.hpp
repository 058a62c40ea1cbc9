#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "xfer/file_store.hpp"
#include "xfer/io.hpp"
#include "xfer/result.hpp"

namespace xfer
{

/// Destination of a blocking transfer.
class ByteSink
{
public:
    virtual ~ByteSink() = default;
    virtual Result<> Write(std::span<const std::byte> bytes) = 0;
    virtual Result<> Flush() = 0;
};

/// Writes to a connected, blocking socket. Every Write() either hands all
/// bytes to the kernel or fails; a send that stalls past the socket's
/// SO_SNDTIMEO fails with timed_out.
class SocketSink final : public ByteSink
{
public:
    explicit SocketSink(int fd) : fd_(fd) {}

    Result<> Write(std::span<const std::byte> bytes) override;

    // Nothing is buffered in user space; send(2) already handed the bytes over.
    Result<> Flush() override { return {}; }

    uint64_t BytesWritten() const { return bytes_written_; }

private:
    int fd_;
    uint64_t bytes_written_ = 0;
};

struct TransferReport
{
    uint64_t bytes = 0;
    uint64_t chunks = 0;
};

/// Copies a file to a sink one chunk at a time, reusing a single buffer, so
/// memory stays at chunk_size whatever the file size. Blocking: call it from
/// a BlockingPool thread only.
class StreamingTransfer
{
public:
    static constexpr size_t kDefaultChunkSize = 4096;

    explicit StreamingTransfer(size_t chunk_size = kDefaultChunkSize) : chunk_size_(chunk_size) {}

    /// Opens handle and streams it. Sends exactly handle.size bytes and
    /// stops at the first failed read or write, or when the file turns out
    /// shorter than that. Bytes already written stay written.
    Result<TransferReport> Transfer(const FileHandle& handle, ByteSink& sink) const;

    /// The two halves of Transfer(), for callers that must write something
    /// (a response head) between a successful open and the first chunk.
    /// On failure, report still tells how far the stream got.
    static Result<FDGuard> Open(const FileHandle& handle);
    Result<TransferReport> Stream(const FDGuard& fd, const FileHandle& handle, ByteSink& sink,
                                  TransferReport& report) const;

    size_t ChunkSize() const { return chunk_size_; }

private:
    size_t chunk_size_;
};

}  // namespace xfer
