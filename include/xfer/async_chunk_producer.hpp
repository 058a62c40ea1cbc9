#pragma once
////////////////////////////////////////////////////////////////////////////////
// AsyncChunkProducer - non-blocking file reads on the event loop
//
// OpenAsync() opens through io_uring; ChunkStream then hands out the file one
// chunk per Next() call. Nothing is read before it is asked for: the consumer
// sets the pace and at most one chunk is in flight or unconsumed.
////////////////////////////////////////////////////////////////////////////////

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "xfer/file_store.hpp"
#include "xfer/io.hpp"
#include "xfer/io_context.hpp"
#include "xfer/result.hpp"
#include "xfer/task.hpp"

namespace xfer
{

struct Chunk
{
    std::vector<std::byte> bytes;
    bool last = false;
};

/// An open file plus the handle it was opened from. Closes on destruction.
class AsyncFile
{
public:
    AsyncFile(FDGuard fd, FileHandle handle) : fd_(std::move(fd)), handle_(std::move(handle)) {}

    AsyncFile(AsyncFile&&) noexcept = default;
    AsyncFile(const AsyncFile&) = delete;
    AsyncFile& operator=(const AsyncFile&) = delete;

    int Get() const { return fd_.Get(); }
    const FileHandle& Handle() const { return handle_; }
    uint64_t Size() const { return handle_.size; }

private:
    FDGuard fd_;
    FileHandle handle_;
};

/// Non-blocking open. NotFound / IoError arrive through the result.
Task<Result<AsyncFile>> OpenAsync(IoContext& ctx, FileHandle handle);

class ChunkStream
{
public:
    ChunkStream(IoContext& ctx, AsyncFile file, size_t chunk_size)
        : ctx_(&ctx), file_(std::move(file)), chunk_size_(chunk_size)
    {
    }

    ChunkStream(ChunkStream&&) noexcept = default;

    /**
     * Issues exactly one read and yields its bytes. The chunk that reaches
     * the end of the file has last set; an empty file yields std::nullopt
     * straight away. After the last chunk, or after an error, the stream is
     * finished and keeps returning std::nullopt.
     */
    Task<Result<std::optional<Chunk>>> Next();

    bool Finished() const { return finished_; }
    uint64_t Offset() const { return offset_; }
    uint64_t ReadsIssued() const { return reads_issued_; }
    const AsyncFile& File() const { return file_; }

private:
    IoContext* ctx_;
    AsyncFile file_;
    size_t chunk_size_;
    uint64_t offset_ = 0;
    uint64_t reads_issued_ = 0;
    bool finished_ = false;
};

inline ChunkStream ReadChunks(IoContext& ctx, AsyncFile file, size_t chunk_size)
{
    return ChunkStream(ctx, std::move(file), chunk_size);
}

/// The whole file in one buffer, read through ctx.
Task<Result<std::vector<std::byte>>> ReadAll(IoContext& ctx, const AsyncFile& file);

/// The whole file as a list of chunk_size segments, read through ctx.
Task<Result<std::vector<std::vector<std::byte>>>> ReadSegments(IoContext& ctx, const AsyncFile& file,
                                                               size_t chunk_size);

/// Copies segments into one contiguous buffer. CPU-bound on large files; the
/// AsyncChunkedBuffer path runs it on the BlockingPool.
std::vector<std::byte> Concatenate(std::span<const std::vector<std::byte>> segments);

}  // namespace xfer
