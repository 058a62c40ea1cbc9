#include "xfer/async_chunk_producer.hpp"

#include <algorithm>
#include <cstring>
#include <string>

#include <fcntl.h>

#include "xfer/io_helpers.hpp"
#include "xfer/logger.hpp"

namespace xfer
{

Task<Result<AsyncFile>> OpenAsync(IoContext& ctx, FileHandle handle)
{
    const std::string path = handle.path.string();
    auto opened = co_await AsyncOpen(ctx, path.c_str(), O_RDONLY | O_CLOEXEC | O_NOFOLLOW);
    if (!opened)
    {
        XFER_LOG_WARN("async open {} failed: {}", path, opened.error().message());
        co_return Fail(ClassifyErrno(opened.error().value()));
    }
    co_return AsyncFile(FDGuard(*opened), std::move(handle));
}

Task<Result<std::optional<Chunk>>> ChunkStream::Next()
{
    if (finished_)
    {
        co_return std::nullopt;
    }

    const uint64_t size = file_.Size();
    if (offset_ >= size)
    {
        finished_ = true;
        co_return std::nullopt;
    }

    const auto want = static_cast<size_t>(std::min<uint64_t>(chunk_size_, size - offset_));
    std::vector<std::byte> bytes(want);

    ++reads_issued_;
    auto n = co_await AsyncRead(*ctx_, file_, std::span(bytes), offset_);
    if (!n)
    {
        finished_ = true;
        XFER_LOG_ERROR("chunk read {} at {} failed: {}", file_.Handle().name, offset_, n.error().message());
        co_return Fail(TransferErrc::IoError);
    }
    if (*n == 0)
    {
        finished_ = true;
        XFER_LOG_WARN("chunk stream {} shrank to {} of {} bytes", file_.Handle().name, offset_, size);
        co_return Fail(TransferErrc::IoError);
    }

    bytes.resize(*n);
    offset_ += *n;
    const bool last = offset_ >= size;
    if (last)
    {
        finished_ = true;
    }

    co_return Chunk{.bytes = std::move(bytes), .last = last};
}

Task<Result<std::vector<std::byte>>> ReadAll(IoContext& ctx, const AsyncFile& file)
{
    std::vector<std::byte> data(file.Size());
    auto n = co_await AsyncReadFull(ctx, file, std::span(data), 0);
    if (!n)
    {
        XFER_LOG_ERROR("read {} failed: {}", file.Handle().name, n.error().message());
        co_return Fail(TransferErrc::IoError);
    }
    if (*n != data.size())
    {
        XFER_LOG_WARN("read {} shrank to {} of {} bytes", file.Handle().name, *n, data.size());
        co_return Fail(TransferErrc::IoError);
    }
    co_return data;
}

Task<Result<std::vector<std::vector<std::byte>>>> ReadSegments(IoContext& ctx, const AsyncFile& file,
                                                               size_t chunk_size)
{
    std::vector<std::vector<std::byte>> segments;
    segments.reserve(static_cast<size_t>((file.Size() + chunk_size - 1) / chunk_size));

    uint64_t offset = 0;
    while (offset < file.Size())
    {
        const auto want = static_cast<size_t>(std::min<uint64_t>(chunk_size, file.Size() - offset));
        std::vector<std::byte> segment(want);

        auto n = co_await AsyncReadFull(ctx, file, std::span(segment), offset);
        if (!n)
        {
            XFER_LOG_ERROR("segment read {} at {} failed: {}", file.Handle().name, offset, n.error().message());
            co_return Fail(TransferErrc::IoError);
        }
        if (*n != want)
        {
            XFER_LOG_WARN("segment read {} shrank to {} of {} bytes", file.Handle().name, offset + *n, file.Size());
            co_return Fail(TransferErrc::IoError);
        }

        offset += want;
        segments.push_back(std::move(segment));
    }

    co_return segments;
}

std::vector<std::byte> Concatenate(std::span<const std::vector<std::byte>> segments)
{
    size_t total = 0;
    for (const auto& s : segments)
    {
        total += s.size();
    }

    std::vector<std::byte> out(total);
    size_t pos = 0;
    for (const auto& s : segments)
    {
        if (!s.empty())
        {
            std::memcpy(out.data() + pos, s.data(), s.size());
        }
        pos += s.size();
    }
    return out;
}

}  // namespace xfer
