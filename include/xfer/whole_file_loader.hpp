#pragma once

#include <cstddef>
#include <vector>

#include "xfer/file_store.hpp"
#include "xfer/io_context.hpp"
#include "xfer/result.hpp"
#include "xfer/task.hpp"

namespace xfer
{

/// Reads a whole file into one buffer allocated once at handle.size bytes.
///
/// Memory is O(file size) per request; bounding it is the caller's job.
/// NotFound when the file vanished after it was resolved, IoError on a failed
/// read or when the file is shorter than handle.size.
class WholeFileLoader
{
public:
    /// Blocking. BlockingPool threads only.
    static Result<std::vector<std::byte>> Load(const FileHandle& handle);

    /// Same contract; open and reads are submitted to ctx, so the calling
    /// coroutine yields its thread while they are in flight.
    static Task<Result<std::vector<std::byte>>> LoadOn(IoContext& ctx, FileHandle handle);

    /// Largest single read request issued by either variant.
    static constexpr size_t kReadSlice = 1 << 20;
};

}  // namespace xfer
