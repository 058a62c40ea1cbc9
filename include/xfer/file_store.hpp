#pragma once
////////////////////////////////////////////////////////////////////////////////
// FileStore - maps a logical file name to a file under the download root
//
// Names are flat: one path component, no "." / "..", no '/', no NUL. The
// store never follows a symlink, so every handle it returns points at a
// regular file that physically lives inside the root.
////////////////////////////////////////////////////////////////////////////////

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "xfer/io_context.hpp"
#include "xfer/result.hpp"
#include "xfer/task.hpp"

namespace xfer
{

/// A resolved download target. Created per request, never shared.
struct FileHandle
{
    std::string name;             // as requested, root-relative
    std::filesystem::path path;   // absolute
    uint64_t size = 0;            // bytes, as seen at resolve time
};

class FileStore
{
public:
    virtual ~FileStore() = default;

    /// Validation and join only; no syscalls, safe on the event loop.
    virtual Result<std::filesystem::path> ResolvePath(std::string_view name) const = 0;

    /// Blocking (lstat). NotFound for anything that is not a regular file.
    virtual Result<FileHandle> Resolve(std::string_view name) const = 0;

    /// Blocking. Fresh size of an already resolved file.
    virtual Result<uint64_t> Size(const FileHandle& handle) const = 0;

    /// Resolve() with the metadata lookup submitted to ctx as statx.
    virtual Task<Result<FileHandle>> AsyncResolve(IoContext& ctx, std::string name) const = 0;

    virtual const std::filesystem::path& Root() const = 0;
};

class LocalFileStore final : public FileStore
{
public:
    /// root is made absolute and normalized once, here.
    explicit LocalFileStore(const std::filesystem::path& root);

    Result<std::filesystem::path> ResolvePath(std::string_view name) const override;
    Result<FileHandle> Resolve(std::string_view name) const override;
    Result<uint64_t> Size(const FileHandle& handle) const override;
    Task<Result<FileHandle>> AsyncResolve(IoContext& ctx, std::string name) const override;

    const std::filesystem::path& Root() const override { return root_; }

private:
    std::filesystem::path root_;
};

/// True when name is a single, plain path component.
bool IsValidFileName(std::string_view name);

}  // namespace xfer
