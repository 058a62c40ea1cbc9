#include "xfer/config.hpp"

#include <system_error>

#include "xfer/ip_address.hpp"
#include "xfer/logger.hpp"

namespace xfer
{

namespace
{

std::unexpected<std::error_code> Invalid()
{
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
}

}  // namespace

Result<> ServerConfig::Validate() const
{
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec))
    {
        XFER_LOG_ERROR("root {} is not a directory", root.string());
        return Invalid();
    }

    if (!net::SocketAddress::Parse(bind_address, port))
    {
        XFER_LOG_ERROR("bad bind address {}", bind_address);
        return Invalid();
    }

    if (io_threads == 0 || blocking_threads == 0 || carrier_threads == 0)
    {
        XFER_LOG_ERROR("thread counts must be positive (io={} blocking={} carriers={})", io_threads,
                       blocking_threads, carrier_threads);
        return Invalid();
    }

    if (uring_entries == 0)
    {
        XFER_LOG_ERROR("uring_entries must be positive");
        return Invalid();
    }

    if (chunk_size < kMinChunkSize || chunk_size > kMaxChunkSize)
    {
        XFER_LOG_ERROR("chunk_size {} outside [{}, {}]", chunk_size, kMinChunkSize, kMaxChunkSize);
        return Invalid();
    }

    if (send_timeout.count() <= 0 || idle_timeout.count() <= 0 || drain_timeout.count() < 0)
    {
        XFER_LOG_ERROR("timeouts must be positive");
        return Invalid();
    }

    return {};
}

}  // namespace xfer
