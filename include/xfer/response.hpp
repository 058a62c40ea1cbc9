#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

#include "xfer/strategy.hpp"

namespace xfer
{

// =============================================================================
// HTTP response heads and chunk framing
// =============================================================================

class ResponseAssembler
{
public:
    static constexpr std::string_view kContentType = "application/octet-stream";

    /// 200 head. Content-Length: size, or Transfer-Encoding: chunked when the
    /// plan streams with chunked framing.
    static std::string HeadFor(const StrategyPlan& plan, uint64_t size, bool keep_alive);

    /// Empty-bodied 404.
    static std::string NotFound(bool keep_alive);

    /// Empty-bodied 500. Only valid while no byte of a 200 has been sent.
    static std::string InternalError(bool keep_alive);

    /// 404 for NotFound, 500 for anything else.
    static std::string ErrorFor(const std::error_code& ec, bool keep_alive);

    static std::string MethodNotAllowed(bool keep_alive);

    /// Always closes: the request could not be framed.
    static std::string BadRequest();

    /// "<hex size>\r\n". The chunk data and its trailing CRLF follow.
    static std::string ChunkHeader(size_t n);

    static constexpr std::string_view kChunkEnd = "\r\n";
    static constexpr std::string_view kLastChunk = "0\r\n\r\n";
    static std::string_view LastChunk() { return kLastChunk; }
};

}  // namespace xfer
