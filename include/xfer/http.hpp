#pragma once
////////////////////////////////////////////////////////////////////////////////
// Minimal HTTP/1.1 request reader for the download endpoints
//
// Only the request line and the Connection header matter here: every endpoint
// is a bodyless GET. Request bodies are not supported.
////////////////////////////////////////////////////////////////////////////////

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "xfer/result.hpp"

namespace xfer::http
{

/// Largest request head accepted; anything longer is answered with 400.
inline constexpr size_t kMaxHeadSize = 8192;

struct HttpRequest
{
    std::string method;
    std::string target;
    bool keep_alive = true;
};

struct DownloadRoute
{
    std::string endpoint;  // segment after /download/
    std::string name;      // percent-decoded file name
};

/// Offset one past the blank line that ends the head, if buf holds one.
std::optional<size_t> FindHeadEnd(std::string_view buf);

/// Parses a complete head (request line + headers). bad_message when the
/// request line is malformed or the version is not HTTP/1.x.
Result<HttpRequest> ParseRequestHead(std::string_view head);

/// "/download/{endpoint}/{name}[?query]" -> {endpoint, name}. nullopt for any
/// other shape, including a name that is empty or badly percent-encoded.
std::optional<DownloadRoute> MatchDownloadRoute(std::string_view target);

/// %XX decoding. nullopt on a truncated or non-hex escape.
std::optional<std::string> PercentDecode(std::string_view in);

}  // namespace xfer::http
