#include "xfer/response.hpp"

#include <format>

namespace xfer
{

namespace
{

std::string_view ConnectionValue(bool keep_alive)
{
    return keep_alive ? "keep-alive" : "close";
}

std::string EmptyResponse(std::string_view status, bool keep_alive)
{
    return std::format(
        "HTTP/1.1 {}\r\n"
        "Content-Length: 0\r\n"
        "Connection: {}\r\n"
        "\r\n",
        status, ConnectionValue(keep_alive));
}

}  // namespace

std::string ResponseAssembler::HeadFor(const StrategyPlan& plan, uint64_t size, bool keep_alive)
{
    if (plan.framing == Framing::Chunked)
    {
        return std::format(
            "HTTP/1.1 200 OK\r\n"
            "Content-Type: {}\r\n"
            "Transfer-Encoding: chunked\r\n"
            "Connection: {}\r\n"
            "\r\n",
            kContentType, ConnectionValue(keep_alive));
    }

    return std::format(
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: {}\r\n"
        "Content-Length: {}\r\n"
        "Connection: {}\r\n"
        "\r\n",
        kContentType, size, ConnectionValue(keep_alive));
}

std::string ResponseAssembler::NotFound(bool keep_alive)
{
    return EmptyResponse("404 Not Found", keep_alive);
}

std::string ResponseAssembler::InternalError(bool keep_alive)
{
    return EmptyResponse("500 Internal Server Error", keep_alive);
}

std::string ResponseAssembler::ErrorFor(const std::error_code& ec, bool keep_alive)
{
    return IsNotFound(ec) ? NotFound(keep_alive) : InternalError(keep_alive);
}

std::string ResponseAssembler::MethodNotAllowed(bool keep_alive)
{
    return std::format(
        "HTTP/1.1 405 Method Not Allowed\r\n"
        "Allow: GET\r\n"
        "Content-Length: 0\r\n"
        "Connection: {}\r\n"
        "\r\n",
        ConnectionValue(keep_alive));
}

std::string ResponseAssembler::BadRequest()
{
    return EmptyResponse("400 Bad Request", false);
}

std::string ResponseAssembler::ChunkHeader(size_t n)
{
    return std::format("{:x}\r\n", n);
}

}  // namespace xfer
