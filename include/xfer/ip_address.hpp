#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <sys/socket.h>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace xfer::net
{

////////////////////////////////////////////////////////////////////////////////
// SocketAddress - IPv4/IPv6 wrapper, data only
////////////////////////////////////////////////////////////////////////////////

struct SocketAddress
{
    sockaddr_storage addr{};
    socklen_t addrlen = sizeof(sockaddr_storage);

    SocketAddress() = default;

    /// @brief IPv4 address; port in host byte order, nullptr/"" means 0.0.0.0.
    /// @return std::nullopt when ip is not a dotted quad.
    static std::optional<SocketAddress> V4(uint16_t port, const char* ip = nullptr)
    {
        SocketAddress sa;
        auto* in = reinterpret_cast<sockaddr_in*>(&sa.addr);
        in->sin_family = AF_INET;
        in->sin_port = htons(port);
        if (ip != nullptr && *ip != '\0')
        {
            if (inet_pton(AF_INET, ip, &in->sin_addr) != 1)
            {
                return std::nullopt;
            }
        }
        else
        {
            in->sin_addr.s_addr = INADDR_ANY;
        }
        sa.addrlen = sizeof(sockaddr_in);
        return sa;
    }

    /// @brief IPv6 address; nullptr/"" means ::.
    static std::optional<SocketAddress> V6(uint16_t port, const char* ip = nullptr)
    {
        SocketAddress sa;
        auto* in6 = reinterpret_cast<sockaddr_in6*>(&sa.addr);
        in6->sin6_family = AF_INET6;
        in6->sin6_port = htons(port);
        if (ip != nullptr && *ip != '\0')
        {
            if (inet_pton(AF_INET6, ip, &in6->sin6_addr) != 1)
            {
                return std::nullopt;
            }
        }
        else
        {
            in6->sin6_addr = in6addr_any;
        }
        sa.addrlen = sizeof(sockaddr_in6);
        return sa;
    }

    /// @brief Picks V4 or V6 from the textual form of ip.
    static std::optional<SocketAddress> Parse(const std::string& ip, uint16_t port)
    {
        if (ip.find(':') != std::string::npos)
        {
            return V6(port, ip.c_str());
        }
        return V4(port, ip.c_str());
    }

    [[nodiscard]] const sockaddr* Get() const { return reinterpret_cast<const sockaddr*>(&addr); }
    [[nodiscard]] sockaddr* GetMutable() { return reinterpret_cast<sockaddr*>(&addr); }

    [[nodiscard]] std::optional<std::string> GetIp() const
    {
        char buffer[INET6_ADDRSTRLEN];
        if (addr.ss_family == AF_INET)
        {
            const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
            if (inet_ntop(AF_INET, &in->sin_addr, buffer, sizeof(buffer)) != nullptr)
            {
                return std::string(buffer);
            }
        }
        else if (addr.ss_family == AF_INET6)
        {
            const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
            if (inet_ntop(AF_INET6, &in6->sin6_addr, buffer, sizeof(buffer)) != nullptr)
            {
                return std::string(buffer);
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<uint16_t> GetPort() const
    {
        if (addr.ss_family == AF_INET)
        {
            return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
        }
        if (addr.ss_family == AF_INET6)
        {
            return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
        }
        return std::nullopt;
    }
};

}  // namespace xfer::net
