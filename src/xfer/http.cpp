#include "xfer/http.hpp"

#include <algorithm>
#include <cctype>

namespace xfer::http
{

namespace
{

bool IEquals(std::string_view a, std::string_view b)
{
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(),
                                               [](char x, char y)
                                               {
                                                   return std::tolower(static_cast<unsigned char>(x)) ==
                                                          std::tolower(static_cast<unsigned char>(y));
                                               });
}

std::string_view Trim(std::string_view s)
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
    {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
    {
        s.remove_suffix(1);
    }
    return s;
}

// Connection is a comma-separated token list
bool HasToken(std::string_view list, std::string_view token)
{
    while (!list.empty())
    {
        const auto comma = list.find(',');
        if (IEquals(Trim(list.substr(0, comma)), token))
        {
            return true;
        }
        if (comma == std::string_view::npos)
        {
            break;
        }
        list.remove_prefix(comma + 1);
    }
    return false;
}

int HexValue(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
}

}  // namespace

std::optional<size_t> FindHeadEnd(std::string_view buf)
{
    const auto pos = buf.find("\r\n\r\n");
    if (pos == std::string_view::npos)
    {
        return std::nullopt;
    }
    return pos + 4;
}

Result<HttpRequest> ParseRequestHead(std::string_view head)
{
    const auto bad = std::unexpected(std::make_error_code(std::errc::bad_message));

    const auto line_end = head.find("\r\n");
    const std::string_view line = head.substr(0, line_end);

    const auto sp1 = line.find(' ');
    if (sp1 == std::string_view::npos || sp1 == 0)
    {
        return bad;
    }
    const auto sp2 = line.find(' ', sp1 + 1);
    if (sp2 == std::string_view::npos || sp2 == sp1 + 1)
    {
        return bad;
    }

    const std::string_view version = line.substr(sp2 + 1);
    if (!version.starts_with("HTTP/1."))
    {
        return bad;
    }

    HttpRequest req;
    req.method = std::string(line.substr(0, sp1));
    req.target = std::string(line.substr(sp1 + 1, sp2 - sp1 - 1));
    req.keep_alive = version != "HTTP/1.0";

    if (line_end == std::string_view::npos)
    {
        return req;
    }

    std::string_view rest = head.substr(line_end + 2);
    while (!rest.empty())
    {
        const auto eol = rest.find("\r\n");
        const std::string_view field = rest.substr(0, eol);
        rest = eol == std::string_view::npos ? std::string_view{} : rest.substr(eol + 2);

        if (field.empty())
        {
            break;
        }

        const auto colon = field.find(':');
        if (colon == std::string_view::npos)
        {
            return bad;
        }

        if (IEquals(field.substr(0, colon), "connection"))
        {
            const auto value = field.substr(colon + 1);
            if (HasToken(value, "close"))
            {
                req.keep_alive = false;
            }
            else if (HasToken(value, "keep-alive"))
            {
                req.keep_alive = true;
            }
        }
    }

    return req;
}

std::optional<std::string> PercentDecode(std::string_view in)
{
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i)
    {
        if (in[i] != '%')
        {
            out.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size())
        {
            return std::nullopt;
        }
        const int hi = HexValue(in[i + 1]);
        const int lo = HexValue(in[i + 2]);
        if (hi < 0 || lo < 0)
        {
            return std::nullopt;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return out;
}

std::optional<DownloadRoute> MatchDownloadRoute(std::string_view target)
{
    constexpr std::string_view kPrefix = "/download/";

    target = target.substr(0, target.find('?'));
    if (!target.starts_with(kPrefix))
    {
        return std::nullopt;
    }
    target.remove_prefix(kPrefix.size());

    const auto slash = target.find('/');
    if (slash == std::string_view::npos || slash == 0)
    {
        return std::nullopt;
    }

    auto name = PercentDecode(target.substr(slash + 1));
    if (!name || name->empty())
    {
        return std::nullopt;
    }

    return DownloadRoute{
        .endpoint = std::string(target.substr(0, slash)),
        .name = std::move(*name),
    };
}

}  // namespace xfer::http
