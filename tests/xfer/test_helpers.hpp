#pragma once
// tests/xfer/test_helpers.hpp
// Common fixtures for xfer tests: temp roots, data patterns, socket pairs

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <sys/socket.h>

#include "xfer/io_context.hpp"
#include "xfer/task.hpp"

namespace xfer::test {

// -----------------------------------------------------------------------------
// Run helpers
// -----------------------------------------------------------------------------

/// Drives ctx until t finishes, then returns its value (rethrowing).
template <typename T>
T RunTask(IoContext& ctx, Task<T>& t) {
    ctx.RunUntilDone(t);
    if (!t.Done()) {
        throw std::runtime_error("xfer task did not finish");
    }
    return t.Result();
}

// -----------------------------------------------------------------------------
// Temporary download roots
// -----------------------------------------------------------------------------

/// A fresh directory under /tmp, removed with everything in it.
class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/xfer_testXXXXXX";
        if (::mkdtemp(tmpl) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = tmpl;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& Path() const { return path_; }

    std::filesystem::path Write(const std::string& name, std::span<const std::byte> data) const {
        auto p = path_ / name;
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!out) {
            throw std::runtime_error("write failed: " + p.string());
        }
        return p;
    }

    std::filesystem::path Write(const std::string& name, std::string_view text) const {
        return Write(name, std::as_bytes(std::span(text.data(), text.size())));
    }

private:
    std::filesystem::path path_;
};

// -----------------------------------------------------------------------------
// Data patterns
// -----------------------------------------------------------------------------

/// Deterministic, non-repeating-per-KiB content so misplaced chunks show up.
inline std::vector<std::byte> GenerateTestData(size_t size, uint8_t seed = 0) {
    std::vector<std::byte> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = std::byte{static_cast<uint8_t>(((i * 31) ^ (i >> 10)) + seed)};
    }
    return data;
}

inline std::span<const std::byte> AsBytes(std::string_view sv) {
    return {reinterpret_cast<const std::byte*>(sv.data()), sv.size()};
}

inline std::string AsString(std::span<const std::byte> bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

// -----------------------------------------------------------------------------
// Sockets
// -----------------------------------------------------------------------------

class FdGuard {
public:
    explicit FdGuard(int fd = -1) : fd_(fd) {}
    ~FdGuard() { Close(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    FdGuard(FdGuard&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    [[nodiscard]] int Get() const { return fd_; }
    [[nodiscard]] bool Valid() const { return fd_ >= 0; }

    void Close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
};

struct SocketPair {
    FdGuard server;  // the side a handler writes to
    FdGuard client;  // the side a test reads from

    [[nodiscard]] bool Valid() const { return server.Valid() && client.Valid(); }
};

inline SocketPair MakeSocketPair() {
    int fds[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
        return {FdGuard{-1}, FdGuard{-1}};
    }
    return {FdGuard{fds[0]}, FdGuard{fds[1]}};
}

/// Blocking read until the peer closes.
inline std::string ReadUntilEof(int fd) {
    std::string out;
    char buf[65536];
    while (true) {
        const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) {
            break;
        }
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

/// Splits a raw response into its head (through the blank line) and body.
inline std::pair<std::string, std::string> SplitResponse(const std::string& raw) {
    const auto end = raw.find("\r\n\r\n");
    if (end == std::string::npos) {
        return {raw, {}};
    }
    return {raw.substr(0, end + 4), raw.substr(end + 4)};
}

/// Decodes a chunked body; throws on malformed framing.
inline std::string DecodeChunked(std::string_view body) {
    std::string out;
    size_t pos = 0;
    while (true) {
        const auto eol = body.find("\r\n", pos);
        if (eol == std::string_view::npos) {
            throw std::runtime_error("chunk size line missing");
        }
        const auto size = std::stoull(std::string(body.substr(pos, eol - pos)), nullptr, 16);
        pos = eol + 2;
        if (size == 0) {
            if (body.substr(pos, 2) != "\r\n") {
                throw std::runtime_error("missing final CRLF");
            }
            return out;
        }
        if (pos + size + 2 > body.size()) {
            throw std::runtime_error("chunk overruns body");
        }
        out.append(body.substr(pos, size));
        pos += size;
        if (body.substr(pos, 2) != "\r\n") {
            throw std::runtime_error("chunk not terminated by CRLF");
        }
        pos += 2;
    }
}

}  // namespace xfer::test
