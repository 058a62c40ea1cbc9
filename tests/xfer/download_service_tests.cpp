// tests/xfer/download_service_tests.cpp
// Every strategy over a socket pair: bytes, framing, errors and counters

#include <algorithm>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>

#include <sys/socket.h>

#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "xfer/blocking_pool.hpp"
#include "xfer/download_service.hpp"
#include "xfer/file_store.hpp"
#include "xfer/io_context.hpp"
#include "xfer/lightweight_pool.hpp"
#include "xfer/server_stats.hpp"
#include "xfer/strategy.hpp"

using namespace xfer;
using namespace xfer::test;
using namespace std::chrono_literals;

namespace {

/// A store whose lookups throw, the way an allocation failure would.
class ThrowingStore final : public FileStore {
public:
    explicit ThrowingStore(std::filesystem::path root) : root_(std::move(root)) {}

    Result<std::filesystem::path> ResolvePath(std::string_view) const override {
        throw std::runtime_error("lookup exploded");
    }

    Result<FileHandle> Resolve(std::string_view) const override { throw std::runtime_error("lookup exploded"); }

    Result<uint64_t> Size(const FileHandle&) const override { throw std::runtime_error("lookup exploded"); }

    Task<Result<FileHandle>> AsyncResolve(IoContext&, std::string) const override {
        throw std::runtime_error("lookup exploded");
        co_return std::unexpected(make_error_code(TransferErrc::IoError));
    }

    const std::filesystem::path& Root() const override { return root_; }

private:
    std::filesystem::path root_;
};

const auto kAllStrategies =
    ::testing::Values(TransferStrategy::AsyncWholeFile, TransferStrategy::AsyncChunkedBuffer,
                      TransferStrategy::AsyncChunkStream, TransferStrategy::BlockingStream,
                      TransferStrategy::BlockingWholeBuffer, TransferStrategy::BlockingWholeBufferOnLightweightThread);

std::string StrategyName(const ::testing::TestParamInfo<TransferStrategy>& info) {
    return std::string(ToString(info.param));
}

}  // namespace

class DownloadServiceTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() { std::signal(SIGPIPE, SIG_IGN); }

    struct Exchange {
        bool reusable = false;
        std::string head;
        std::string body;
    };

    /// Serves one request on a fresh socket pair and collects what the client saw.
    Exchange Download(TransferStrategy strategy, const std::string& name, bool keep_alive = false) {
        return Download(service, strategy, name, keep_alive);
    }

    Exchange Download(DownloadService& svc, TransferStrategy strategy, const std::string& name,
                      bool keep_alive = false) {
        auto pair = MakeSocketPair();
        if (!pair.Valid()) {
            throw std::runtime_error("socketpair failed");
        }

        std::string raw;
        std::thread reader([&] { raw = ReadUntilEof(pair.client.Get()); });

        auto t = svc.Serve(ctx, pair.server.Get(), Select(strategy), name, keep_alive);
        Exchange ex;
        ex.reusable = RunTask(ctx, t);
        pair.server.Close();
        reader.join();

        auto [head, body] = SplitResponse(raw);
        ex.head = std::move(head);
        ex.body = std::move(body);
        return ex;
    }

    TempDir dir;
    LocalFileStore store{dir.Path()};
    BlockingPool pool{4};
    LightweightThreadPool carriers{2};
    ServerStats stats;
    DownloadService service{store, pool, carriers, stats, DownloadOptions{.chunk_size = 4096, .send_timeout = 5s}};
    IoContext ctx{256};
};

class DownloadStrategyTest : public DownloadServiceTest, public ::testing::WithParamInterface<TransferStrategy> {};

TEST_P(DownloadStrategyTest, DeliversExactFileBytes) {
    const auto content = GenerateTestData(200 * 1024 + 17, 3);
    dir.Write("data.bin", content);

    const auto ex = Download(GetParam(), "data.bin");
    EXPECT_EQ(ex.head.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(ex.head.find("Content-Type: application/octet-stream\r\n"), std::string::npos);
    EXPECT_NE(ex.head.find("Connection: close\r\n"), std::string::npos);
    EXPECT_FALSE(ex.reusable);

    if (Select(GetParam()).framing == Framing::Chunked) {
        EXPECT_NE(ex.head.find("Transfer-Encoding: chunked\r\n"), std::string::npos);
        EXPECT_EQ(ex.head.find("Content-Length"), std::string::npos);
        EXPECT_EQ(DecodeChunked(ex.body), AsString(content));
    } else {
        EXPECT_NE(ex.head.find("Content-Length: " + std::to_string(content.size()) + "\r\n"), std::string::npos);
        EXPECT_EQ(ex.body, AsString(content));
    }

    const auto snap = stats.GetSnapshot(GetParam());
    EXPECT_EQ(snap.requests, 1u);
    EXPECT_EQ(snap.completed, 1u);
    EXPECT_EQ(snap.body_bytes, content.size());
}

TEST_P(DownloadStrategyTest, EmptyFileHasEmptyBody) {
    dir.Write("empty.bin", std::string_view{});

    const auto ex = Download(GetParam(), "empty.bin");
    EXPECT_EQ(ex.head.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);

    if (Select(GetParam()).framing == Framing::Chunked) {
        EXPECT_EQ(ex.body, "0\r\n\r\n");
    } else {
        EXPECT_NE(ex.head.find("Content-Length: 0\r\n"), std::string::npos);
        EXPECT_TRUE(ex.body.empty());
    }
    EXPECT_EQ(stats.GetSnapshot(GetParam()).completed, 1u);
}

TEST_P(DownloadStrategyTest, MissingFileIsNotFound) {
    const auto ex = Download(GetParam(), "nope.bin", true);
    EXPECT_EQ(ex.head.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
    EXPECT_NE(ex.head.find("Content-Length: 0\r\n"), std::string::npos);
    EXPECT_TRUE(ex.body.empty());
    EXPECT_TRUE(ex.reusable);

    const auto snap = stats.GetSnapshot(GetParam());
    EXPECT_EQ(snap.not_found, 1u);
    EXPECT_EQ(snap.completed, 0u);
}

TEST_P(DownloadStrategyTest, TraversalIsNotFound) {
    dir.Write("secret.bin", "secret");
    const auto ex = Download(GetParam(), "../secret.bin");
    EXPECT_EQ(ex.head.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
    EXPECT_TRUE(ex.body.empty());
}

TEST_P(DownloadStrategyTest, KeepAliveIsAdvertised) {
    dir.Write("small.txt", "hello");

    const auto ex = Download(GetParam(), "small.txt", true);
    EXPECT_TRUE(ex.reusable);
    EXPECT_NE(ex.head.find("Connection: keep-alive\r\n"), std::string::npos);
}

TEST_P(DownloadStrategyTest, ThrowingLookupIsInternalServerError) {
    ThrowingStore throwing(dir.Path());
    DownloadService failing(throwing, pool, carriers, stats, DownloadOptions{.chunk_size = 4096, .send_timeout = 5s});

    const auto ex = Download(failing, GetParam(), "any.bin", true);
    EXPECT_EQ(ex.head.rfind("HTTP/1.1 500 Internal Server Error\r\n", 0), 0u);
    EXPECT_NE(ex.head.find("Content-Length: 0\r\n"), std::string::npos);
    EXPECT_TRUE(ex.body.empty());
    EXPECT_TRUE(ex.reusable);

    const auto snap = stats.GetSnapshot(GetParam());
    EXPECT_EQ(snap.requests, 1u);
    EXPECT_EQ(snap.io_errors, 1u);
    EXPECT_EQ(snap.completed, 0u);
}

INSTANTIATE_TEST_SUITE_P(AllStrategies, DownloadStrategyTest, kAllStrategies, StrategyName);

TEST_F(DownloadServiceTest, StoppedBlockingPoolIsInternalServerError) {
    dir.Write("f.bin", "data");
    pool.Stop();

    for (auto strategy : {TransferStrategy::BlockingStream, TransferStrategy::BlockingWholeBuffer}) {
        const auto ex = Download(strategy, "f.bin");
        EXPECT_EQ(ex.head.rfind("HTTP/1.1 500 Internal Server Error\r\n", 0), 0u) << ToString(strategy);
        EXPECT_EQ(stats.GetSnapshot(strategy).io_errors, 1u) << ToString(strategy);
    }
}

TEST_F(DownloadServiceTest, StoppedCarriersAreInternalServerError) {
    dir.Write("f.bin", "data");
    carriers.Stop();

    const auto ex = Download(TransferStrategy::BlockingWholeBufferOnLightweightThread, "f.bin");
    EXPECT_EQ(ex.head.rfind("HTTP/1.1 500 Internal Server Error\r\n", 0), 0u);
    EXPECT_EQ(stats.GetSnapshot(TransferStrategy::BlockingWholeBufferOnLightweightThread).io_errors, 1u);
}

TEST_F(DownloadServiceTest, HundredMegabyteChunkStreamFramesStayWithinChunkSize) {
    constexpr size_t kSize = 100 * 1024 * 1024 + 123;
    constexpr size_t kChunk = 4096;
    dir.Write("big.bin", GenerateTestData(kSize));

    const auto ex = Download(TransferStrategy::AsyncChunkStream, "big.bin");
    ASSERT_EQ(ex.head.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);

    uint64_t frames = 0;
    uint64_t total = 0;
    size_t largest = 0;
    size_t pos = 0;
    while (true) {
        const auto line_end = ex.body.find("\r\n", pos);
        ASSERT_NE(line_end, std::string::npos);
        const size_t len = std::stoul(ex.body.substr(pos, line_end - pos), nullptr, 16);
        if (len == 0) {
            break;
        }
        ++frames;
        total += len;
        largest = std::max(largest, len);
        pos = line_end + 2 + len + 2;
        ASSERT_LE(pos, ex.body.size());
    }

    EXPECT_EQ(frames, (kSize + kChunk - 1) / kChunk);
    EXPECT_EQ(total, kSize);
    EXPECT_LE(largest, kChunk);
    EXPECT_EQ(stats.GetSnapshot(TransferStrategy::AsyncChunkStream).body_bytes, kSize);
}

TEST_F(DownloadServiceTest, ChunkedFramesFollowChunkSize) {
    dir.Write("f.bin", GenerateTestData(4096 * 2 + 100));

    const auto ex = Download(TransferStrategy::AsyncChunkStream, "f.bin");
    EXPECT_EQ(ex.body.rfind("1000\r\n", 0), 0u);
    EXPECT_NE(ex.body.find("\r\n64\r\n"), std::string::npos);
    EXPECT_TRUE(ex.body.ends_with("\r\n0\r\n\r\n"));
}

TEST_F(DownloadServiceTest, LightweightStrategyPinsOnlyTheLookup) {
    dir.Write("f.bin", GenerateTestData(10000));

    const auto ex = Download(TransferStrategy::BlockingWholeBufferOnLightweightThread, "f.bin");
    EXPECT_EQ(ex.body.size(), 10000u);
    EXPECT_EQ(carriers.PinnedCalls(), 1u);
    EXPECT_EQ(carriers.FibersStarted(), 1u);
}

TEST_F(DownloadServiceTest, ClosedPeerTruncatesAfterHead) {
    dir.Write("f.bin", GenerateTestData(1 << 20));

    auto pair = MakeSocketPair();
    ASSERT_TRUE(pair.Valid());
    pair.client.Close();

    auto t = service.Serve(ctx, pair.server.Get(), Select(TransferStrategy::AsyncWholeFile), "f.bin", true);
    EXPECT_FALSE(RunTask(ctx, t));

    const auto snap = stats.GetSnapshot(TransferStrategy::AsyncWholeFile);
    EXPECT_EQ(snap.truncated, 1u);
    EXPECT_EQ(snap.completed, 0u);
}

class StreamingDisconnectTest : public DownloadServiceTest,
                                 public ::testing::WithParamInterface<TransferStrategy> {};

TEST_P(StreamingDisconnectTest, PeerClosingAfterHeadStopsTheStream) {
    constexpr size_t kSize = 16 * 1024 * 1024;
    dir.Write("big.bin", GenerateTestData(kSize));

    auto pair = MakeSocketPair();
    ASSERT_TRUE(pair.Valid());

    // Read up to the end of the head, then hang up.
    std::string seen;
    std::thread reader([&] {
        char buf[4096];
        while (seen.find("\r\n\r\n") == std::string::npos) {
            const auto n = ::recv(pair.client.Get(), buf, sizeof(buf), 0);
            if (n <= 0) {
                break;
            }
            seen.append(buf, static_cast<size_t>(n));
        }
        pair.client.Close();
    });

    auto t = service.Serve(ctx, pair.server.Get(), Select(GetParam()), "big.bin", true);
    const bool reusable = RunTask(ctx, t);
    reader.join();

    EXPECT_FALSE(reusable);
    EXPECT_EQ(seen.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);

    const auto snap = stats.GetSnapshot(GetParam());
    EXPECT_EQ(snap.truncated, 1u);
    EXPECT_EQ(snap.completed, 0u);
    // Only what the socket buffers absorbed went out before the writes failed.
    EXPECT_LT(snap.body_bytes, kSize / 4);
}

INSTANTIATE_TEST_SUITE_P(StreamingStrategies, StreamingDisconnectTest,
                         ::testing::Values(TransferStrategy::AsyncChunkStream, TransferStrategy::BlockingStream),
                         StrategyName);

TEST_F(DownloadServiceTest, RunReportsOutcomeWithoutErrorResponse) {
    auto pair = MakeSocketPair();
    ASSERT_TRUE(pair.Valid());

    auto t = service.Run(ctx, pair.server.Get(), Select(TransferStrategy::BlockingWholeBuffer), "missing", false);
    const auto outcome = RunTask(ctx, t);
    EXPECT_FALSE(outcome.Ok());
    EXPECT_FALSE(outcome.head_sent);
    EXPECT_TRUE(IsNotFound(outcome.error));

    // Nothing was written on the socket.
    pair.server.Close();
    EXPECT_TRUE(ReadUntilEof(pair.client.Get()).empty());
}

TEST_F(DownloadServiceTest, StatsFormatListsActiveStrategies) {
    dir.Write("a.txt", "abc");
    (void)Download(TransferStrategy::BlockingStream, "a.txt");
    (void)Download(TransferStrategy::BlockingStream, "missing");
    stats.RecordUnrouted();

    const auto text = stats.Format();
    EXPECT_NE(text.find("stream: req=2 ok=1 bytes=3 404=1"), std::string::npos);
    EXPECT_EQ(text.find("asyncFile"), std::string::npos);
    EXPECT_NE(text.find("(unrouted=1)"), std::string::npos);
}
