// tests/xfer/http_tests.cpp
// Request head parsing and download routing

#include <gtest/gtest.h>

#include "xfer/http.hpp"

using namespace xfer;
using namespace xfer::http;

TEST(HttpTest, FindHeadEnd) {
    EXPECT_FALSE(FindHeadEnd("GET / HTTP/1.1\r\nHost: x\r\n").has_value());
    EXPECT_EQ(FindHeadEnd("GET / HTTP/1.1\r\n\r\n"), 18u);
    EXPECT_EQ(FindHeadEnd("GET / HTTP/1.1\r\n\r\nGET /next"), 18u);
}

TEST(HttpTest, ParsesRequestLine) {
    auto req = ParseRequestHead("GET /download/stream/a.bin HTTP/1.1\r\nHost: localhost\r\n\r\n");
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->method, "GET");
    EXPECT_EQ(req->target, "/download/stream/a.bin");
    EXPECT_TRUE(req->keep_alive);
}

TEST(HttpTest, ConnectionHeaderControlsKeepAlive) {
    auto close = ParseRequestHead("GET / HTTP/1.1\r\nconnection: Close\r\n\r\n");
    ASSERT_TRUE(close.has_value());
    EXPECT_FALSE(close->keep_alive);

    auto http10 = ParseRequestHead("GET / HTTP/1.0\r\n\r\n");
    ASSERT_TRUE(http10.has_value());
    EXPECT_FALSE(http10->keep_alive);

    auto http10_ka = ParseRequestHead("GET / HTTP/1.0\r\nConnection: keep-alive\r\n\r\n");
    ASSERT_TRUE(http10_ka.has_value());
    EXPECT_TRUE(http10_ka->keep_alive);

    auto list = ParseRequestHead("GET / HTTP/1.1\r\nConnection: TE, close\r\n\r\n");
    ASSERT_TRUE(list.has_value());
    EXPECT_FALSE(list->keep_alive);
}

TEST(HttpTest, RejectsMalformedHeads) {
    for (auto head : {"\r\n\r\n", "GET\r\n\r\n", "GET /\r\n\r\n", "GET / SPDY/3\r\n\r\n", " / HTTP/1.1\r\n\r\n",
                      "GET  HTTP/1.1\r\n\r\n", "GET / HTTP/1.1\r\nno colon here\r\n\r\n"}) {
        auto req = ParseRequestHead(head);
        EXPECT_FALSE(req.has_value()) << head;
    }
}

TEST(HttpTest, MatchesDownloadRoute) {
    auto r = MatchDownloadRoute("/download/asyncFile/1MB.bin");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->endpoint, "asyncFile");
    EXPECT_EQ(r->name, "1MB.bin");
}

TEST(HttpTest, RouteIgnoresQueryAndDecodesName) {
    auto r = MatchDownloadRoute("/download/stream/my%20file.bin?x=1");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->endpoint, "stream");
    EXPECT_EQ(r->name, "my file.bin");
}

TEST(HttpTest, RouteKeepsExtraSegmentsInName) {
    // The file store rejects it later; routing does not decide validity.
    auto r = MatchDownloadRoute("/download/stream/a/b");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->name, "a/b");
}

TEST(HttpTest, NonDownloadTargetsDoNotMatch) {
    for (auto target : {"/", "/download", "/download/", "/download/asyncFile", "/download/asyncFile/",
                        "/download//a.bin", "/upload/asyncFile/a.bin", "/download/stream/%zz"}) {
        EXPECT_FALSE(MatchDownloadRoute(target).has_value()) << target;
    }
}

TEST(HttpTest, PercentDecode) {
    EXPECT_EQ(PercentDecode("abc"), "abc");
    EXPECT_EQ(PercentDecode("a%2Fb"), "a/b");
    EXPECT_EQ(PercentDecode("%41%42"), "AB");
    EXPECT_FALSE(PercentDecode("%4").has_value());
    EXPECT_FALSE(PercentDecode("%").has_value());
    EXPECT_FALSE(PercentDecode("%g1").has_value());
}
