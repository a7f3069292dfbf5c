#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>

#include "tinyweb/http-constants.hpp"
#include "tinyweb/http-method.hpp"
#include "tinyweb/http-request.hpp"
#include "tinyweb/http-response.hpp"
#include "tinyweb/http-server-config.hpp"
#include "tinyweb/http-server.hpp"
#include "tinyweb/http-status-code.hpp"
#include "tinyweb/route-config.hpp"
#include "tinyweb/task.hpp"
#include "tinyweb/test_server_fixture.hpp"
#include "tinyweb/test_util.hpp"

using namespace std::chrono_literals;

namespace tinyweb {

namespace {

std::atomic<int> gUploadCalls{0};

Task<void> Upload(const HttpRequest& req, HttpResponse& resp) {
  ++gUploadCalls;
  co_await resp.start(http::ContentTypeTextPlain);
  co_await resp.send(std::to_string(req.body().size()));
}

test::TestServer ts(HttpServerConfig{}.withMaxLineLength(128).withRequestTimeout(300ms), [](HttpServer& server) {
  server.addRoute("/upload", Upload, RouteConfig{}.withMethod(http::Method::POST).withMaxBodySize(16));
});

}  // namespace

TEST(HttpLimits, BodyWithinLimitIsRead) {
  test::RequestOptions opt;
  opt.method = "POST";
  opt.target = "/upload";
  opt.body = std::string(16, 'a');
  const auto resp = test::parseResponseOrThrow(test::request(ts.port(), opt));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body, "16");
}

TEST(HttpLimits, OversizedBodyIsRejectedBeforeHandlerInvocation) {
  const int before = gUploadCalls.load();
  // only the headers are sent: the declared length is enough to reject
  const auto raw = test::sendAndCollect(ts.port(), "POST /upload HTTP/1.0\r\nContent-Length: 100000\r\n\r\n");
  const auto resp = test::parseResponseOrThrow(raw);
  EXPECT_EQ(resp.statusCode, http::StatusCodePayloadTooLarge);
  EXPECT_EQ(resp.body, "HTTP 413 Payload Too Large\r\n");
  EXPECT_EQ(gUploadCalls.load(), before);
}

TEST(HttpLimits, InvalidContentLengthIsBadRequest) {
  const auto raw = test::sendAndCollect(ts.port(), "POST /upload HTTP/1.0\r\nContent-Length: 12abc\r\n\r\n");
  EXPECT_EQ(test::parseResponseOrThrow(raw).statusCode, http::StatusCodeBadRequest);
}

TEST(HttpLimits, HeaderLineLongerThanBufferIsRejected) {
  std::string req = "POST /upload HTTP/1.0\r\nX-Big: ";
  req.append(200, 'x').append("\r\n\r\n");
  const auto resp = test::parseResponseOrThrow(test::sendAndCollect(ts.port(), req));
  EXPECT_EQ(resp.statusCode, http::StatusCodeRequestHeaderFieldsTooLarge);
}

TEST(HttpLimits, RequestLineLongerThanBufferIsBadRequest) {
  std::string req = "GET /";
  req.append(200, 'p').append(" HTTP/1.0\r\n\r\n");
  const auto resp = test::parseResponseOrThrow(test::sendAndCollect(ts.port(), req));
  EXPECT_EQ(resp.statusCode, http::StatusCodeBadRequest);
}

TEST(HttpLimits, HeaderWithoutColonIsBadRequest) {
  const auto raw = test::sendAndCollect(ts.port(), "POST /upload HTTP/1.0\r\nbroken header\r\n\r\n");
  EXPECT_EQ(test::parseResponseOrThrow(raw).statusCode, http::StatusCodeBadRequest);
}

TEST(HttpLimits, IncompleteRequestTimesOutWithoutResponse) {
  const auto timeoutsBefore = ts.server.stats().timeouts;
  test::ClientConnection cnx(ts.port());
  ASSERT_NE(cnx.fd(), -1);
  test::sendAll(cnx.fd(), "POST /upload HTTP/1.0\r\nContent-Len");

  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 3s));
  EXPECT_TRUE(test::WaitFor([] { return ts.server.activeCount() == 0; }));
  EXPECT_EQ(ts.server.stats().timeouts, timeoutsBefore + 1);
}

TEST(HttpLimits, TruncatedBodyTimesOut) {
  const int before = gUploadCalls.load();
  test::ClientConnection cnx(ts.port());
  ASSERT_NE(cnx.fd(), -1);
  test::sendAll(cnx.fd(), "POST /upload HTTP/1.0\r\nContent-Length: 10\r\n\r\nabc");

  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 3s));
  EXPECT_EQ(gUploadCalls.load(), before);
}

TEST(HttpLimits, ClientClosingEarlyIsNotAnswered) {
  const auto servedBefore = ts.server.stats().requestsServed;
  {
    test::ClientConnection cnx(ts.port());
    ASSERT_NE(cnx.fd(), -1);
    test::sendAll(cnx.fd(), "GET /upl");
  }
  EXPECT_TRUE(test::WaitFor([] { return ts.server.activeCount() == 0; }));
  EXPECT_EQ(ts.server.stats().requestsServed, servedBefore);
}

}  // namespace tinyweb
