#include <gtest/gtest.h>

#include <string>

#include "hellonet/handlers.hpp"
#include "hellonet/http-status-code.hpp"
#include "hellonet/server-config.hpp"
#include "hellonet/server-lifecycle.hpp"
#include "hellonet/test_server_fixture.hpp"
#include "hellonet/test_util.hpp"

using namespace std::chrono_literals;
using namespace hellonet;

namespace {

void ExpectBadRequestAndClose(uint16_t port, std::string_view raw) {
  test::ClientConnection cnx(port);
  ASSERT_TRUE(test::sendAll(cnx.fd(), raw));
  const auto parsed = test::parseResponse(test::recvWithTimeout(cnx.fd()));
  ASSERT_TRUE(parsed.has_value()) << raw;
  EXPECT_EQ(parsed->statusCode, http::StatusCodeBadRequest) << raw;
  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1000ms)) << raw;
}

}  // namespace

TEST(HttpErrors, MalformedRequestLine) {
  test::TestServer ts;
  ExpectBadRequestAndClose(ts.port(), "GARBAGE\r\n\r\n");
  ExpectBadRequestAndClose(ts.port(), "GET /hello\r\n\r\n");
  ExpectBadRequestAndClose(ts.port(), "GET /hello HTTP/2.0\r\n\r\n");
}

TEST(HttpErrors, MalformedHeaders) {
  test::TestServer ts;
  ExpectBadRequestAndClose(ts.port(), "GET /hello HTTP/1.1\r\nNoColonHere\r\n\r\n");
  ExpectBadRequestAndClose(ts.port(), "GET /hello HTTP/1.1\r\nContent-Length: abc\r\n\r\n");
  ExpectBadRequestAndClose(ts.port(), "GET /hello HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n");
}

TEST(HttpErrors, OversizedHeadIsRejected) {
  ServerConfig config = test::MakeTestConfig();
  config.withMaxHeaderBytes(256);
  test::TestServer ts(config);
  std::string raw = "GET /hello HTTP/1.1\r\nX-Big: ";
  raw.append(512, 'a');
  raw.append("\r\n\r\n");
  ExpectBadRequestAndClose(ts.port(), raw);
}

TEST(HttpErrors, MalformedRequestDoesNotAffectOtherConnections) {
  test::TestServer ts;
  test::ClientConnection healthy(ts.port());
  ASSERT_TRUE(test::sendAll(healthy.fd(), "GET /hello HTTP/1.1\r\nHost: x\r\n\r\n"));
  const auto first = test::parseResponse(test::recvWithTimeout(healthy.fd()));
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->statusCode, http::StatusCodeOK);

  ExpectBadRequestAndClose(ts.port(), "NOT HTTP AT ALL\r\n\r\n");

  ASSERT_TRUE(test::sendAll(healthy.fd(), "GET /hello HTTP/1.1\r\nHost: x\r\n\r\n"));
  const auto second = test::parseResponse(test::recvWithTimeout(healthy.fd()));
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->statusCode, http::StatusCodeOK);
  EXPECT_EQ(second->body, kHelloBody);
  EXPECT_EQ(ts.lifecycle.state(), ServerState::Listening);
}

TEST(HttpErrors, ClientDisconnectMidRequestIsHarmless) {
  test::TestServer ts;
  {
    test::ClientConnection cnx(ts.port());
    ASSERT_TRUE(test::sendAll(cnx.fd(), "GET /hel"));
  }
  const auto parsed = test::parseResponse(test::simpleGet(ts.port(), "/hello"));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->statusCode, http::StatusCodeOK);
  EXPECT_EQ(ts.lifecycle.state(), ServerState::Listening);
}
