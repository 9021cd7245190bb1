#include <gtest/gtest.h>

#include <string>

#include "hellonet/handlers.hpp"
#include "hellonet/http-constants.hpp"
#include "hellonet/http-status-code.hpp"
#include "hellonet/test_server_fixture.hpp"
#include "hellonet/test_util.hpp"

using namespace std::chrono_literals;
using namespace hellonet;

TEST(HelloRoutes, GetHello) {
  test::TestServer ts;
  const auto parsed = test::parseResponse(test::simpleGet(ts.port(), "/hello"));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->statusCode, http::StatusCodeOK);
  EXPECT_EQ(parsed->reason, "OK");
  EXPECT_EQ(parsed->body, kHelloBody);
  EXPECT_EQ(parsed->headers.at("Content-Type"), http::ContentTypeTextPlainUtf8);
  EXPECT_EQ(parsed->headers.at("Content-Length"), std::to_string(kHelloBody.size()));
}

TEST(HelloRoutes, QueryStringAndTrailingSlashAreIgnored) {
  test::TestServer ts;
  for (const char* target : {"/hello?name=world", "/hello/", "/hello#top"}) {
    const auto parsed = test::parseResponse(test::simpleGet(ts.port(), target));
    ASSERT_TRUE(parsed.has_value()) << target;
    EXPECT_EQ(parsed->statusCode, http::StatusCodeOK) << target;
    EXPECT_EQ(parsed->body, kHelloBody) << target;
  }
}

TEST(HelloRoutes, UnknownPathIsNotFound) {
  test::TestServer ts;
  for (const char* target : {"/", "/missing", "/hello/world", "/HELLO"}) {
    const auto parsed = test::parseResponse(test::simpleGet(ts.port(), target));
    ASSERT_TRUE(parsed.has_value()) << target;
    EXPECT_EQ(parsed->statusCode, http::StatusCodeNotFound) << target;
    EXPECT_EQ(parsed->body, kNotFoundBody) << target;
  }
}

TEST(HelloRoutes, UnknownPathIsNotFoundWhateverTheMethod) {
  test::TestServer ts;
  const auto parsed = test::parseResponse(test::simpleGet(ts.port(), "/missing", "POST"));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->statusCode, http::StatusCodeNotFound);
}

TEST(HelloRoutes, OtherMethodsOnHelloAreNotAllowed) {
  test::TestServer ts;
  for (const char* method : {"POST", "PUT", "DELETE", "PATCH", "OPTIONS"}) {
    const auto parsed = test::parseResponse(test::simpleGet(ts.port(), "/hello", method));
    ASSERT_TRUE(parsed.has_value()) << method;
    EXPECT_EQ(parsed->statusCode, http::StatusCodeMethodNotAllowed) << method;
    EXPECT_EQ(parsed->headers.at("Allow"), "GET") << method;
    EXPECT_EQ(parsed->body, kMethodNotAllowedBody) << method;
  }
}

TEST(HelloRoutes, UnknownMethodOnHelloIsNotAllowed) {
  test::TestServer ts;
  const auto parsed = test::parseResponse(test::simpleGet(ts.port(), "/hello", "BREW"));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->statusCode, http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(parsed->headers.at("Allow"), "GET");
}

TEST(HelloRoutes, RequestBodyIsIgnored) {
  test::TestServer ts;
  const std::string raw =
      "GET /hello HTTP/1.1\r\nHost: 127.0.0.1\r\nContent-Length: 5\r\nConnection: close\r\n\r\nhello";
  const auto parsed = test::parseResponse(test::sendAndCollect(ts.port(), raw));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->statusCode, http::StatusCodeOK);
  EXPECT_EQ(parsed->body, kHelloBody);
}
