#include "hellonet/http-header.hpp"

#include <gtest/gtest.h>

namespace hellonet::http {

TEST(HttpHeader, ValidTokens) {
  EXPECT_TRUE(IsValidToken("GET"));
  EXPECT_TRUE(IsValidHeaderName("Content-Type"));
  EXPECT_TRUE(IsValidHeaderName("X-Custom_Header.v2"));
  EXPECT_TRUE(IsValidHeaderName("!#$%&'*+-.^_`|~"));
}

TEST(HttpHeader, InvalidTokens) {
  EXPECT_FALSE(IsValidToken(""));
  EXPECT_FALSE(IsValidToken("GE T"));
  EXPECT_FALSE(IsValidHeaderName("Content Type"));
  EXPECT_FALSE(IsValidHeaderName("Bad:Name"));
  EXPECT_FALSE(IsValidHeaderName("(comment)"));
  EXPECT_FALSE(IsValidHeaderName("caf\xc3\xa9"));
}

TEST(HttpHeader, HeaderValues) {
  EXPECT_TRUE(IsValidHeaderValue(""));
  EXPECT_TRUE(IsValidHeaderValue("text/plain; charset=utf-8"));
  EXPECT_TRUE(IsValidHeaderValue("a\tb"));
  EXPECT_FALSE(IsValidHeaderValue("a\r\nInjected: yes"));
  EXPECT_FALSE(IsValidHeaderValue("a\nb"));
}

TEST(HttpHeader, Equality) {
  EXPECT_EQ((Header{"Allow", "GET"}), (Header{"Allow", "GET"}));
  EXPECT_NE((Header{"Allow", "GET"}), (Header{"Allow", "POST"}));
}

}  // namespace hellonet::http
