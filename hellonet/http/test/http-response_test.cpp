#include "hellonet/http-response.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "hellonet/http-status-code.hpp"
#include "hellonet/recording-response-sink.hpp"

namespace hellonet {

TEST(HttpResponse, DefaultIs200WithoutHeaders) {
  HttpResponse resp;
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_TRUE(resp.reason().empty());
  EXPECT_TRUE(resp.headers().empty());
  EXPECT_TRUE(resp.body().empty());
  EXPECT_FALSE(resp.sealed());
}

TEST(HttpResponse, SerializeStatusLineHeadersAndBody) {
  HttpResponse resp(http::StatusCodeNotFound, "Not Found");
  resp.header("Content-Type", "text/plain").header("X-Trace", "abc").body("nope");
  EXPECT_EQ(resp.serialize(), "HTTP/1.1 404 Not Found\r\nContent-Type: text/plain\r\nX-Trace: abc\r\n\r\nnope");
}

TEST(HttpResponse, HeaderReplacesCaseInsensitively) {
  HttpResponse resp;
  resp.header("Content-Type", "text/plain").header("X-A", "1").header("content-type", "application/json");
  ASSERT_EQ(resp.headers().size(), 2U);
  EXPECT_EQ(resp.headers()[0].name, "content-type");
  EXPECT_EQ(resp.headers()[0].value, "application/json");
  EXPECT_EQ(resp.headerValue("CONTENT-TYPE"), "application/json");
  EXPECT_FALSE(resp.headerValue("Allow").has_value());
}

TEST(HttpResponse, InvalidStatusOrHeaderThrows) {
  EXPECT_THROW(HttpResponse(42), std::invalid_argument);
  HttpResponse resp;
  EXPECT_THROW(resp.status(1000), std::invalid_argument);
  EXPECT_THROW(resp.header("Bad Name", "v"), std::invalid_argument);
  EXPECT_THROW(resp.header("X-Injected", "a\r\nSet-Cookie: x"), std::invalid_argument);
}

TEST(HttpResponse, MutationAfterSealThrows) {
  HttpResponse resp;
  resp.seal();
  EXPECT_TRUE(resp.sealed());
  EXPECT_THROW(resp.status(http::StatusCodeNotFound), std::logic_error);
  EXPECT_THROW(resp.reason("x"), std::logic_error);
  EXPECT_THROW(resp.header("X-A", "1"), std::logic_error);
  EXPECT_THROW(resp.body("late"), std::logic_error);
  EXPECT_THROW(resp.seal(), std::logic_error);
}

TEST(ResponseSink, FinalizeCommitsExactlyOnce) {
  test::RecordingResponseSink sink;
  sink.response().reason("OK").body("hi");
  EXPECT_FALSE(sink.finalized());
  sink.finalize();
  EXPECT_TRUE(sink.finalized());
  EXPECT_EQ(sink.commitCount(), 1);
  EXPECT_EQ(sink.wire(), "HTTP/1.1 200 OK\r\n\r\nhi");

  EXPECT_THROW(sink.finalize(), std::logic_error);
  EXPECT_EQ(sink.commitCount(), 1);
}

}  // namespace hellonet
