#include "hellonet/router.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "hellonet/http-method.hpp"
#include "hellonet/http-response.hpp"
#include "hellonet/http-status-code.hpp"
#include "hellonet/recording-response-sink.hpp"
#include "hellonet/request-context.hpp"
#include "hellonet/response-writer.hpp"
#include "hellonet/route-table.hpp"

namespace hellonet {

namespace {

void ThrowingHandler(const RequestContext&, ResponseSink&) { throw std::runtime_error("secret failure detail"); }

void ThrowingNonStdHandler(const RequestContext&, ResponseSink&) { throw 42; }

void ThrowAfterHeaderHandler(const RequestContext&, ResponseSink& sink) {
  sink.response().header("X-Debug-Path", "/srv/app/internal/db.cpp:42").body("half built");
  throw std::runtime_error("db failure");
}

void SilentHandler(const RequestContext&, ResponseSink&) {}

void ThrowAfterSendHandler(const RequestContext&, ResponseSink& sink) {
  SendResponse(sink, http::StatusCodeOK, "partial");
  throw std::runtime_error("late failure");
}

class RouterTest : public ::testing::Test {
 protected:
  RouteTable table{DefaultRouteTable()};
  Router router{table};
};

}  // namespace

TEST_F(RouterTest, GetHelloReturnsHelloWorld) {
  test::RecordingResponseSink sink;
  router.route(RequestContext("GET", "/hello"), sink);
  EXPECT_EQ(sink.response().status(), http::StatusCodeOK);
  EXPECT_EQ(sink.response().body(), "Hello world");
  EXPECT_EQ(sink.commitCount(), 1);
}

TEST_F(RouterTest, MethodAndPathAreNormalized) {
  for (const char* target : {"/hello/", "/hello?x=1", "/hello/?x=1#f", "http://localhost:3000/hello"}) {
    test::RecordingResponseSink sink;
    router.route(RequestContext("get", target), sink);
    EXPECT_EQ(sink.response().status(), http::StatusCodeOK) << target;
  }
}

TEST_F(RouterTest, UnknownPathIsNotFound) {
  for (const char* target : {"/", "/unknown", "/HELLO", "/hello/world", "/api/hello"}) {
    test::RecordingResponseSink sink;
    router.route(RequestContext("GET", target), sink);
    EXPECT_EQ(sink.response().status(), http::StatusCodeNotFound) << target;
    EXPECT_EQ(sink.response().body(), "Not Found");
  }
}

TEST_F(RouterTest, UnknownPathWinsOverUnknownMethod) {
  test::RecordingResponseSink sink;
  router.route(RequestContext("POST", "/unknown"), sink);
  EXPECT_EQ(sink.response().status(), http::StatusCodeNotFound);
}

TEST_F(RouterTest, OtherMethodsOnHelloAreNotAllowed) {
  for (const char* method : {"POST", "PUT", "DELETE", "PATCH", "HEAD", "OPTIONS", "BREW"}) {
    test::RecordingResponseSink sink;
    router.route(RequestContext(method, "/hello"), sink);
    EXPECT_EQ(sink.response().status(), http::StatusCodeMethodNotAllowed) << method;
    EXPECT_EQ(sink.response().headerValue("Allow"), "GET") << method;
    EXPECT_EQ(sink.response().body(), "Method Not Allowed");
  }
}

TEST(Router, ThrowingHandlerBecomesInternalServerError) {
  const RouteTable table{{"/boom", http::Method::GET, ThrowingHandler}};
  const Router router(table);
  test::RecordingResponseSink sink;
  router.route(RequestContext("GET", "/boom"), sink);
  EXPECT_EQ(sink.response().status(), http::StatusCodeInternalServerError);
  EXPECT_EQ(sink.response().body(), "Internal Server Error");
  EXPECT_EQ(sink.wire().find("secret"), std::string::npos);
}

TEST(Router, InternalServerErrorDiscardsPartialResponse) {
  const RouteTable table{{"/boom", http::Method::GET, ThrowAfterHeaderHandler}};
  const Router router(table);
  test::RecordingResponseSink sink;
  router.route(RequestContext("GET", "/boom"), sink);
  EXPECT_EQ(sink.response().status(), http::StatusCodeInternalServerError);
  EXPECT_FALSE(sink.response().headerValue("X-Debug-Path").has_value());
  EXPECT_EQ(sink.wire().find("/srv/app/internal"), std::string::npos);
  EXPECT_EQ(sink.wire().find("half built"), std::string::npos);
  EXPECT_EQ(sink.commitCount(), 1);
}

TEST(Router, NonStandardExceptionBecomesInternalServerError) {
  const RouteTable table{{"/boom", http::Method::GET, ThrowingNonStdHandler}};
  const Router router(table);
  test::RecordingResponseSink sink;
  router.route(RequestContext("GET", "/boom"), sink);
  EXPECT_EQ(sink.response().status(), http::StatusCodeInternalServerError);
}

TEST(Router, HandlerWithoutResponseBecomesInternalServerError) {
  const RouteTable table{{"/silent", http::Method::GET, SilentHandler}};
  const Router router(table);
  test::RecordingResponseSink sink;
  router.route(RequestContext("GET", "/silent"), sink);
  EXPECT_EQ(sink.response().status(), http::StatusCodeInternalServerError);
  EXPECT_EQ(sink.commitCount(), 1);
}

TEST(Router, FailureAfterResponseKeepsFirstResponse) {
  const RouteTable table{{"/late", http::Method::GET, ThrowAfterSendHandler}};
  const Router router(table);
  test::RecordingResponseSink sink;
  router.route(RequestContext("GET", "/late"), sink);
  EXPECT_EQ(sink.commitCount(), 1);
  EXPECT_EQ(sink.response().status(), http::StatusCodeOK);
  EXPECT_EQ(sink.response().body(), "partial");
}

TEST(Router, EmptyTableAnswersNotFound) {
  const RouteTable table;
  const Router router(table);
  test::RecordingResponseSink sink;
  router.route(RequestContext("GET", "/hello"), sink);
  EXPECT_EQ(sink.response().status(), http::StatusCodeNotFound);
}

}  // namespace hellonet
