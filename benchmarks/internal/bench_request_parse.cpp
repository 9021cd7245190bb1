#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "hellonet/request-context.hpp"
#include "hellonet/request-parser.hpp"

namespace {

constexpr std::size_t kMaxHeaderBytes = 8192;
constexpr std::size_t kMaxBodyBytes = 1 << 20;

constexpr std::string_view kSmallRequest = "GET /hello HTTP/1.1\r\nHost: localhost\r\n\r\n";

constexpr std::string_view kBrowserLikeRequest =
    "GET /hello?name=world HTTP/1.1\r\n"
    "Host: localhost:3000\r\n"
    "User-Agent: Mozilla/5.0 (X11; Linux x86_64; rv:128.0) Gecko/20100101 Firefox/128.0\r\n"
    "Accept: text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8\r\n"
    "Accept-Language: en-US,en;q=0.5\r\n"
    "Accept-Encoding: gzip, deflate, br\r\n"
    "Connection: keep-alive\r\n"
    "Upgrade-Insecure-Requests: 1\r\n"
    "Sec-Fetch-Dest: document\r\n"
    "Sec-Fetch-Mode: navigate\r\n"
    "\r\n";

void ParseHead(benchmark::State& st, std::string_view raw) {
  for ([[maybe_unused]] auto _ : st) {
    auto result = hellonet::ParseRequestHead(raw, kMaxHeaderBytes, kMaxBodyBytes);
    benchmark::DoNotOptimize(result.head.headLength);
  }
  st.SetBytesProcessed(static_cast<int64_t>(st.iterations()) * static_cast<int64_t>(raw.size()));
}

void BM_ParseSmallRequest(benchmark::State& st) { ParseHead(st, kSmallRequest); }

void BM_ParseBrowserLikeRequest(benchmark::State& st) { ParseHead(st, kBrowserLikeRequest); }

// Head split in two reads: first attempt needs more data.
void BM_ParseIncompleteThenComplete(benchmark::State& st) {
  const std::string_view partial = kBrowserLikeRequest.substr(0, kBrowserLikeRequest.size() / 2);
  for ([[maybe_unused]] auto _ : st) {
    auto first = hellonet::ParseRequestHead(partial, kMaxHeaderBytes, kMaxBodyBytes);
    benchmark::DoNotOptimize(first.status);
    auto second = hellonet::ParseRequestHead(kBrowserLikeRequest, kMaxHeaderBytes, kMaxBodyBytes);
    benchmark::DoNotOptimize(second.head.headLength);
  }
}

void BM_ParseAndBuildContext(benchmark::State& st) {
  for ([[maybe_unused]] auto _ : st) {
    auto result = hellonet::ParseRequestHead(kBrowserLikeRequest, kMaxHeaderBytes, kMaxBodyBytes);
    hellonet::RequestHead& head = result.head;
    hellonet::RequestContext ctx(head.method, head.target, head.version, std::move(head.headers));
    benchmark::DoNotOptimize(ctx.keepAlive());
  }
}

}  // namespace

BENCHMARK(BM_ParseSmallRequest);
BENCHMARK(BM_ParseBrowserLikeRequest);
BENCHMARK(BM_ParseIncompleteThenComplete);
BENCHMARK(BM_ParseAndBuildContext);
