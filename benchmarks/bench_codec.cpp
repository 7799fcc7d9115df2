#include <benchmark/benchmark.h>
#include "rpcwire/codec.hpp"
#include "rpcwire/http_message.hpp"
#include "rpcwire/json_rpc.hpp"
#include <optional>
#include <string>

using namespace rpcwire;

static const ServiceAddress kAddress{"127.0.0.1:8082", "math-api"};

static const std::string kSmallReply =
    "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 51\r\n\r\n"
    R"({"jsonrpc":"2.0","result":8.75,"error":null,"id":1})";

// Reply carrying an array result with N records
static std::string make_large_reply(int n) {
    Json rows = Json::array();
    for (int i = 0; i < n; ++i) {
        rows.push_back({
            {"index", i},
            {"name", "row_" + std::to_string(i)},
            {"values", {1.5 * i, 2.5 * i, 3.5 * i}},
        });
    }
    Json body = {{"jsonrpc", "2.0"}, {"result", rows}, {"error", nullptr}, {"id", 1}};
    std::string text = body.dump();
    return "HTTP/1.1 200 OK\r\nContent-Length: " + std::to_string(text.size()) + "\r\n\r\n" + text;
}

static const std::string kLargeReply = make_large_reply(500);

// ---- Request side ----

static void BM_SerializeRequest(benchmark::State& state) {
    auto req = make_request("mul", Json::array({2.5, 3.5}), RequestId{int64_t{1}});
    for (auto _ : state) {
        auto s = Codec::serialize(req);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeRequest)->MinTime(1.0);

static void BM_FrameRequest(benchmark::State& state) {
    auto body = Codec::serialize(make_request("mul", Json::array({2.5, 3.5}), RequestId{int64_t{1}}));
    std::optional<ApiKey> key = ApiKey("X-API-KEY", "abcdef12345");
    for (auto _ : state) {
        auto framed = http::frame_post(kAddress, "rpcwire-bench", key, body);
        benchmark::DoNotOptimize(framed);
    }
}
BENCHMARK(BM_FrameRequest)->MinTime(1.0);

// ---- Reply side ----

static void BM_DecodeSmallReply(benchmark::State& state) {
    for (auto _ : state) {
        auto reply = http::split_reply(http::decode_utf8_lossy(kSmallReply));
        auto j = Codec::parse_body(reply->body);
        benchmark::DoNotOptimize(j);
    }
    state.SetBytesProcessed(state.iterations() * kSmallReply.size());
}
BENCHMARK(BM_DecodeSmallReply)->MinTime(1.0);

static void BM_DecodeLargeReply(benchmark::State& state) {
    for (auto _ : state) {
        auto reply = http::split_reply(http::decode_utf8_lossy(kLargeReply));
        auto j = Codec::parse_body(reply->body);
        benchmark::DoNotOptimize(j);
    }
    state.SetBytesProcessed(state.iterations() * kLargeReply.size());
}
BENCHMARK(BM_DecodeLargeReply)->MinTime(1.0);

static void BM_Utf8LossyLargeReply(benchmark::State& state) {
    for (auto _ : state) {
        auto text = http::decode_utf8_lossy(kLargeReply);
        benchmark::DoNotOptimize(text);
    }
    state.SetBytesProcessed(state.iterations() * kLargeReply.size());
}
BENCHMARK(BM_Utf8LossyLargeReply)->MinTime(1.0);
