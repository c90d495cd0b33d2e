#include <benchmark/benchmark.h>
#include "mcprt/codec.hpp"
#include "mcprt/json_rpc.hpp"
#include <string>

using namespace mcprt;

static const std::string kPing = R"({"jsonrpc":"2.0","id":1,"method":"ping"})";

static const std::string kToolCall =
    R"({"jsonrpc":"2.0","id":"req-42","method":"tools/call","params":{"name":"add","arguments":{"a":1,"b":2},"_meta":{"progressToken":7}}})";

static std::string make_batch(int n) {
    nlohmann::json batch = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        batch.push_back({{"jsonrpc", "2.0"}, {"id", i}, {"method", "ping"}});
    }
    return batch.dump();
}

static void BM_DecodePing(benchmark::State& state) {
    for (auto _ : state) {
        auto decoded = Codec::decode(kPing);
        benchmark::DoNotOptimize(decoded);
    }
    state.SetBytesProcessed(state.iterations() * kPing.size());
}
BENCHMARK(BM_DecodePing);

static void BM_DecodeToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto decoded = Codec::decode(kToolCall);
        benchmark::DoNotOptimize(decoded);
    }
    state.SetBytesProcessed(state.iterations() * kToolCall.size());
}
BENCHMARK(BM_DecodeToolCall);

static void BM_DecodeBatch(benchmark::State& state) {
    const std::string raw = make_batch(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto decoded = Codec::decode(raw);
        benchmark::DoNotOptimize(decoded);
    }
    state.SetBytesProcessed(state.iterations() * raw.size());
}
BENCHMARK(BM_DecodeBatch)->Arg(10)->Arg(100);

static void BM_DecodeRejected(benchmark::State& state) {
    const std::string bad = R"({"jsonrpc":"1.0","id":1,"method":"ping"})";
    for (auto _ : state) {
        bool rejected = false;
        try {
            auto decoded = Codec::decode(bad);
            benchmark::DoNotOptimize(decoded);
        } catch (const McpParseError&) {
            rejected = true;
        }
        benchmark::DoNotOptimize(rejected);
    }
}
BENCHMARK(BM_DecodeRejected);

static void BM_SerializeResult(benchmark::State& state) {
    JsonRpcResponse resp;
    resp.id = RequestId{std::string("req-42")};
    resp.result = nlohmann::json{{"content", {{{"type", "text"}, {"text", "3"}}}}, {"isError", false}};
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeResult);

static void BM_BuildError(benchmark::State& state) {
    for (auto _ : state) {
        auto s = Codec::serialize(Codec::build_error(ErrorKind::MethodNotFound, RequestId{int64_t{7}}));
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_BuildError);
