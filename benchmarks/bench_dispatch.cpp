#include <benchmark/benchmark.h>
#include "mcprt/server.hpp"
#include <memory>
#include <string>

using namespace mcprt;

static std::unique_ptr<McpServer> make_server() {
    McpServer::Options opts;
    opts.server_info = {"bench", std::nullopt, "1.0.0"};
    auto server = std::make_unique<McpServer>(std::move(opts));

    ToolDefinition add;
    add.name = "add";
    server->add_tool(add, [](const nlohmann::json& args) {
        return CallToolResult::text(std::to_string(args.at("a").get<int>() + args.at("b").get<int>()));
    });
    return server;
}

static void BM_HandlePing(benchmark::State& state) {
    auto server = make_server();
    const std::string msg = R"({"jsonrpc":"2.0","id":1,"method":"ping"})";
    for (auto _ : state) {
        auto result = server->handle(msg);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_HandlePing)->UseRealTime();

static void BM_HandleToolCall(benchmark::State& state) {
    auto server = make_server();
    const std::string msg =
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"add","arguments":{"a":2,"b":3}}})";
    for (auto _ : state) {
        auto result = server->handle(msg);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_HandleToolCall)->UseRealTime();

static void BM_HandleUnknownMethod(benchmark::State& state) {
    auto server = make_server();
    const std::string msg = R"({"jsonrpc":"2.0","id":1,"method":"nope"})";
    for (auto _ : state) {
        auto result = server->handle(msg);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_HandleUnknownMethod)->UseRealTime();

static void BM_HandleNotification(benchmark::State& state) {
    auto server = make_server();
    const std::string msg = R"({"jsonrpc":"2.0","method":"notifications/initialized"})";
    for (auto _ : state) {
        auto result = server->handle(msg);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_HandleNotification)->UseRealTime();

// Concurrent callers contend on the concurrency gate.
static void BM_HandleConcurrent(benchmark::State& state) {
    static std::unique_ptr<McpServer> server;
    if (state.thread_index() == 0) server = make_server();
    const std::string msg = R"({"jsonrpc":"2.0","id":1,"method":"ping"})";
    for (auto _ : state) {
        auto result = server->handle(msg);
        benchmark::DoNotOptimize(result);
    }
    if (state.thread_index() == 0) server.reset();
}
BENCHMARK(BM_HandleConcurrent)->Threads(4)->UseRealTime();
