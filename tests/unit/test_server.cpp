#include <gtest/gtest.h>
#include "mcprt/server.hpp"
#include "mcprt/version.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace mcprt;
using namespace std::chrono_literals;

namespace {

McpServer::Options test_options() {
    McpServer::Options opts;
    opts.server_info = {"test-server", std::nullopt, "1.2.3"};
    return opts;
}

std::string text_of(const HandleResult& result) {
    if (!std::holds_alternative<std::string>(result)) {
        ADD_FAILURE() << "expected a response";
        return {};
    }
    return std::get<std::string>(result);
}

nlohmann::json call(McpServer& server, const std::string& message, Send send = nullptr,
                    std::any scope = {}, const CancellationToken& cancel = {}) {
    return nlohmann::json::parse(text_of(server.handle(message, std::move(send), std::move(scope), cancel)));
}

std::string tool_call(const std::string& id, const std::string& name,
                      const nlohmann::json& args = nlohmann::json::object(),
                      const std::optional<nlohmann::json>& meta = std::nullopt) {
    nlohmann::json params{{"name", name}, {"arguments", args}};
    if (meta) params["_meta"] = *meta;
    return nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/call"}, {"params", params}}.dump();
}

ToolDefinition tool(const std::string& name) {
    ToolDefinition def;
    def.name = name;
    return def;
}

int error_code(const nlohmann::json& response) {
    return response.at("error").at("code").get<int>();
}

std::string error_detail(const nlohmann::json& response) {
    return response.at("error").at("data").at("detail").get<std::string>();
}

} // anonymous namespace

class ServerTest : public ::testing::Test {
protected:
    McpServer server_{test_options()};

    void SetUp() override {
        server_.add_tool(tool("add"), [](const nlohmann::json& args) {
            return CallToolResult::text(std::to_string(args.at("a").get<int>() + args.at("b").get<int>()));
        });
        server_.add_tool(tool("divide"), [](const nlohmann::json& args) -> CallToolResult {
            if (args.at("b").get<int>() == 0) throw ToolError("Cannot divide by zero");
            return CallToolResult::text(std::to_string(args.at("a").get<int>() / args.at("b").get<int>()));
        });
    }
};

// ---- Basic dispatch ----

TEST_F(ServerTest, PingExactResponse) {
    auto result = server_.handle(R"({"jsonrpc":"2.0","id":"1","method":"ping"})");
    EXPECT_EQ(text_of(result), R"({"jsonrpc":"2.0","id":"1","result":{}})");
}

TEST_F(ServerTest, UnknownMethodExactResponse) {
    auto result = server_.handle(R"({"jsonrpc":"2.0","id":"7","method":"does/not/exist"})");
    EXPECT_EQ(text_of(result),
              R"({"jsonrpc":"2.0","id":"7","error":{"code":-32601,"message":"Method not found"}})");
}

TEST_F(ServerTest, IntegerIdEchoed) {
    auto resp = call(server_, R"({"jsonrpc":"2.0","id":99,"method":"ping"})");
    EXPECT_EQ(resp.at("id"), 99);
}

TEST_F(ServerTest, ShutdownIsAcknowledged) {
    auto resp = call(server_, R"({"jsonrpc":"2.0","id":1,"method":"shutdown"})");
    EXPECT_EQ(resp.at("result"), nlohmann::json::object());
}

TEST_F(ServerTest, NotificationProducesNoMessage) {
    auto result = server_.handle(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    ASSERT_TRUE(std::holds_alternative<NoMessage>(result));
    EXPECT_EQ(std::get<NoMessage>(result), NoMessage::Notification);
}

TEST_F(ServerTest, UnknownNotificationProducesNoMessage) {
    auto result = server_.handle(R"({"jsonrpc":"2.0","method":"notifications/whatever"})");
    EXPECT_TRUE(std::holds_alternative<NoMessage>(result));
}

TEST_F(ServerTest, CancelledNotificationIsIgnored) {
    auto result = server_.handle(
        R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":"3"}})");
    EXPECT_TRUE(std::holds_alternative<NoMessage>(result));
}

// ---- Invalid envelopes ----

TEST_F(ServerTest, MalformedJsonThrowsInvalidMessage) {
    try {
        (void)server_.handle("{not json");
        FAIL() << "expected InvalidMessageError";
    } catch (const InvalidMessageError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ParseError);
        auto body = nlohmann::json::parse(e.response());
        EXPECT_TRUE(body.at("id").is_null());
        EXPECT_EQ(error_code(body), -32700);
    }
}

TEST_F(ServerTest, InvalidEnvelopeKeepsPeekableId) {
    try {
        (void)server_.handle(R"({"jsonrpc":"1.0","id":"5","method":"ping"})");
        FAIL() << "expected InvalidMessageError";
    } catch (const InvalidMessageError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidRequest);
        auto body = nlohmann::json::parse(e.response());
        EXPECT_EQ(body.at("id"), "5");
        EXPECT_EQ(error_code(body), -32600);
    }
}

// ---- Lifecycle ----

TEST_F(ServerTest, InitializeEchoesSupportedVersion) {
    auto resp = call(server_, R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-03-26","capabilities":{},"clientInfo":{"name":"c","version":"1"}}})");
    const auto& result = resp.at("result");
    EXPECT_EQ(result.at("protocolVersion"), "2025-03-26");
    EXPECT_EQ(result.at("serverInfo").at("name"), "test-server");
    EXPECT_EQ(result.at("serverInfo").at("version"), "1.2.3");
    EXPECT_TRUE(result.at("capabilities").contains("tools"));
    EXPECT_FALSE(result.at("capabilities").contains("prompts"));
    EXPECT_FALSE(result.at("capabilities").contains("resources"));
}

TEST_F(ServerTest, InitializeOffersLatestForUnknownVersion) {
    auto resp = call(server_, R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"1999-01-01"}})");
    EXPECT_EQ(resp.at("result").at("protocolVersion"), std::string(PROTOCOL_VERSION));
}

TEST(Server, InitializeReportsInstructionsAndCapabilities) {
    auto opts = test_options();
    opts.instructions = "Use the tools wisely";
    McpServer server(opts);

    PromptDefinition prompt;
    prompt.name = "p";
    server.add_prompt(prompt, [](const nlohmann::json&) { return std::vector<PromptMessage>{}; });
    ResourceDefinition res;
    res.uri = "r://x";
    res.name = "x";
    server.add_resource(res, [](const std::string&, const ResourceParams&) {
        return std::vector<ResourceContent>{};
    });

    auto resp = call(server, R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-06-18"}})");
    const auto& result = resp.at("result");
    EXPECT_EQ(result.at("instructions"), "Use the tools wisely");
    EXPECT_FALSE(result.at("capabilities").contains("tools"));
    EXPECT_TRUE(result.at("capabilities").contains("prompts"));
    EXPECT_EQ(result.at("capabilities").at("resources").at("subscribe"), false);
    EXPECT_EQ(server.instructions(), "Use the tools wisely");
}

// ---- Tools ----

TEST_F(ServerTest, ToolsList) {
    auto resp = call(server_, R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    const auto& tools = resp.at("result").at("tools");
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].at("name"), "add");
    EXPECT_EQ(tools[0].at("inputSchema").at("type"), "object");
}

TEST_F(ServerTest, ToolCallSuccess) {
    auto resp = call(server_, tool_call("c1", "add", {{"a", 2}, {"b", 3}}));
    EXPECT_EQ(resp.at("id"), "c1");
    EXPECT_EQ(resp.at("result").at("isError"), false);
    EXPECT_EQ(resp.at("result").at("content")[0].at("text"), "5");
}

TEST_F(ServerTest, ToolBusinessErrorIsResultNotError) {
    auto resp = call(server_, tool_call("c2", "divide", {{"a", 1}, {"b", 0}}));
    ASSERT_FALSE(resp.contains("error"));
    EXPECT_EQ(resp.at("result").at("isError"), true);
    EXPECT_EQ(resp.at("result").at("content")[0].at("text"), "Cannot divide by zero");
}

TEST_F(ServerTest, UnknownToolIsInvalidParams) {
    auto resp = call(server_, tool_call("c3", "nope"));
    EXPECT_EQ(error_code(resp), -32602);
    EXPECT_EQ(error_detail(resp), "Unknown tool: nope");
}

TEST_F(ServerTest, MalformedToolParamsAreInvalidParams) {
    auto missing = call(server_, R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{}})");
    EXPECT_EQ(error_code(missing), -32602);
    auto wrong_type = call(server_, R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":5}})");
    EXPECT_EQ(error_code(wrong_type), -32602);
}

TEST_F(ServerTest, ToolArgumentTypeErrorIsReportedAsToolFailure) {
    auto resp = call(server_, tool_call("c4", "add", {{"a", "x"}, {"b", 1}}));
    EXPECT_EQ(resp.at("result").at("isError"), true);
}

// ---- Prompts and resources ----

TEST(Server, PromptsAndResources) {
    McpServer server(test_options());

    PromptDefinition prompt;
    prompt.name = "greet";
    prompt.arguments.push_back(PromptArgument{"name", std::nullopt, true});
    server.add_prompt(prompt, [](const nlohmann::json& args) {
        return std::vector<PromptMessage>{
            PromptMessage{"user", TextContent{"Hi " + args.at("name").get<std::string>()}}};
    });

    ResourceTemplate tmpl;
    tmpl.uri_template = "users://{id}";
    tmpl.name = "user";
    tmpl.mime_type = "application/json";
    server.add_resource_template(tmpl, [](const std::string&, const ResourceParams& params) {
        ResourceContent c;
        c.text = nlohmann::json{{"id", params.at("id")}}.dump();
        return std::vector<ResourceContent>{c};
    });

    auto list = call(server, R"({"jsonrpc":"2.0","id":1,"method":"prompts/list"})");
    EXPECT_EQ(list.at("result").at("prompts")[0].at("name"), "greet");

    auto got = call(server, R"({"jsonrpc":"2.0","id":2,"method":"prompts/get","params":{"name":"greet","arguments":{"name":"Ada"}}})");
    EXPECT_EQ(got.at("result").at("messages")[0].at("content").at("text"), "Hi Ada");

    auto missing = call(server, R"({"jsonrpc":"2.0","id":3,"method":"prompts/get","params":{"name":"greet"}})");
    EXPECT_EQ(error_code(missing), -32602);

    auto templates = call(server, R"({"jsonrpc":"2.0","id":4,"method":"resources/templates/list"})");
    EXPECT_EQ(templates.at("result").at("resourceTemplates")[0].at("uriTemplate"), "users://{id}");

    auto resources = call(server, R"({"jsonrpc":"2.0","id":5,"method":"resources/list"})");
    EXPECT_TRUE(resources.at("result").at("resources").empty());

    auto read = call(server, R"({"jsonrpc":"2.0","id":6,"method":"resources/read","params":{"uri":"users://42"}})");
    const auto& content = read.at("result").at("contents")[0];
    EXPECT_EQ(content.at("uri"), "users://42");
    EXPECT_EQ(content.at("mimeType"), "application/json");
    EXPECT_EQ(content.at("text"), R"({"id":"42"})");

    auto not_found = call(server, R"({"jsonrpc":"2.0","id":7,"method":"resources/read","params":{"uri":"posts://1"}})");
    EXPECT_EQ(error_code(not_found), -32002);
}

// ---- Handler failures ----

namespace {

void add_failing_resource(McpServer& server) {
    ResourceDefinition res;
    res.uri = "broken://x";
    res.name = "broken";
    server.add_resource(res, [](const std::string&, const ResourceParams&) -> std::vector<ResourceContent> {
        throw std::runtime_error("disk on fire");
    });
}

} // anonymous namespace

TEST(Server, UnexpectedExceptionIsInternalError) {
    McpServer server(test_options());
    add_failing_resource(server);
    auto resp = call(server, R"({"jsonrpc":"2.0","id":1,"method":"resources/read","params":{"uri":"broken://x"}})");
    EXPECT_EQ(error_code(resp), -32603);
    EXPECT_EQ(error_detail(resp), "disk on fire");
}

TEST(Server, RaiseExceptionsRethrows) {
    auto opts = test_options();
    opts.raise_exceptions = true;
    McpServer server(opts);
    add_failing_resource(server);
    EXPECT_THROW((void)server.handle(R"({"jsonrpc":"2.0","id":1,"method":"resources/read","params":{"uri":"broken://x"}})"),
                 std::runtime_error);
}

// ---- Batches ----

TEST_F(ServerTest, BatchKeepsRequestOrder) {
    auto result = server_.handle(
        R"([{"jsonrpc":"2.0","id":1,"method":"ping"},)"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"},)"
        R"({"jsonrpc":"2.0","id":2,"method":"nope"},)"
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"add","arguments":{"a":1,"b":1}}}])");
    auto body = nlohmann::json::parse(text_of(result));
    ASSERT_TRUE(body.is_array());
    ASSERT_EQ(body.size(), 3u);
    EXPECT_EQ(body[0].at("id"), 1);
    EXPECT_EQ(body[1].at("id"), 2);
    EXPECT_EQ(error_code(body[1]), -32601);
    EXPECT_EQ(body[2].at("result").at("content")[0].at("text"), "2");
}

TEST_F(ServerTest, BatchOfNotificationsProducesNoMessage) {
    auto result = server_.handle(
        R"([{"jsonrpc":"2.0","method":"notifications/initialized"},{"jsonrpc":"2.0","method":"notifications/cancelled"}])");
    EXPECT_TRUE(std::holds_alternative<NoMessage>(result));
}

TEST_F(ServerTest, InvalidBatchElementIsAnsweredInPlace) {
    auto result = server_.handle(
        R"([{"jsonrpc":"2.0","id":2,"method":"ping"},{"jsonrpc":"1.0","id":3,"method":"ping"},"junk"])");
    auto body = nlohmann::json::parse(text_of(result));
    ASSERT_TRUE(body.is_array());
    ASSERT_EQ(body.size(), 3u);
    EXPECT_EQ(body[0].at("id"), 2);
    EXPECT_EQ(body[0].at("result"), nlohmann::json::object());
    EXPECT_EQ(body[1].at("id"), 3);
    EXPECT_EQ(error_code(body[1]), -32600);
    EXPECT_TRUE(body[2].at("id").is_null());
    EXPECT_EQ(error_code(body[2]), -32600);
}

TEST_F(ServerTest, EmptyBatchIsRejectedWhole) {
    EXPECT_THROW((void)server_.handle("[]"), InvalidMessageError);
}

TEST_F(ServerTest, UnencodableResultInBatchDoesNotSinkTheOthers) {
    server_.add_tool(tool("bad"), [](const nlohmann::json&) {
        return CallToolResult::text(std::string("\xff\xfe"));
    });
    auto result = server_.handle(
        R"([{"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"bad","arguments":{}}},)"
        R"({"jsonrpc":"2.0","id":2,"method":"ping"}])");
    auto body = nlohmann::json::parse(text_of(result));
    ASSERT_TRUE(body.is_array());
    ASSERT_EQ(body.size(), 2u);
    EXPECT_EQ(body[0].at("id"), 1);
    EXPECT_EQ(error_code(body[0]), -32603);
    EXPECT_EQ(body[1].at("id"), 2);
    EXPECT_EQ(body[1].at("result"), nlohmann::json::object());
}

// ---- Context and notifications ----

TEST(Server, ScopeReachesHandler) {
    McpServer server(test_options());
    server.add_tool(tool("whoami"), [&server](const nlohmann::json&) {
        return CallToolResult::text(server.context().scope_as<std::string>());
    });
    auto resp = call(server, tool_call("1", "whoami"), nullptr, std::string("tenant-a"));
    EXPECT_EQ(resp.at("result").at("content")[0].at("text"), "tenant-a");
}

TEST(Server, ContextIsNotActiveOutsideHandlers) {
    McpServer server(test_options());
    EXPECT_FALSE(server.context().has_active());
    EXPECT_THROW((void)server.context().get(), ContextError);
}

TEST(Server, NotificationsArriveBeforeResponse) {
    McpServer server(test_options());
    server.add_tool(tool("chatty"), [&server](const nlohmann::json&) {
        auto& responder = server.context().get_responder();
        responder.send_notification("notifications/message", nlohmann::json{{"level", "info"}, {"data", "one"}});
        responder.report_progress(1, 2);
        return CallToolResult::text("done");
    });

    std::mutex m;
    std::vector<std::string> sent;
    auto resp = call(server, tool_call("1", "chatty", nlohmann::json::object(), nlohmann::json{{"progressToken", 5}}),
                     [&](const std::string& msg) {
                         std::lock_guard<std::mutex> lock(m);
                         sent.push_back(msg);
                     });
    EXPECT_EQ(resp.at("result").at("content")[0].at("text"), "done");
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(nlohmann::json::parse(sent[0]).at("method"), "notifications/message");
    auto progress = nlohmann::json::parse(sent[1]);
    EXPECT_EQ(progress.at("method"), "notifications/progress");
    EXPECT_EQ(progress.at("params").at("progressToken"), 5);
}

// ---- Limits ----

TEST(Server, ConcurrencyNeverExceedsLimit) {
    auto opts = test_options();
    opts.max_concurrency = 2;
    McpServer server(opts);

    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    server.add_tool(tool("slow"), [&](const nlohmann::json&) {
        int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(30ms);
        --running;
        return CallToolResult::text("ok");
    });

    std::vector<std::thread> callers;
    std::atomic<int> ok{0};
    for (int i = 0; i < 8; ++i) {
        callers.emplace_back([&, i] {
            auto resp = call(server, tool_call(std::to_string(i), "slow"));
            if (resp.contains("result")) ++ok;
        });
    }
    for (auto& t : callers) t.join();

    EXPECT_EQ(ok.load(), 8);
    EXPECT_LE(peak.load(), 2);
    EXPECT_LE(server.limiter().gate().peak(), 2u);
    EXPECT_EQ(server.limiter().gate().active(), 0u);
}

TEST(Server, IdleTimeoutAnswersConnectionClosed) {
    auto opts = test_options();
    opts.idle_timeout = 50ms;
    McpServer server(opts);
    server.add_tool(tool("stuck"), [&server](const nlohmann::json&) {
        auto& ctx = server.context().get();
        ctx.cancellation().wait_for(5s);
        ctx.throw_if_cancelled();
        return CallToolResult::text("never");
    });

    auto start = std::chrono::steady_clock::now();
    auto resp = call(server, tool_call("t1", "stuck"));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
    EXPECT_EQ(resp.at("id"), "t1");
    EXPECT_EQ(error_code(resp), -32000);
    EXPECT_EQ(error_detail(resp), "Request timed out");
}

TEST(Server, ProgressKeepsRequestAlive) {
    auto opts = test_options();
    opts.idle_timeout = 100ms;
    McpServer server(opts);
    server.add_tool(tool("steady"), [&server](const nlohmann::json&) {
        auto& ctx = server.context().get();
        for (int i = 1; i <= 6; ++i) {
            std::this_thread::sleep_for(40ms);
            ctx.throw_if_cancelled();
            ctx.responder()->report_progress(i, 6);
        }
        return CallToolResult::text("finished");
    });

    std::atomic<int> notes{0};
    auto resp = call(server, tool_call("t2", "steady", nlohmann::json::object(), nlohmann::json{{"progressToken", "p"}}),
                     [&](const std::string&) { ++notes; });
    ASSERT_TRUE(resp.contains("result")) << resp.dump();
    EXPECT_EQ(resp.at("result").at("content")[0].at("text"), "finished");
    EXPECT_EQ(notes.load(), 6);
}

TEST(Server, CallerCancellationAnswersClientDisconnected) {
    McpServer server(test_options());
    std::atomic<bool> started{false};
    server.add_tool(tool("wait"), [&](const nlohmann::json&) {
        auto& ctx = server.context().get();
        started = true;
        ctx.cancellation().wait_for(5s);
        ctx.throw_if_cancelled();
        return CallToolResult::text("never");
    });

    CancellationSource client;
    std::thread disconnect([&] {
        while (!started) std::this_thread::sleep_for(1ms);
        client.cancel();
    });
    auto resp = call(server, tool_call("t3", "wait"), nullptr, {}, client.token());
    disconnect.join();
    EXPECT_EQ(error_code(resp), -32000);
    EXPECT_EQ(error_detail(resp), "Client disconnected");
}

TEST(Server, HandlerIgnoringCancellationIsAbandoned) {
    auto opts = test_options();
    opts.idle_timeout = 20ms;
    opts.cancel_grace = 20ms;
    McpServer server(opts);
    server.add_tool(tool("stubborn"), [](const nlohmann::json&) {
        std::this_thread::sleep_for(400ms);
        return CallToolResult::text("late");
    });

    auto start = std::chrono::steady_clock::now();
    auto resp = call(server, tool_call("t4", "stubborn"));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 300ms);
    EXPECT_EQ(error_code(resp), -32000);
}

TEST(Server, DestructionWaitsForAbandonedHandlers) {
    auto opts = test_options();
    opts.idle_timeout = 20ms;
    opts.cancel_grace = 10ms;
    std::atomic<bool> finished{false};
    {
        McpServer server(opts);
        server.add_tool(tool("stubborn"), [&finished](const nlohmann::json&) {
            std::this_thread::sleep_for(150ms);
            finished = true;
            return CallToolResult::text("late");
        });
        auto resp = call(server, tool_call("t5", "stubborn"));
        EXPECT_EQ(error_code(resp), -32000);
        EXPECT_FALSE(finished.load());
    }
    EXPECT_TRUE(finished.load());
}

TEST(Server, AcquireTimeoutIsInternalError) {
    auto opts = test_options();
    opts.max_concurrency = 1;
    opts.acquire_timeout = 20ms;
    McpServer server(opts);

    std::atomic<bool> started{false};
    CancellationSource release;
    server.add_tool(tool("hold"), [&](const nlohmann::json&) {
        started = true;
        release.token().wait_for(5s);
        return CallToolResult::text("held");
    });

    std::thread holder([&] { (void)server.handle(tool_call("h", "hold")); });
    while (!started) std::this_thread::sleep_for(1ms);

    auto resp = call(server, R"({"jsonrpc":"2.0","id":"late","method":"ping"})");
    EXPECT_EQ(error_code(resp), -32603);
    EXPECT_EQ(error_detail(resp), "concurrency limit wait exceeded");

    release.cancel();
    holder.join();
}

TEST(Server, Accessors) {
    McpServer server(test_options());
    EXPECT_EQ(server.name(), "test-server");
    EXPECT_EQ(server.version(), "1.2.3");
    EXPECT_FALSE(server.instructions().has_value());
    EXPECT_EQ(server.options().max_concurrency, 100u);
    EXPECT_TRUE(server.tools().empty());
}
