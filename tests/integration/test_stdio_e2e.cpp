#include <gtest/gtest.h>
#include "mcprt/server.hpp"
#include "mcprt/transport/stdio_transport.hpp"
#include <poll.h>
#include <unistd.h>
#include <chrono>
#include <memory>
#include <thread>

using namespace mcprt;
using namespace std::chrono_literals;

/// Client side of a stdio transport running on a background thread.
class StdioE2ETest : public ::testing::Test {
protected:
    std::unique_ptr<McpServer> server_;
    std::unique_ptr<StdioTransport> transport_;
    std::thread serving_;
    int to_server_ = -1;
    int from_server_ = -1;
    std::string pending_;

    void SetUp() override {
        McpServer::Options opts;
        opts.server_info = {"stdio-e2e", std::nullopt, "1.0"};
        opts.instructions = "Integration test server";
        server_ = std::make_unique<McpServer>(opts);

        ToolDefinition echo;
        echo.name = "echo";
        echo.description = "Echo the input text";
        echo.input_schema = {
            {"type", "object"},
            {"properties", {{"text", {{"type", "string"}}}}},
            {"required", {"text"}}
        };
        server_->add_tool(echo, [](const nlohmann::json& args) {
            return CallToolResult::text(args.at("text").get<std::string>());
        });

        ResourceDefinition greeting;
        greeting.uri = "test://greeting";
        greeting.name = "Greeting";
        greeting.mime_type = "text/plain";
        server_->add_resource(greeting, [](const std::string& uri, const ResourceParams&) {
            ResourceContent c;
            c.uri = uri;
            c.text = "Hello from stdio!";
            return std::vector<ResourceContent>{c};
        });

        PromptDefinition review;
        review.name = "review";
        review.arguments.push_back(PromptArgument{"code", std::nullopt, true});
        server_->add_prompt(review, [](const nlohmann::json& args) {
            return std::vector<PromptMessage>{
                PromptMessage{"user", TextContent{"Review: " + args.at("code").get<std::string>()}}};
        });

        int in[2], out[2];
        ASSERT_EQ(::pipe(in), 0);
        ASSERT_EQ(::pipe(out), 0);
        to_server_ = in[1];
        from_server_ = out[0];
        transport_ = std::make_unique<StdioTransport>(*server_, in[0], out[1]);
        serving_ = std::thread([this] { transport_->start(); });
    }

    void TearDown() override {
        if (to_server_ >= 0) ::close(to_server_);  // EOF ends the read loop
        if (serving_.joinable()) serving_.join();
        transport_.reset();
        if (from_server_ >= 0) ::close(from_server_);
    }

    void send(const std::string& line) {
        std::string data = line + "\n";
        ASSERT_EQ(::write(to_server_, data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    /// Next line from the server, or an empty string on timeout.
    std::string read_line(std::chrono::milliseconds timeout = 5000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            auto nl = pending_.find('\n');
            if (nl != std::string::npos) {
                std::string line = pending_.substr(0, nl);
                pending_.erase(0, nl + 1);
                return line;
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) return {};
            pollfd pfd{from_server_, POLLIN, 0};
            if (::poll(&pfd, 1, static_cast<int>(left.count())) <= 0) return {};
            char buf[4096];
            ssize_t n = ::read(from_server_, buf, sizeof(buf));
            if (n <= 0) return {};
            pending_.append(buf, static_cast<size_t>(n));
        }
    }

    nlohmann::json request(const std::string& line) {
        send(line);
        auto response = read_line();
        EXPECT_FALSE(response.empty()) << "no response to " << line;
        return response.empty() ? nlohmann::json() : nlohmann::json::parse(response);
    }
};

TEST_F(StdioE2ETest, FullSession) {
    auto init = request(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-06-18","capabilities":{},"clientInfo":{"name":"e2e","version":"1"}}})");
    EXPECT_EQ(init.at("result").at("protocolVersion"), "2025-06-18");
    EXPECT_EQ(init.at("result").at("serverInfo").at("name"), "stdio-e2e");
    EXPECT_EQ(init.at("result").at("instructions"), "Integration test server");
    const auto& caps = init.at("result").at("capabilities");
    EXPECT_TRUE(caps.contains("tools"));
    EXPECT_TRUE(caps.contains("resources"));
    EXPECT_TRUE(caps.contains("prompts"));

    send(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");

    auto ping = request(R"({"jsonrpc":"2.0","id":2,"method":"ping"})");
    EXPECT_EQ(ping.at("id"), 2);

    auto tools = request(R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})");
    ASSERT_EQ(tools.at("result").at("tools").size(), 1u);
    EXPECT_EQ(tools.at("result").at("tools")[0].at("description"), "Echo the input text");

    auto echo = request(R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hi there"}}})");
    EXPECT_EQ(echo.at("result").at("content")[0].at("text"), "hi there");

    auto read = request(R"({"jsonrpc":"2.0","id":5,"method":"resources/read","params":{"uri":"test://greeting"}})");
    EXPECT_EQ(read.at("result").at("contents")[0].at("text"), "Hello from stdio!");
    EXPECT_EQ(read.at("result").at("contents")[0].at("mimeType"), "text/plain");

    auto prompt = request(R"({"jsonrpc":"2.0","id":6,"method":"prompts/get","params":{"name":"review","arguments":{"code":"x=1"}}})");
    EXPECT_EQ(prompt.at("result").at("messages")[0].at("content").at("text"), "Review: x=1");
}

TEST_F(StdioE2ETest, ErrorsDoNotEndTheSession) {
    auto garbage = request("this is not json");
    EXPECT_EQ(garbage.at("error").at("code"), -32700);

    auto wrong_version = request(R"({"jsonrpc":"1.0","id":10,"method":"ping"})");
    EXPECT_EQ(wrong_version.at("error").at("code"), -32600);
    EXPECT_EQ(wrong_version.at("id"), 10);

    auto unknown = request(R"({"jsonrpc":"2.0","id":11,"method":"nope"})");
    EXPECT_EQ(unknown.at("error").at("code"), -32601);

    auto missing = request(R"({"jsonrpc":"2.0","id":12,"method":"resources/read","params":{"uri":"test://missing"}})");
    EXPECT_EQ(missing.at("error").at("code"), -32002);

    auto ping = request(R"({"jsonrpc":"2.0","id":13,"method":"ping"})");
    EXPECT_TRUE(ping.contains("result"));
}

TEST_F(StdioE2ETest, BatchOnOneLine) {
    auto batch = request(R"([{"jsonrpc":"2.0","id":"a","method":"ping"},{"jsonrpc":"2.0","id":"b","method":"tools/call","params":{"name":"echo","arguments":{"text":"b"}}}])");
    ASSERT_TRUE(batch.is_array());
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch[0].at("id"), "a");
    EXPECT_EQ(batch[1].at("result").at("content")[0].at("text"), "b");
}

TEST_F(StdioE2ETest, EofStopsTheTransport) {
    auto ping = request(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_TRUE(ping.contains("result"));
    ::close(to_server_);
    to_server_ = -1;
    serving_.join();
    EXPECT_FALSE(transport_->is_connected());
}
