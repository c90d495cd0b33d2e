#include <gtest/gtest.h>
#include "mcprt/transport/http_transport.hpp"
#include "mcprt/version.hpp"

using namespace mcprt;

namespace {

HttpHeaders json_headers() {
    return {
        {"Accept", "application/json"},
        {"Content-Type", "application/json"},
        {"MCP-Protocol-Version", "2025-06-18"},
    };
}

nlohmann::json body_of(const HttpResult& r) {
    return nlohmann::json::parse(r.body);
}

} // anonymous namespace

class HttpTransportTest : public ::testing::Test {
protected:
    McpServer server_{McpServer::Options{}};
    HttpTransport transport_{server_, HttpTransport::Options{"127.0.0.1", 0, "/mcp"}};

    void SetUp() override {
        ToolDefinition notify;
        notify.name = "notify";
        server_.add_tool(notify, [this](const nlohmann::json&) {
            // Plain HTTP has no channel for this; it is dropped.
            server_.context().get_responder().send_notification("notifications/message");
            return CallToolResult::text("sent");
        });
    }
};

TEST_F(HttpTransportTest, PostPing) {
    auto r = transport_.dispatch("POST", json_headers(), R"({"jsonrpc":"2.0","id":"1","method":"ping"})");
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.content_type, "application/json");
    EXPECT_EQ(r.body, R"({"jsonrpc":"2.0","id":"1","result":{}})");
    EXPECT_EQ(r.stream, nullptr);
}

TEST_F(HttpTransportTest, NotificationIsAccepted) {
    auto r = transport_.dispatch("POST", json_headers(), R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    EXPECT_EQ(r.status, 202);
    EXPECT_TRUE(r.body.empty());
}

TEST_F(HttpTransportTest, ErrorCodesMapToStatus) {
    auto missing = transport_.dispatch("POST", json_headers(), R"({"jsonrpc":"2.0","id":1,"method":"nope"})");
    EXPECT_EQ(missing.status, 404);
    EXPECT_EQ(body_of(missing).at("error").at("code"), -32601);

    auto bad = transport_.dispatch("POST", json_headers(),
                                   R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"unknown"}})");
    EXPECT_EQ(bad.status, 400);
}

TEST_F(HttpTransportTest, MalformedJsonIs400) {
    auto r = transport_.dispatch("POST", json_headers(), "{oops");
    EXPECT_EQ(r.status, 400);
    auto body = body_of(r);
    EXPECT_TRUE(body.at("id").is_null());
    EXPECT_EQ(body.at("error").at("code"), -32700);
}

TEST_F(HttpTransportTest, NonPostIs405) {
    for (const char* method : {"GET", "PUT", "DELETE"}) {
        auto r = transport_.dispatch(method, json_headers(), "");
        EXPECT_EQ(r.status, 405) << method;
        EXPECT_EQ(r.headers.at("Allow"), "POST");
    }
}

TEST_F(HttpTransportTest, MissingAcceptIs406) {
    auto headers = json_headers();
    headers.erase("Accept");
    auto r = transport_.dispatch("POST", headers, R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_EQ(r.status, 406);
    EXPECT_EQ(body_of(r).at("error").at("code"), -32600);
}

TEST_F(HttpTransportTest, AcceptListWithParametersIsFine) {
    auto headers = json_headers();
    headers["accept"] = "text/html, application/json; q=0.9";
    auto r = transport_.dispatch("POST", headers, R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_EQ(r.status, 200);
}

TEST_F(HttpTransportTest, WrongContentTypeIs415) {
    auto headers = json_headers();
    headers["Content-Type"] = "text/plain";
    auto r = transport_.dispatch("POST", headers, R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_EQ(r.status, 415);
}

TEST_F(HttpTransportTest, ContentTypeWithCharsetIsFine) {
    auto headers = json_headers();
    headers["Content-Type"] = "application/json; charset=utf-8";
    auto r = transport_.dispatch("POST", headers, R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_EQ(r.status, 200);
}

TEST_F(HttpTransportTest, UnsupportedProtocolVersionIs400) {
    auto headers = json_headers();
    headers["MCP-Protocol-Version"] = "1999-01-01";
    auto r = transport_.dispatch("POST", headers, R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_EQ(r.status, 400);
    auto detail = body_of(r).at("error").at("data").at("detail").get<std::string>();
    EXPECT_NE(detail.find("1999-01-01"), std::string::npos);
}

TEST_F(HttpTransportTest, MissingProtocolVersionUsesDefault) {
    auto headers = json_headers();
    headers.erase("MCP-Protocol-Version");
    auto r = transport_.dispatch("POST", headers, R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_EQ(r.status, 200);
}

TEST_F(HttpTransportTest, InitializeSkipsVersionHeaderCheck) {
    auto headers = json_headers();
    headers["MCP-Protocol-Version"] = "garbage";
    auto r = transport_.dispatch("POST", headers,
                                 R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-06-18"}})");
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(body_of(r).at("result").at("protocolVersion"), "2025-06-18");
}

TEST_F(HttpTransportTest, NotificationsAreDroppedOnPlainHttp) {
    auto r = transport_.dispatch("POST", json_headers(),
                                 R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"notify"}})");
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.stream, nullptr);
    EXPECT_EQ(body_of(r).at("result").at("content")[0].at("text"), "sent");
}

TEST_F(HttpTransportTest, NotListeningBeforeStart) {
    EXPECT_FALSE(transport_.is_connected());
    EXPECT_EQ(transport_.port(), 0);
}

TEST(HttpHeaders, CaseInsensitive) {
    HttpHeaders h{{"Content-Type", "application/json"}};
    EXPECT_EQ(h.count("content-type"), 1u);
    EXPECT_EQ(h.count("CONTENT-TYPE"), 1u);
}
