#pragma once
#include "transport.hpp"
#include "event_stream.hpp"
#include "../cancellation.hpp"
#include "../server.hpp"
#include <algorithm>
#include <any>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace mcprt {

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(
            a.begin(), a.end(), b.begin(), b.end(), [](unsigned char x, unsigned char y) {
                return std::tolower(x) < std::tolower(y);
            });
    }
};

using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveLess>;

constexpr const char* MEDIA_TYPE_JSON = "application/json";
constexpr const char* MEDIA_TYPE_SSE = "text/event-stream";
constexpr const char* MCP_PROTOCOL_VERSION_HEADER = "MCP-Protocol-Version";

/// What to put on the wire for one HTTP request. A non-null `stream` means
/// an SSE reply whose events are pulled from it.
struct HttpResult {
    int status = 200;
    std::string body;
    std::string content_type;
    HttpHeaders headers;
    std::shared_ptr<EventStream> stream;
};

/// Plain request/response HTTP binding: one POST in, one JSON body out.
/// Notifications pushed by handlers are dropped.
class HttpTransport : public ITransport {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 8080;          // 0 picks a free port
        std::string mcp_path = "/mcp";
    };

    HttpTransport(McpServer& server, Options opts);
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    /// Framework-independent entry point; the built-in listener calls it for
    /// every request on mcp_path.
    [[nodiscard]] virtual HttpResult dispatch(const std::string& method,
                                              const HttpHeaders& headers,
                                              const std::string& body,
                                              std::any scope = {},
                                              const CancellationToken& cancel = {});

    /// Bind and serve. Blocks until shutdown().
    void start() override;
    void shutdown() override;
    bool is_connected() const override;

    /// Wait until start() has bound its socket. Returns false on timeout.
    bool wait_until_ready(std::chrono::milliseconds timeout) const;

    /// The bound port once listening; the configured one before.
    [[nodiscard]] uint16_t port() const;

    [[nodiscard]] const Options& options() const noexcept { return opts_; }

protected:
    /// Media types the Accept header must list.
    [[nodiscard]] virtual std::set<std::string> required_accept_types() const;

    /// Validation and dispatch shared by both HTTP flavours.
    HttpResult handle_post(const HttpHeaders& headers, const std::string& body,
                           std::any scope, Send send, const CancellationToken& cancel);

    std::optional<HttpResult> check_accept(const HttpHeaders& headers) const;
    static std::optional<HttpResult> check_content_type(const HttpHeaders& headers);
    static std::optional<HttpResult> check_protocol_version(const HttpHeaders& headers,
                                                            const std::string& body);
    static HttpResult unsupported_method();
    static HttpResult error_result(int status, ErrorKind kind, const std::string& detail);
    static HttpResult to_http(const HandleResult& result);

    McpServer& server_;

private:
    void setup_routes();
    void write_result(HttpResult result, httplib::Response& res) const;

    Options opts_;
    std::unique_ptr<httplib::Server> http_;
    std::atomic<bool> running_{false};

    mutable std::mutex ready_mutex_;
    mutable std::condition_variable ready_cv_;
    int bound_port_{-1};
};

} // namespace mcprt
