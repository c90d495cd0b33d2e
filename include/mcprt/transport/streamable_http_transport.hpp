#pragma once
#include "http_transport.hpp"
#include "../worker_pool.hpp"
#include <chrono>
#include <cstddef>

namespace mcprt {

/// HTTP binding that upgrades a reply to server-sent events only when the
/// handler pushes a notification before its final response. A handler that
/// never notifies gets a plain JSON reply.
class StreamableHttpTransport : public HttpTransport {
public:
    static constexpr std::chrono::milliseconds DEFAULT_PING_INTERVAL{15000};

    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 8080;          // 0 picks a free port
        std::string mcp_path = "/mcp";
        /// Keep-alive comment interval on an idle stream.
        std::chrono::milliseconds ping_interval{DEFAULT_PING_INTERVAL};
    };

    StreamableHttpTransport(McpServer& server, Options opts);
    ~StreamableHttpTransport() override;

    /// Returns as soon as the reply shape is known. For a streamed reply the
    /// handler keeps running in the background and feeds result.stream.
    [[nodiscard]] HttpResult dispatch(const std::string& method,
                                      const HttpHeaders& headers,
                                      const std::string& body,
                                      std::any scope = {},
                                      const CancellationToken& cancel = {}) override;

    /// Stops listening, cancels background handlers and waits for them.
    void shutdown() override;

    /// Background handlers still running.
    [[nodiscard]] size_t in_flight() const;

protected:
    std::set<std::string> required_accept_types() const override;

private:
    static HttpTransport::Options http_options(const Options& opts);

    std::chrono::milliseconds ping_interval_;
    CancellationSource shutdown_;

    /// Runs each request's handler; a streamed reply keeps its worker until
    /// the final response is written to the stream.
    WorkerPool workers_;
};

} // namespace mcprt
