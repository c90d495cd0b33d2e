/// Math server over Streamable HTTP. Replies are plain JSON unless a tool
/// reports progress, in which case the reply becomes an event stream.
/// Usage: ./math_http_server [port]

#include "../common/example_support.hpp"
#include <csignal>

namespace {
mcprt::StreamableHttpTransport* active_transport = nullptr;

void on_signal(int) {
    if (active_transport) active_transport->shutdown();
}
}

int main(int argc, char* argv[]) {
    examples::configure_logging();

    mcprt::McpServer::Options opts;
    opts.server_info = {"math-http", std::nullopt, "1.0.0"};
    opts.instructions = "Basic arithmetic tools. Try 'count' to see streaming.";
    mcprt::McpServer server{std::move(opts)};
    examples::register_math(server);

    mcprt::StreamableHttpTransport::Options http;
    http.host = "127.0.0.1";
    http.port = argc > 1 ? static_cast<uint16_t>(std::stoi(argv[1])) : 8000;
    mcprt::StreamableHttpTransport transport{server, http};
    active_transport = &transport;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    try {
        transport.start();
    } catch (const mcprt::McpError& e) {
        spdlog::critical("HTTP transport failed: {}", e.what());
        return 1;
    }
    return 0;
}
