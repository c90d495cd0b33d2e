/// Math server over stdio (newline-delimited JSON-RPC).
/// Usage: MCPRT_LOG_LEVEL=debug ./math_stdio_server

#include "../common/example_support.hpp"
#include <csignal>

namespace {
mcprt::StdioTransport* active_transport = nullptr;

void on_signal(int) {
    if (active_transport) active_transport->shutdown();
}
}

int main() {
    examples::configure_logging();

    mcprt::McpServer::Options opts;
    opts.server_info = {"math-stdio", std::nullopt, "1.0.0"};
    opts.instructions = "Basic arithmetic tools.";
    mcprt::McpServer server{std::move(opts)};
    examples::register_math(server);

    mcprt::StdioTransport transport{server};
    active_transport = &transport;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    try {
        transport.start();
    } catch (const mcprt::McpError& e) {
        spdlog::critical("stdio transport failed: {}", e.what());
        return 1;
    }
    return 0;
}
