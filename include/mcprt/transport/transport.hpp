#pragma once

namespace mcprt {

/// A wire adapter in front of an McpServer. Adapters only present what
/// McpServer::handle() decided; they never classify errors themselves.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Serve until the input ends or shutdown() is called. Blocks.
    virtual void start() = 0;

    /// Stop serving and cancel in-flight handlers. Safe from any thread.
    virtual void shutdown() = 0;

    /// Check if transport is connected.
    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace mcprt
