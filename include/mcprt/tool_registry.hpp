#pragma once
#include "types.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace mcprt {

/// Tool body. The request context is reachable through ContextManager while
/// it runs. Throwing ToolError (or any other std::exception) reports a failed
/// operation to the client; throwing McpProtocolError fails the request.
using ToolHandler = std::function<CallToolResult(const nlohmann::json& arguments)>;

class ToolRegistry {
public:
    /// Throws std::invalid_argument for an empty or already registered name.
    void add(ToolDefinition def, ToolHandler handler);

    /// Throws std::invalid_argument if the tool is not registered.
    ToolDefinition remove(const std::string& name);

    /// Definitions in registration order.
    [[nodiscard]] std::vector<ToolDefinition> list() const;

    /// Run a tool. Unknown names and non-object arguments raise
    /// McpProtocolError(InvalidParams).
    CallToolResult call(const std::string& name, const nlohmann::json& arguments) const;

    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] bool empty() const;

private:
    struct Entry {
        ToolDefinition def;
        ToolHandler handler;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

} // namespace mcprt
