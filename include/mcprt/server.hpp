#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "cancellation.hpp"
#include "context.hpp"
#include "limiter.hpp"
#include "responder.hpp"
#include "tool_registry.hpp"
#include "prompt_registry.hpp"
#include "resource_registry.hpp"
#include <any>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mcprt {

/// Outcome of handle() that carries nothing to write back.
enum class NoMessage {
    Notification,  // the input was a notification (or a batch of them)
};

using HandleResult = std::variant<std::string, NoMessage>;

/// Stateless MCP dispatcher. Every call to handle() is independent; there is
/// no session, and any number of calls may run concurrently.
class McpServer {
public:
    struct Options {
        Implementation server_info{"mcprt", std::nullopt, "0.1.0"};
        std::optional<std::string> instructions;
        std::chrono::milliseconds idle_timeout{Limiter::DEFAULT_IDLE_TIMEOUT};
        size_t max_concurrency = Limiter::DEFAULT_MAX_CONCURRENCY;
        /// Give up waiting for a concurrency slot after this long. Unset
        /// means wait until a slot frees up or the caller cancels.
        std::optional<std::chrono::milliseconds> acquire_timeout;
        /// How long a cancelled handler may keep running before it is abandoned.
        std::chrono::milliseconds cancel_grace{1000};
        /// Rethrow unclassified handler exceptions instead of answering
        /// InternalError. Meant for tests.
        bool raise_exceptions = false;
    };

    explicit McpServer(Options opts);
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    /// Handle one raw JSON-RPC message or batch.
    ///
    /// `send` receives notifications pushed by the handler before its final
    /// response; without it notifications are dropped. `scope` is handed to
    /// the handler untouched. Cancelling `cancel` (client went away) stops the
    /// handler and answers ConnectionClosed.
    ///
    /// Throws InvalidMessageError when the envelope cannot be decoded.
    [[nodiscard]] HandleResult handle(std::string_view message,
                                      Send send = nullptr,
                                      std::any scope = {},
                                      const CancellationToken& cancel = {});

    // ---- Registration ----
    void add_tool(ToolDefinition def, ToolHandler handler);
    void add_prompt(PromptDefinition def, PromptHandler handler);
    void add_resource(ResourceDefinition def, ResourceReadHandler handler);
    void add_resource_template(ResourceTemplate tmpl, ResourceReadHandler handler);

    [[nodiscard]] ToolRegistry& tools();
    [[nodiscard]] PromptRegistry& prompts();
    [[nodiscard]] ResourceRegistry& resources();

    /// Access to the context of the handler running on the calling thread.
    [[nodiscard]] const ContextManager& context() const;
    [[nodiscard]] const Limiter& limiter() const;

    [[nodiscard]] const std::string& name() const;
    [[nodiscard]] const std::string& version() const;
    [[nodiscard]] const std::optional<std::string>& instructions() const;
    [[nodiscard]] const Options& options() const;

private:
    struct Impl;
    // Shared with handler threads so an abandoned handler never outlives it.
    std::shared_ptr<Impl> impl_;
};

} // namespace mcprt
