#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include "cancellation.hpp"
#include "limiter.hpp"
#include "responder.hpp"
#include <any>
#include <memory>
#include <string>

namespace mcprt {

/// Per-request bundle visible to handler code. Created fresh for every
/// message and never shared between requests.
class Context {
public:
    Context(JsonRpcMessage message,
            std::any scope,
            std::shared_ptr<Responder> responder,
            std::shared_ptr<IdleWatchdog> watchdog,
            CancellationToken cancellation);

    [[nodiscard]] const JsonRpcMessage& message() const noexcept { return message_; }
    /// Opaque value supplied by the caller of handle(); empty if none.
    [[nodiscard]] const std::any& scope() const noexcept { return scope_; }
    /// Null for notifications.
    [[nodiscard]] Responder* responder() const noexcept { return responder_.get(); }

    /// Restart the idle-timeout window.
    void reset_idle();

    [[nodiscard]] const CancellationToken& cancellation() const noexcept { return cancellation_; }
    [[nodiscard]] bool is_cancelled() const { return cancellation_.is_cancelled(); }
    /// Throws McpCancelledError if the request has been cancelled.
    void throw_if_cancelled() const;

private:
    JsonRpcMessage message_;
    std::any scope_;
    std::shared_ptr<Responder> responder_;
    std::shared_ptr<IdleWatchdog> watchdog_;
    CancellationToken cancellation_;
};

/// Access to the context of the handler running on the current thread.
class ContextManager {
public:
    /// Binds a context to the current thread for its lifetime and restores
    /// the previous binding on every exit path.
    class Guard {
    public:
        explicit Guard(Context& ctx);
        ~Guard();

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        Context* previous_;
    };

    [[nodiscard]] Guard active(Context& ctx) const { return Guard{ctx}; }

    /// Throws ContextError outside an active handler.
    [[nodiscard]] Context& get() const;
    [[nodiscard]] bool has_active() const noexcept;

    [[nodiscard]] const JsonRpcMessage& get_message() const { return get().message(); }

    /// Throws ContextError if no scope was supplied.
    [[nodiscard]] const std::any& get_scope() const;

    /// Throws ContextError if the scope is missing or holds another type.
    template <typename T>
    [[nodiscard]] const T& scope_as() const {
        const T* value = std::any_cast<T>(&get_scope());
        if (!value) {
            throw ContextError("Scope has a different type than requested");
        }
        return *value;
    }

    /// Throws ContextError if the current message has no responder.
    [[nodiscard]] Responder& get_responder() const;
};

} // namespace mcprt
