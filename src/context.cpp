#include "mcprt/context.hpp"
#include <spdlog/spdlog.h>

namespace mcprt {

namespace {
thread_local Context* current_context = nullptr;
}

Context::Context(JsonRpcMessage message,
                 std::any scope,
                 std::shared_ptr<Responder> responder,
                 std::shared_ptr<IdleWatchdog> watchdog,
                 CancellationToken cancellation)
    : message_(std::move(message))
    , scope_(std::move(scope))
    , responder_(std::move(responder))
    , watchdog_(std::move(watchdog))
    , cancellation_(std::move(cancellation)) {
}

void Context::reset_idle() {
    if (watchdog_) watchdog_->reset();
}

void Context::throw_if_cancelled() const {
    if (cancellation_.is_cancelled()) {
        throw McpCancelledError("Request cancelled");
    }
}

ContextManager::Guard::Guard(Context& ctx)
    : previous_(current_context) {
    current_context = &ctx;
}

ContextManager::Guard::~Guard() {
    current_context = previous_;
}

Context& ContextManager::get() const {
    if (!current_context) {
        ContextError err("No Context: called get outside of an active context");
        spdlog::error("{}", err.what());
        throw err;
    }
    return *current_context;
}

bool ContextManager::has_active() const noexcept {
    return current_context != nullptr;
}

const std::any& ContextManager::get_scope() const {
    const auto& scope = get().scope();
    if (!scope.has_value()) {
        throw ContextError("Scope is not available in current context");
    }
    return scope;
}

Responder& ContextManager::get_responder() const {
    auto* responder = get().responder();
    if (!responder) {
        throw ContextError("Responder is not available in current context");
    }
    return *responder;
}

} // namespace mcprt
