#include "mcprt/server.hpp"
#include "mcprt/codec.hpp"
#include "mcprt/error.hpp"
#include "mcprt/router.hpp"
#include "mcprt/version.hpp"
#include "mcprt/worker_pool.hpp"
#include <spdlog/spdlog.h>

#include <condition_variable>
#include <exception>
#include <future>
#include <mutex>
#include <system_error>
#include <vector>

namespace mcprt {

namespace {

/// Completion state shared between the waiting caller and the handler thread.
struct Invocation {
    std::mutex mutex;
    std::condition_variable cv;
    bool done{false};
    nlohmann::json result;
    std::exception_ptr error;

    void complete(nlohmann::json value) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            result = std::move(value);
            done = true;
        }
        cv.notify_all();
    }

    void fail(std::exception_ptr e) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            error = std::move(e);
            done = true;
        }
        cv.notify_all();
    }

    void wake() {
        // Taking the lock orders the wake-up after any in-progress predicate check.
        { std::lock_guard<std::mutex> lock(mutex); }
        cv.notify_all();
    }

    bool wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [this] { return done; });
    }
};

enum class Ending { Completed, TimedOut, Disconnected };

/// Block until the handler finishes, the caller cancels, or the idle window
/// closes. Resets push the deadline out, so it is re-read on every wake-up.
Ending await_handler(Invocation& inv, const IdleWatchdog& watchdog,
                     const CancellationToken& caller) {
    for (;;) {
        const auto deadline = watchdog.deadline();
        {
            std::unique_lock<std::mutex> lock(inv.mutex);
            inv.cv.wait_until(lock, deadline, [&] {
                return inv.done || caller.is_cancelled();
            });
            if (inv.done) return Ending::Completed;
        }
        if (caller.is_cancelled()) return Ending::Disconnected;
        if (watchdog.expired()) return Ending::TimedOut;
    }
}

nlohmann::json params_or_empty(const std::optional<nlohmann::json>& params) {
    return params ? *params : nlohmann::json::object();
}

} // anonymous namespace

// ----------- McpServer::Impl -----------

struct McpServer::Impl {
    Options opts;
    Router router;
    Limiter limiter;
    ContextManager context;

    ToolRegistry tools;
    PromptRegistry prompts;
    ResourceRegistry resources;

    // Declared last so it is stopped, and its handlers joined, before the
    // state they use goes away.
    WorkerPool handlers;

    explicit Impl(Options o)
        : opts(std::move(o))
        , limiter(opts.idle_timeout, opts.max_concurrency, opts.acquire_timeout)
        , handlers(opts.max_concurrency) {
        setup_handlers();
    }

    ServerCapabilities build_capabilities() const {
        ServerCapabilities caps;
        if (!tools.empty()) caps.tools = nlohmann::json{{"listChanged", false}};
        if (!prompts.empty()) caps.prompts = nlohmann::json{{"listChanged", false}};
        if (!resources.empty()) {
            caps.resources = nlohmann::json{{"subscribe", false}, {"listChanged", false}};
        }
        return caps;
    }

    void setup_handlers() {
        router.on_request("initialize", [this](const nlohmann::json& params, Context&) {
            const auto requested = params.value("protocolVersion", std::string{});
            InitializeResult result;
            result.protocol_version = is_supported_protocol_version(requested)
                                          ? requested
                                          : std::string(PROTOCOL_VERSION);
            if (result.protocol_version != requested) {
                spdlog::info("Client requested protocol {}, offering {}",
                             requested, result.protocol_version);
            }
            result.capabilities = build_capabilities();
            result.server_info = opts.server_info;
            result.instructions = opts.instructions;
            return nlohmann::json(result);
        });

        router.on_request("ping", [](const nlohmann::json&, Context&) {
            return nlohmann::json::object();
        });

        router.on_request("shutdown", [](const nlohmann::json&, Context&) {
            spdlog::info("Client requested shutdown");
            return nlohmann::json::object();
        });

        router.on_request("tools/list", [this](const nlohmann::json&, Context&) {
            return nlohmann::json{{"tools", tools.list()}};
        });

        router.on_request("tools/call", [this](const nlohmann::json& params, Context&) {
            const auto name = params.at("name").get<std::string>();
            const auto arguments = params.value("arguments", nlohmann::json::object());
            return nlohmann::json(tools.call(name, arguments));
        });

        router.on_request("prompts/list", [this](const nlohmann::json&, Context&) {
            return nlohmann::json{{"prompts", prompts.list()}};
        });

        router.on_request("prompts/get", [this](const nlohmann::json& params, Context&) {
            const auto name = params.at("name").get<std::string>();
            const auto arguments = params.value("arguments", nlohmann::json::object());
            return nlohmann::json(prompts.get(name, arguments));
        });

        router.on_request("resources/list", [this](const nlohmann::json&, Context&) {
            return nlohmann::json{{"resources", resources.list()}};
        });

        router.on_request("resources/templates/list", [this](const nlohmann::json&, Context&) {
            return nlohmann::json{{"resourceTemplates", resources.list_templates()}};
        });

        router.on_request("resources/read", [this](const nlohmann::json& params, Context&) {
            const auto uri = params.at("uri").get<std::string>();
            return nlohmann::json{{"contents", resources.read(uri)}};
        });

        router.on_notification("notifications/initialized", [](const nlohmann::json&, Context&) {
            spdlog::debug("Client initialized");
        });

        // Requests are not tracked across calls, so there is nothing to cancel.
        router.on_notification("notifications/cancelled", [](const nlohmann::json& params, Context&) {
            spdlog::debug("Ignoring cancellation notice: {}", params.dump());
        });
    }

    std::optional<JsonRpcResponse> dispatch(const JsonRpcMessage& msg, const Send& send,
                                            const std::any& scope,
                                            const CancellationToken& cancel) {
        if (const auto* request = std::get_if<JsonRpcRequest>(&msg)) {
            return dispatch_request(*request, msg, send, scope, cancel);
        }
        if (const auto* notification = std::get_if<JsonRpcNotification>(&msg)) {
            dispatch_notification(*notification, msg, scope, cancel);
        }
        return std::nullopt;
    }

    void dispatch_notification(const JsonRpcNotification& notification, const JsonRpcMessage& msg,
                               const std::any& scope, const CancellationToken& cancel) {
        const NotificationHandler* handler = router.find_notification(notification.method);
        if (!handler) {
            spdlog::debug("No handler for notification {}", notification.method);
            return;
        }

        try {
            auto slot = limiter.acquire(cancel);
            Context ctx(msg, scope, nullptr, slot.watchdog(), slot.token());
            ContextManager::Guard guard(ctx);
            (*handler)(params_or_empty(notification.params), ctx);
        } catch (const std::exception& e) {
            // Notifications are never answered, even when their handler fails.
            spdlog::error("Notification handler for {} failed: {}", notification.method, e.what());
        }
    }

    JsonRpcResponse dispatch_request(const JsonRpcRequest& request, const JsonRpcMessage& msg,
                                     const Send& send, const std::any& scope,
                                     const CancellationToken& cancel) {
        spdlog::debug("Handling request {} {}", request_id_to_string(request.id), request.method);

        std::optional<Limiter::Slot> slot;
        try {
            slot.emplace(limiter.acquire(cancel));
        } catch (const McpCancelledError& e) {
            spdlog::warn("Request {} cancelled while queued: {}",
                         request_id_to_string(request.id), e.what());
            return Codec::build_error(ErrorKind::ConnectionClosed, request.id,
                                      std::string("Client disconnected"));
        } catch (const McpTimeoutError& e) {
            spdlog::error("Request {} rejected: {}", request_id_to_string(request.id), e.what());
            return Codec::build_error(ErrorKind::InternalError, request.id,
                                      std::string("concurrency limit wait exceeded"));
        }

        const RequestHandler* handler = router.find_request(request.method);
        if (!handler) {
            spdlog::error("Method not found: {}", request.method);
            return Codec::build_error(ErrorKind::MethodNotFound, request.id);
        }

        auto watchdog = slot->watchdog();
        auto responder = std::make_shared<Responder>(request, send, watchdog);
        auto ctx = std::make_shared<Context>(msg, scope, responder, watchdog, slot->token());
        auto inv = std::make_shared<Invocation>();

        bool queued = false;
        try {
            queued = handlers.submit([fn = *handler, inv, ctx,
                                      params = params_or_empty(request.params)]() {
                // Abandoned handlers can hold every thread; a request answered
                // while it waited for one is not started at all.
                if (ctx->cancellation().is_cancelled()) {
                    inv->fail(std::make_exception_ptr(
                        McpCancelledError("Request cancelled before a worker was free")));
                    return;
                }
                ContextManager::Guard guard(*ctx);
                try {
                    inv->complete(fn(params, *ctx));
                } catch (...) {
                    inv->fail(std::current_exception());
                }
            });
        } catch (const std::system_error& e) {
            spdlog::error("Could not start handler for {}: {}", request.method, e.what());
            return Codec::build_error(ErrorKind::InternalError, request.id, std::string(e.what()));
        }
        if (!queued) {
            return Codec::build_error(ErrorKind::InternalError, request.id,
                                      std::string("Server is shutting down"));
        }

        auto wake = cancel.on_cancel([inv] { inv->wake(); });
        switch (await_handler(*inv, *watchdog, cancel)) {
        case Ending::Completed:
            break;
        case Ending::TimedOut:
            watchdog->fire();
            settle(*inv, request);
            responder->reject(ErrorKind::ConnectionClosed, std::string("Request timed out"));
            return responder->outcome();
        case Ending::Disconnected:
            slot->cancel();
            settle(*inv, request);
            responder->reject(ErrorKind::ConnectionClosed, std::string("Client disconnected"));
            return responder->outcome();
        }

        if (!inv->error) {
            responder->resolve(std::move(inv->result));
            return responder->outcome();
        }

        try {
            std::rethrow_exception(inv->error);
        } catch (const McpProtocolError& e) {
            spdlog::error("{} failed: {}", request.method, e.what());
            responder->reject(e.kind, std::string(e.what()));
        } catch (const McpCancelledError& e) {
            spdlog::warn("{} cancelled: {}", request.method, e.what());
            responder->reject(ErrorKind::ConnectionClosed, std::string(e.what()));
        } catch (const nlohmann::json::exception& e) {
            spdlog::error("Invalid params for {}: {}", request.method, e.what());
            responder->reject(ErrorKind::InvalidParams, std::string(e.what()));
        } catch (const std::exception& e) {
            spdlog::error("Unhandled exception in {}: {}", request.method, e.what());
            if (opts.raise_exceptions) throw;
            responder->reject(ErrorKind::InternalError, std::string(e.what()));
        }
        return responder->outcome();
    }

    /// Give a cancelled handler `cancel_grace` to return, then abandon it.
    void settle(Invocation& inv, const JsonRpcRequest& request) {
        if (!inv.wait_for(opts.cancel_grace)) {
            spdlog::error("Handler for {} ({}) ignored cancellation, abandoning it",
                          request.method, request_id_to_string(request.id));
        }
    }

    std::string encode(const JsonRpcResponse& response) {
        try {
            return Codec::serialize(response);
        } catch (const McpEncodeError& e) {
            spdlog::error("Could not encode response: {}", e.what());
            return Codec::serialize(Codec::build_error(ErrorKind::InternalError, response.id,
                                                       std::string(e.what())));
        }
    }
};

// ----------- McpServer -----------

McpServer::McpServer(Options opts)
    : impl_(std::make_shared<Impl>(std::move(opts))) {
}

McpServer::~McpServer() = default;

HandleResult McpServer::handle(std::string_view message, Send send, std::any scope,
                               const CancellationToken& cancel) {
    Decoded decoded;
    try {
        decoded = Codec::decode(message);
    } catch (const McpParseError& e) {
        spdlog::error("Rejected message: {}", e.what());
        auto response = Codec::build_error(e.kind, Codec::peek_id(message), std::string(e.what()));
        throw InvalidMessageError(e.what(), e.kind, Codec::serialize(response));
    }

    if (auto* single = std::get_if<JsonRpcMessage>(&decoded)) {
        auto response = impl_->dispatch(*single, send, scope, cancel);
        if (!response) return NoMessage::Notification;
        return impl_->encode(*response);
    }

    // Batch elements run side by side; answers keep the order of the requests.
    // Each answer is encoded on its own so one bad result cannot sink the rest.
    auto& batch = std::get<std::vector<BatchItem>>(decoded);
    std::vector<std::future<std::optional<JsonRpcResponse>>> pending(batch.size());
    for (size_t i = 0; i < batch.size(); ++i) {
        if (!batch[i].message) continue;
        const JsonRpcMessage& msg = *batch[i].message;
        pending[i] = std::async(std::launch::async, [this, &msg, &send, &scope, &cancel] {
            return impl_->dispatch(msg, send, scope, cancel);
        });
    }

    std::vector<std::string> encoded;
    for (size_t i = 0; i < batch.size(); ++i) {
        std::optional<JsonRpcResponse> response;
        if (pending[i].valid()) {
            response = pending[i].get();
        } else {
            const auto& err = *batch[i].rejected->error;
            spdlog::error("Rejected batch element {}: {}", i, err.data ? err.data->dump() : err.message);
            response = std::move(batch[i].rejected);
        }
        if (response) encoded.push_back(impl_->encode(*response));
    }
    if (encoded.empty()) return NoMessage::Notification;

    std::string out = "[";
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (i > 0) out += ',';
        out += encoded[i];
    }
    out += ']';
    return out;
}

void McpServer::add_tool(ToolDefinition def, ToolHandler handler) {
    impl_->tools.add(std::move(def), std::move(handler));
}

void McpServer::add_prompt(PromptDefinition def, PromptHandler handler) {
    impl_->prompts.add(std::move(def), std::move(handler));
}

void McpServer::add_resource(ResourceDefinition def, ResourceReadHandler handler) {
    impl_->resources.add(std::move(def), std::move(handler));
}

void McpServer::add_resource_template(ResourceTemplate tmpl, ResourceReadHandler handler) {
    impl_->resources.add_template(std::move(tmpl), std::move(handler));
}

ToolRegistry& McpServer::tools() { return impl_->tools; }
PromptRegistry& McpServer::prompts() { return impl_->prompts; }
ResourceRegistry& McpServer::resources() { return impl_->resources; }

const ContextManager& McpServer::context() const { return impl_->context; }
const Limiter& McpServer::limiter() const { return impl_->limiter; }

const std::string& McpServer::name() const { return impl_->opts.server_info.name; }
const std::string& McpServer::version() const { return impl_->opts.server_info.version; }
const std::optional<std::string>& McpServer::instructions() const { return impl_->opts.instructions; }
const McpServer::Options& McpServer::options() const { return impl_->opts; }

} // namespace mcprt
