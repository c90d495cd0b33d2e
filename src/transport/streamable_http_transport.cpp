#include "mcprt/transport/streamable_http_transport.hpp"
#include "mcprt/error.hpp"
#include <spdlog/spdlog.h>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <system_error>

namespace mcprt {

namespace {

/// First-event race between "a notification was sent" and "the final
/// response is ready". Whichever happens first fixes the reply shape.
struct Decision {
    std::mutex mutex;
    std::condition_variable cv;
    bool streaming{false};
    std::optional<HttpResult> plain;
};

} // anonymous namespace

HttpTransport::Options StreamableHttpTransport::http_options(const Options& opts) {
    HttpTransport::Options http;
    http.host = opts.host;
    http.port = opts.port;
    http.mcp_path = opts.mcp_path;
    return http;
}

StreamableHttpTransport::StreamableHttpTransport(McpServer& server, Options opts)
    : HttpTransport(server, http_options(opts))
    , ping_interval_(opts.ping_interval)
    , workers_(server.options().max_concurrency) {
}

StreamableHttpTransport::~StreamableHttpTransport() {
    shutdown();
}

std::set<std::string> StreamableHttpTransport::required_accept_types() const {
    return {MEDIA_TYPE_JSON, MEDIA_TYPE_SSE};
}

HttpResult StreamableHttpTransport::dispatch(const std::string& method,
                                             const HttpHeaders& headers,
                                             const std::string& body,
                                             std::any scope,
                                             const CancellationToken& cancel) {
    if (method != "POST") return unsupported_method();
    if (shutdown_.is_cancelled()) {
        return error_result(503, ErrorKind::InternalError, "Server is shutting down");
    }

    auto stream = std::make_shared<EventStream>(ping_interval_);
    auto decision = std::make_shared<Decision>();

    Send send = [stream, decision](const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(decision->mutex);
            decision->streaming = true;
        }
        decision->cv.notify_all();
        stream->push(message);
    };

    bool queued = false;
    try {
        queued = workers_.submit([this, stream, decision, send = std::move(send), headers, body,
                                  scope = std::move(scope), outer = cancel]() mutable {
            // The handler stops when the caller, the SSE client or the
            // transport itself goes away.
            CancellationSource request_cancel;
            auto cancel_request = [request_cancel]() mutable { request_cancel.cancel(); };
            auto on_outer = outer.on_cancel(cancel_request);
            auto on_disconnect = stream->token().on_cancel(cancel_request);
            auto on_shutdown = shutdown_.token().on_cancel(cancel_request);

            HttpResult result;
            try {
                result = handle_post(headers, body, std::move(scope), std::move(send),
                                     request_cancel.token());
            } catch (const std::exception& e) {
                spdlog::error("Unhandled exception while serving HTTP request: {}", e.what());
                result = error_result(500, ErrorKind::InternalError, e.what());
            }

            bool streamed = false;
            {
                std::lock_guard<std::mutex> lock(decision->mutex);
                streamed = decision->streaming;
                if (!streamed) decision->plain = std::move(result);
            }
            if (streamed) {
                stream->finish(result.body);
            } else {
                decision->cv.notify_all();
            }
        });
    } catch (const std::system_error& e) {
        spdlog::error("Could not start HTTP handler: {}", e.what());
        return error_result(500, ErrorKind::InternalError, e.what());
    }
    if (!queued) {
        return error_result(503, ErrorKind::InternalError, "Server is shutting down");
    }

    std::unique_lock<std::mutex> lock(decision->mutex);
    decision->cv.wait(lock, [&] { return decision->streaming || decision->plain.has_value(); });
    if (decision->plain) return std::move(*decision->plain);

    spdlog::debug("Upgrading reply to an event stream");
    HttpResult sse;
    sse.status = 200;
    sse.content_type = MEDIA_TYPE_SSE;
    sse.headers["Cache-Control"] = "no-cache, no-transform";
    sse.headers["Connection"] = "keep-alive";
    sse.stream = std::move(stream);
    return sse;
}

void StreamableHttpTransport::shutdown() {
    shutdown_.cancel();
    HttpTransport::shutdown();
    workers_.stop();
}

size_t StreamableHttpTransport::in_flight() const {
    return workers_.busy();
}

} // namespace mcprt
