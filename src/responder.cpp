#include "mcprt/responder.hpp"
#include "mcprt/codec.hpp"
#include <spdlog/spdlog.h>

namespace mcprt {

namespace {

std::optional<ProgressToken> extract_progress_token(const JsonRpcRequest& request) {
    if (!request.params || !request.params->is_object()) return std::nullopt;
    auto meta = request.params->find("_meta");
    if (meta == request.params->end() || !meta->is_object()) return std::nullopt;
    auto token = meta->find("progressToken");
    if (token == meta->end()) return std::nullopt;
    if (token->is_number_integer()) return ProgressToken{token->get<int64_t>()};
    if (token->is_string()) return ProgressToken{token->get<std::string>()};
    return std::nullopt;
}

} // anonymous namespace

Responder::Responder(const JsonRpcRequest& request, Send send,
                     std::shared_ptr<IdleWatchdog> watchdog)
    : id_(request.id)
    , progress_token_(extract_progress_token(request))
    , send_(std::move(send))
    , watchdog_(std::move(watchdog)) {
}

bool Responder::send_notification(const std::string& method,
                                  std::optional<nlohmann::json> params) {
    if (!send_) {
        spdlog::debug("Dropping notification {}: transport is unidirectional", method);
        return false;
    }

    JsonRpcNotification notif;
    notif.method = method;
    notif.params = std::move(params);
    std::string encoded = Codec::serialize(notif);

    std::lock_guard<std::mutex> lock(mutex_);
    if (terminated_) {
        spdlog::debug("Dropping notification {}: request {} already answered",
                      method, request_id_to_string(id_));
        return false;
    }
    // Outgoing progress counts as activity.
    if (watchdog_) watchdog_->reset();
    try {
        send_(encoded);
    } catch (const McpTransportError& e) {
        spdlog::warn("Notification {} not delivered: {}", method, e.what());
        return false;
    }
    ++sent_;
    return true;
}

std::optional<ProgressToken> Responder::report_progress(double progress,
                                                        std::optional<double> total,
                                                        std::optional<std::string> message) {
    if (!progress_token_) {
        spdlog::warn("report_progress failed: request {} carries no progress token",
                     request_id_to_string(id_));
        return std::nullopt;
    }

    nlohmann::json params;
    std::visit([&params](const auto& v) { params["progressToken"] = v; }, *progress_token_);
    params["progress"] = progress;
    if (total) params["total"] = *total;
    if (message) params["message"] = *message;

    if (!send_notification("notifications/progress", std::move(params))) {
        return std::nullopt;
    }
    return progress_token_;
}

void Responder::resolve(nlohmann::json result) {
    JsonRpcResponse resp;
    resp.id = id_;
    resp.result = std::move(result);
    terminate(std::move(resp));
}

void Responder::reject(ErrorKind kind, std::optional<std::string> detail) {
    terminate(Codec::build_error(kind, id_, std::move(detail)));
}

void Responder::terminate(JsonRpcResponse response) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminated_) {
        throw ResponderError("Request " + request_id_to_string(id_) + " already has an outcome");
    }
    terminated_ = true;
    outcome_ = std::move(response);
}

bool Responder::terminated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminated_;
}

size_t Responder::notifications_sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
}

JsonRpcResponse Responder::outcome() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!outcome_) {
        throw ResponderError("Request " + request_id_to_string(id_) + " has no outcome yet");
    }
    return *outcome_;
}

} // namespace mcprt
