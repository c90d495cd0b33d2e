#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include "limiter.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace mcprt {

/// Transport-provided sink for messages pushed before the final response.
using Send = std::function<void(const std::string& message)>;

using ProgressToken = std::variant<int64_t, std::string>;

/// Per-request mediator between outgoing notifications and the single
/// terminal outcome. Notifications and termination are serialized, so a
/// transport never sees a notification after the final response.
class Responder {
public:
    Responder(const JsonRpcRequest& request, Send send,
              std::shared_ptr<IdleWatchdog> watchdog = nullptr);

    Responder(const Responder&) = delete;
    Responder& operator=(const Responder&) = delete;

    /// Push a notification to the transport right away. Returns false when it
    /// was dropped (no send callback, already terminated, or transport gone).
    bool send_notification(const std::string& method,
                           std::optional<nlohmann::json> params = std::nullopt);

    /// Send notifications/progress for the request's progress token.
    /// Returns the token, or nullopt if the request carried none or the
    /// notification was dropped.
    std::optional<ProgressToken> report_progress(double progress,
                                                 std::optional<double> total = std::nullopt,
                                                 std::optional<std::string> message = std::nullopt);

    /// Terminal outcomes. A second call throws ResponderError.
    void resolve(nlohmann::json result);
    void reject(ErrorKind kind, std::optional<std::string> detail = std::nullopt);

    [[nodiscard]] bool terminated() const;
    [[nodiscard]] bool can_notify() const noexcept { return static_cast<bool>(send_); }
    [[nodiscard]] size_t notifications_sent() const;
    [[nodiscard]] const RequestId& request_id() const noexcept { return id_; }
    [[nodiscard]] const std::optional<ProgressToken>& progress_token() const noexcept { return progress_token_; }

    /// The terminal response. Throws ResponderError before termination.
    [[nodiscard]] JsonRpcResponse outcome() const;

private:
    void terminate(JsonRpcResponse response);

    RequestId id_;
    std::optional<ProgressToken> progress_token_;
    Send send_;
    std::shared_ptr<IdleWatchdog> watchdog_;

    mutable std::mutex mutex_;
    bool terminated_{false};
    size_t sent_{0};
    std::optional<JsonRpcResponse> outcome_;
};

} // namespace mcprt
