#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcprt {

class Context;

using RequestHandler = std::function<nlohmann::json(const nlohmann::json& params, Context& ctx)>;
using NotificationHandler = std::function<void(const nlohmann::json& params, Context& ctx)>;

/// Method name to handler table. Filled while the owning server is being
/// constructed and only read afterwards, so lookups take no lock.
class Router {
public:
    /// Register a request handler for a method. Replaces an earlier one.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a notification handler.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Null when no handler is registered.
    [[nodiscard]] const RequestHandler* find_request(const std::string& method) const;
    [[nodiscard]] const NotificationHandler* find_notification(const std::string& method) const;

    [[nodiscard]] bool has_handler(const std::string& method) const;

    /// Registered request methods, sorted.
    [[nodiscard]] std::vector<std::string> request_methods() const;

private:
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace mcprt
