#include "mcprt/router.hpp"
#include <algorithm>

namespace mcprt {

void Router::on_request(const std::string& method, RequestHandler handler) {
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    notification_handlers_[method] = std::move(handler);
}

const RequestHandler* Router::find_request(const std::string& method) const {
    auto it = request_handlers_.find(method);
    return it == request_handlers_.end() ? nullptr : &it->second;
}

const NotificationHandler* Router::find_notification(const std::string& method) const {
    auto it = notification_handlers_.find(method);
    return it == notification_handlers_.end() ? nullptr : &it->second;
}

bool Router::has_handler(const std::string& method) const {
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

std::vector<std::string> Router::request_methods() const {
    std::vector<std::string> methods;
    methods.reserve(request_handlers_.size());
    for (const auto& [name, handler] : request_handlers_) methods.push_back(name);
    std::sort(methods.begin(), methods.end());
    return methods;
}

} // namespace mcprt
