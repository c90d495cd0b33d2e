#include "mcprt/transport/http_transport.hpp"
#include "mcprt/codec.hpp"
#include "mcprt/error.hpp"
#include "mcprt/version.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>
#include <thread>

namespace mcprt {

namespace {

std::string lower_trimmed(std::string s) {
    const char* ws = " \t";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    s = s.substr(first, s.find_last_not_of(ws) - first + 1);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/// Media type without parameters, e.g. "application/json; charset=utf-8"
/// gives "application/json".
std::string media_type(const std::string& value) {
    return lower_trimmed(value.substr(0, value.find(';')));
}

/// How often a request waiting on its handler checks that the client is
/// still connected.
constexpr std::chrono::milliseconds DISCONNECT_POLL_INTERVAL{50};

/// Nothing is written to the socket until the reply shape is known, so a
/// vanished client is only noticed by polling its connection. Cancels
/// token() once the peer is gone; stops polling on destruction.
class ConnectionWatch {
public:
    explicit ConnectionWatch(const httplib::Request& req)
        : thread_([&req, disconnected = disconnected_, stop = stop_.token()]() mutable {
              while (!stop.wait_for(DISCONNECT_POLL_INTERVAL)) {
                  if (req.is_connection_closed()) {
                      spdlog::info("HTTP client disconnected, cancelling its request");
                      disconnected.cancel();
                      return;
                  }
              }
          }) {}

    ~ConnectionWatch() {
        stop_.cancel();
        thread_.join();
    }

    ConnectionWatch(const ConnectionWatch&) = delete;
    ConnectionWatch& operator=(const ConnectionWatch&) = delete;

    [[nodiscard]] CancellationToken token() const { return disconnected_.token(); }

private:
    CancellationSource disconnected_;
    CancellationSource stop_;
    std::thread thread_;
};

std::string header_or(const HttpHeaders& headers, const std::string& name,
                      const std::string& fallback = {}) {
    auto it = headers.find(name);
    return it == headers.end() ? fallback : it->second;
}

} // anonymous namespace

HttpTransport::HttpTransport(McpServer& server, Options opts)
    : server_(server)
    , opts_(std::move(opts))
    , http_(std::make_unique<httplib::Server>()) {
}

HttpTransport::~HttpTransport() {
    shutdown();
}

// ---------- Validation ----------

std::set<std::string> HttpTransport::required_accept_types() const {
    return {MEDIA_TYPE_JSON};
}

std::optional<HttpResult> HttpTransport::check_accept(const HttpHeaders& headers) const {
    std::set<std::string> accepted;
    std::istringstream in(header_or(headers, "Accept"));
    std::string item;
    while (std::getline(in, item, ',')) accepted.insert(media_type(item));

    const auto needed = required_accept_types();
    if (std::includes(accepted.begin(), accepted.end(), needed.begin(), needed.end())) {
        return std::nullopt;
    }

    std::string list;
    for (const auto& type : needed) {
        if (!list.empty()) list += " and ";
        list += type;
    }
    return error_result(406, ErrorKind::InvalidRequest,
                        "Not Acceptable: Client must accept " + list);
}

std::optional<HttpResult> HttpTransport::check_content_type(const HttpHeaders& headers) {
    if (media_type(header_or(headers, "Content-Type")) == MEDIA_TYPE_JSON) return std::nullopt;
    return error_result(415, ErrorKind::InvalidRequest,
                        std::string("Unsupported Media Type: Content-Type must be ") + MEDIA_TYPE_JSON);
}

std::optional<HttpResult> HttpTransport::check_protocol_version(const HttpHeaders& headers,
                                                                const std::string& body) {
    // Version negotiation happens inside initialize itself.
    if (Codec::is_initialize_request(body)) return std::nullopt;

    const auto version = header_or(headers, MCP_PROTOCOL_VERSION_HEADER,
                                   std::string(DEFAULT_NEGOTIATED_VERSION));
    if (is_supported_protocol_version(version)) return std::nullopt;

    std::string supported;
    for (auto v : SUPPORTED_PROTOCOL_VERSIONS) {
        if (!supported.empty()) supported += ", ";
        supported += std::string(v);
    }
    return error_result(400, ErrorKind::InvalidRequest,
                        "Bad Request: Unsupported protocol version: " + version
                            + ". Supported versions: " + supported);
}

HttpResult HttpTransport::unsupported_method() {
    HttpResult result;
    result.status = 405;
    result.headers["Allow"] = "POST";
    result.headers["Content-Type"] = MEDIA_TYPE_JSON;
    return result;
}

HttpResult HttpTransport::error_result(int status, ErrorKind kind, const std::string& detail) {
    spdlog::debug("HTTP {}: {}", status, detail);
    HttpResult result;
    result.status = status;
    result.body = Codec::serialize(Codec::build_error(kind, std::nullopt, detail));
    result.content_type = MEDIA_TYPE_JSON;
    return result;
}

HttpResult HttpTransport::to_http(const HandleResult& handled) {
    HttpResult result;
    if (std::holds_alternative<NoMessage>(handled)) {
        result.status = 202;
        return result;
    }

    result.body = std::get<std::string>(handled);
    result.content_type = MEDIA_TYPE_JSON;

    // Error responses carry their classification into the status line.
    auto doc = nlohmann::json::parse(result.body, nullptr, false);
    if (doc.is_object()) {
        auto err = doc.find("error");
        if (err != doc.end() && err->is_object() && err->contains("code")
            && (*err)["code"].is_number_integer()) {
            result.status = code_to_http_status((*err)["code"].get<int>());
        }
    }
    return result;
}

// ---------- Dispatch ----------

HttpResult HttpTransport::handle_post(const HttpHeaders& headers, const std::string& body,
                                      std::any scope, Send send,
                                      const CancellationToken& cancel) {
    if (auto rejected = check_accept(headers)) return std::move(*rejected);
    if (auto rejected = check_content_type(headers)) return std::move(*rejected);
    if (auto rejected = check_protocol_version(headers, body)) return std::move(*rejected);

    try {
        return to_http(server_.handle(body, std::move(send), std::move(scope), cancel));
    } catch (const InvalidMessageError& e) {
        spdlog::warn("Rejected HTTP message: {}", e.what());
        HttpResult result;
        result.status = 400;
        result.body = e.response();
        result.content_type = MEDIA_TYPE_JSON;
        return result;
    }
}

HttpResult HttpTransport::dispatch(const std::string& method, const HttpHeaders& headers,
                                   const std::string& body, std::any scope,
                                   const CancellationToken& cancel) {
    if (method != "POST") return unsupported_method();
    return handle_post(headers, body, std::move(scope), nullptr, cancel);
}

// ---------- Listener ----------

void HttpTransport::write_result(HttpResult result, httplib::Response& res) const {
    res.status = result.status;
    for (const auto& [name, value] : result.headers) res.set_header(name, value);

    if (result.stream) {
        auto stream = result.stream;
        res.set_chunked_content_provider(
            MEDIA_TYPE_SSE,
            [stream](size_t /*offset*/, httplib::DataSink& sink) -> bool {
                std::string event;
                switch (stream->next(event)) {
                case EventStream::Next::Event:
                    return sink.write(event.data(), event.size());
                case EventStream::Next::Ping:
                    return sink.write(EventStream::PING_EVENT, std::strlen(EventStream::PING_EVENT));
                case EventStream::Next::End:
                    sink.done();
                    return true;
                }
                return false;
            },
            [stream](bool success) {
                if (!success) {
                    spdlog::info("SSE client disconnected, cancelling its request");
                    stream->cancel();
                }
            });
        return;
    }

    if (!result.content_type.empty()) res.set_content(result.body, result.content_type);
}

void HttpTransport::setup_routes() {
    auto handler = [this](const httplib::Request& req, httplib::Response& res) {
        HttpHeaders headers;
        for (const auto& [name, value] : req.headers) headers.emplace(name, value);
        HttpResult result;
        {
            ConnectionWatch watch(req);
            result = dispatch(req.method, headers, req.body, {}, watch.token());
        }
        write_result(std::move(result), res);
    };

    const std::string& path = opts_.mcp_path;
    http_->Post(path, handler);
    http_->Get(path, handler);
    http_->Put(path, handler);
    http_->Patch(path, handler);
    http_->Delete(path, handler);
}

void HttpTransport::start() {
    if (running_.exchange(true)) return;

    setup_routes();

    int port = -1;
    if (opts_.port == 0) {
        port = http_->bind_to_any_port(opts_.host);
    } else if (http_->bind_to_port(opts_.host, opts_.port)) {
        port = opts_.port;
    }
    if (port < 0) {
        running_ = false;
        throw McpTransportError("Failed to bind HTTP server on " + opts_.host + ":"
                                + std::to_string(opts_.port));
    }
    {
        std::lock_guard<std::mutex> lock(ready_mutex_);
        bound_port_ = port;
    }
    ready_cv_.notify_all();
    spdlog::info("MCP endpoint listening on http://{}:{}{}", opts_.host, port, opts_.mcp_path);

    if (!http_->listen_after_bind() && running_) {
        running_ = false;
        throw McpTransportError("HTTP server on " + opts_.host + ":" + std::to_string(port)
                                + " stopped unexpectedly");
    }
}

void HttpTransport::shutdown() {
    if (!running_.exchange(false)) return;

    // stop() does nothing until the accept loop is up, so give a freshly
    // bound listener a moment to get there.
    bool bound = false;
    {
        std::lock_guard<std::mutex> lock(ready_mutex_);
        bound = bound_port_ >= 0;
    }
    for (int i = 0; bound && i < 200 && !http_->is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    http_->stop();
    spdlog::info("MCP HTTP endpoint stopped");
}

bool HttpTransport::is_connected() const {
    return running_;
}

bool HttpTransport::wait_until_ready(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(ready_mutex_);
    return ready_cv_.wait_for(lock, timeout, [this] { return bound_port_ >= 0; });
}

uint16_t HttpTransport::port() const {
    std::lock_guard<std::mutex> lock(ready_mutex_);
    return bound_port_ >= 0 ? static_cast<uint16_t>(bound_port_) : opts_.port;
}

} // namespace mcprt
