#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace mcprt {

/// Semantic error classification. Each kind maps to exactly one JSON-RPC code.
enum class ErrorKind {
    ParseError,
    InvalidRequest,
    MethodNotFound,
    InvalidParams,
    ResourceNotFound,
    InternalError,
    ConnectionClosed
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
    constexpr int ResourceNotFound = -32002;
    constexpr int ConnectionClosed = -32000;
} // namespace error

constexpr int error_kind_to_code(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::ParseError:       return error::ParseError;
        case ErrorKind::InvalidRequest:   return error::InvalidRequest;
        case ErrorKind::MethodNotFound:   return error::MethodNotFound;
        case ErrorKind::InvalidParams:    return error::InvalidParams;
        case ErrorKind::ResourceNotFound: return error::ResourceNotFound;
        case ErrorKind::InternalError:    return error::InternalError;
        case ErrorKind::ConnectionClosed: return error::ConnectionClosed;
    }
    return error::InternalError;
}

/// Canonical JSON-RPC message text for a kind.
constexpr std::string_view error_kind_message(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::ParseError:       return "Parse error";
        case ErrorKind::InvalidRequest:   return "Invalid Request";
        case ErrorKind::MethodNotFound:   return "Method not found";
        case ErrorKind::InvalidParams:    return "Invalid params";
        case ErrorKind::ResourceNotFound: return "Resource not found";
        case ErrorKind::InternalError:    return "Internal error";
        case ErrorKind::ConnectionClosed: return "Connection closed";
    }
    return "Internal error";
}

/// Unknown codes classify as InternalError.
constexpr ErrorKind error_kind_from_code(int code) noexcept {
    switch (code) {
        case error::ParseError:       return ErrorKind::ParseError;
        case error::InvalidRequest:   return ErrorKind::InvalidRequest;
        case error::MethodNotFound:   return ErrorKind::MethodNotFound;
        case error::InvalidParams:    return ErrorKind::InvalidParams;
        case error::ResourceNotFound: return ErrorKind::ResourceNotFound;
        case error::ConnectionClosed: return ErrorKind::ConnectionClosed;
        default:                      return ErrorKind::InternalError;
    }
}

constexpr int code_to_http_status(int code) noexcept {
    switch (code) {
        case error::ParseError:
        case error::InvalidRequest:
        case error::InvalidParams:    return 400;
        case error::MethodNotFound:
        case error::ResourceNotFound: return 404;
        case error::ConnectionClosed: return 499;
        default:                      return 500;
    }
}

std::string_view error_kind_name(ErrorKind kind) noexcept;

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Envelope-level decode failure (ParseError or InvalidRequest).
class McpParseError : public McpError {
public:
    ErrorKind kind;
    explicit McpParseError(const std::string& msg, ErrorKind kind = ErrorKind::ParseError)
        : McpError(msg), kind(kind) {}
};

class McpProtocolError : public McpError {
public:
    ErrorKind kind;
    int code;
    McpProtocolError(ErrorKind kind, const std::string& msg)
        : McpError(msg), kind(kind), code(error_kind_to_code(kind)) {}
};

/// Raised by McpServer::handle() when the envelope itself cannot be decoded.
/// The response body carries no usable id, so transports decide how to present it.
class InvalidMessageError : public McpError {
public:
    InvalidMessageError(const std::string& msg, ErrorKind kind, std::string response)
        : McpError(msg), kind_(kind), response_(std::move(response)) {}

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& response() const noexcept { return response_; }

private:
    ErrorKind kind_;
    std::string response_;
};

class McpEncodeError : public McpError {
public:
    using McpError::McpError;
};

class ContextError : public McpError {
public:
    using McpError::McpError;
};

class ResponderError : public McpError {
public:
    using McpError::McpError;
};

class McpCancelledError : public McpError {
public:
    using McpError::McpError;
};

/// Business-logic failure reported by a tool. Answered as a successful
/// tools/call result with isError set, never as a JSON-RPC error.
class ToolError : public McpError {
public:
    using McpError::McpError;
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

class McpTimeoutError : public McpError {
public:
    using McpError::McpError;
};

} // namespace mcprt
