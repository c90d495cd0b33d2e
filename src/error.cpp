#include "mcprt/error.hpp"

namespace mcprt {

std::string_view error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::ParseError:       return "ParseError";
        case ErrorKind::InvalidRequest:   return "InvalidRequest";
        case ErrorKind::MethodNotFound:   return "MethodNotFound";
        case ErrorKind::InvalidParams:    return "InvalidParams";
        case ErrorKind::ResourceNotFound: return "ResourceNotFound";
        case ErrorKind::InternalError:    return "InternalError";
        case ErrorKind::ConnectionClosed: return "ConnectionClosed";
    }
    return "InternalError";
}

} // namespace mcprt
