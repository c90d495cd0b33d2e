#pragma once
#include <array>
#include <string_view>

namespace mcprt {

constexpr std::string_view LIBRARY_VERSION     = "0.1.0";
/// Latest supported revision, offered when the client asks for an unknown one.
constexpr std::string_view PROTOCOL_VERSION    = "2025-11-25";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

/// Assumed when an HTTP client omits the MCP-Protocol-Version header.
constexpr std::string_view DEFAULT_NEGOTIATED_VERSION = "2025-03-26";

constexpr std::array<std::string_view, 4> SUPPORTED_PROTOCOL_VERSIONS = {
    "2024-11-05", "2025-03-26", "2025-06-18", "2025-11-25"
};

inline bool is_supported_protocol_version(std::string_view v) {
    for (auto s : SUPPORTED_PROTOCOL_VERSIONS) {
        if (s == v) return true;
    }
    return false;
}

} // namespace mcprt
