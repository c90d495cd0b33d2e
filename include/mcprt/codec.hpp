#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace mcprt {

/// One element of a decoded batch. Exactly one member is set: the message to
/// dispatch, or the error answering an element that failed validation.
struct BatchItem {
    std::optional<JsonRpcMessage> message;
    std::optional<JsonRpcResponse> rejected;
};

/// Result of decoding inbound text: a single message or a batch.
using Decoded = std::variant<JsonRpcMessage, std::vector<BatchItem>>;

class Codec {
public:
    /// Decode an inbound (client to server) message or batch.
    /// Throws McpParseError with kind ParseError on invalid JSON or UTF-8, and
    /// with kind InvalidRequest when the envelope is not a request/notification.
    /// Batch elements are validated one by one: an invalid element becomes a
    /// rejected item carrying its own error, and only an empty batch throws.
    [[nodiscard]] static Decoded decode(std::string_view raw);

    /// Parse raw JSON bytes into a message of any shape, responses included.
    /// Throws McpParseError on invalid JSON or missing required fields.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Parse a batch of messages (JSON array).
    [[nodiscard]] static std::vector<JsonRpcMessage> parse_batch(std::string_view raw);

    /// Serialize a message to a single-line JSON string.
    /// Throws McpEncodeError if the output would not fit on one line.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

    /// Serialize a batch.
    [[nodiscard]] static std::string serialize_batch(const std::vector<JsonRpcMessage>& msgs);

    /// Build an error response. The message is the canonical text for `kind`;
    /// `detail`, when present, is carried in data.detail.
    [[nodiscard]] static JsonRpcResponse build_error(ErrorKind kind,
                                                     std::optional<RequestId> id,
                                                     std::optional<std::string> detail = std::nullopt);

    /// Best-effort check whether `raw` is an initialize request. Never throws.
    [[nodiscard]] static bool is_initialize_request(std::string_view raw) noexcept;

    /// Best-effort extraction of the top-level id of `raw`. Never throws.
    [[nodiscard]] static std::optional<RequestId> peek_id(std::string_view raw) noexcept;

private:
    static nlohmann::json to_document(std::string_view raw);
    static JsonRpcMessage parse_object(const nlohmann::json& j);
    static JsonRpcMessage decode_object(const nlohmann::json& j);
};

} // namespace mcprt
