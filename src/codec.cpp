#include "mcprt/codec.hpp"
#include "mcprt/error.hpp"
#include "mcprt/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace mcprt {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            throw McpParseError("Unsupported JSON value");
    }
}

void check_version(const nlohmann::json& j) {
    if (!j.contains("jsonrpc")) {
        throw McpParseError("Missing 'jsonrpc' field", ErrorKind::InvalidRequest);
    }
    const auto& v = j.at("jsonrpc");
    if (!v.is_string() || v.get<std::string>() != JSONRPC_VERSION) {
        throw McpParseError("Invalid jsonrpc version, expected '2.0'", ErrorKind::InvalidRequest);
    }
}

RequestId read_id(const nlohmann::json& j) {
    const auto& id = j.at("id");
    if (id.is_number_integer()) return RequestId{id.get<int64_t>()};
    if (id.is_string()) return RequestId{id.get<std::string>()};
    throw McpParseError("'id' must be a string or an integer", ErrorKind::InvalidRequest);
}

std::string read_method(const nlohmann::json& j) {
    const auto& m = j.at("method");
    if (!m.is_string()) {
        throw McpParseError("'method' must be a string", ErrorKind::InvalidRequest);
    }
    return m.get<std::string>();
}

std::optional<nlohmann::json> read_params(const nlohmann::json& j) {
    if (!j.contains("params")) return std::nullopt;
    const auto& p = j.at("params");
    if (!p.is_object() && !p.is_array()) {
        throw McpParseError("'params' must be an object or an array", ErrorKind::InvalidRequest);
    }
    return p;
}

/// The id of a message object when it is a usable request id.
std::optional<RequestId> id_of(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find("id");
    if (it == j.end()) return std::nullopt;
    if (it->is_number_integer()) return RequestId{it->get<int64_t>()};
    if (it->is_string()) return RequestId{it->get<std::string>()};
    return std::nullopt;
}

nlohmann::ordered_json id_value(const std::optional<RequestId>& id) {
    if (!id) return nullptr;
    if (const auto* i = std::get_if<int64_t>(&*id)) return *i;
    return std::get<std::string>(*id);
}

// Envelope fields in canonical order: jsonrpc, id, method, params/result/error.
nlohmann::ordered_json envelope(const JsonRpcMessage& msg) {
    nlohmann::ordered_json o;
    o["jsonrpc"] = std::string(JSONRPC_VERSION);
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        o["id"] = id_value(req->id);
        o["method"] = req->method;
        if (req->params) o["params"] = nlohmann::ordered_json(*req->params);
    } else if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        o["method"] = notif->method;
        if (notif->params) o["params"] = nlohmann::ordered_json(*notif->params);
    } else {
        const auto& resp = std::get<JsonRpcResponse>(msg);
        o["id"] = id_value(resp.id);
        if (resp.error) {
            nlohmann::ordered_json err;
            err["code"] = resp.error->code;
            err["message"] = resp.error->message;
            if (resp.error->data) err["data"] = nlohmann::ordered_json(*resp.error->data);
            o["error"] = std::move(err);
        } else {
            o["result"] = resp.result ? nlohmann::ordered_json(*resp.result)
                                      : nlohmann::ordered_json::object();
        }
    }
    return o;
}

std::string dump_line(const nlohmann::ordered_json& j) {
    std::string out;
    try {
        out = j.dump();
    } catch (const nlohmann::json::type_error& e) {
        throw McpEncodeError(std::string("Cannot encode message: ") + e.what());
    }
    // dump() escapes control characters inside strings; anything left would
    // break line framing.
    if (out.find_first_of("\r\n") != std::string::npos) {
        throw McpEncodeError("Encoded message contains a line break");
    }
    return out;
}

} // anonymous namespace

nlohmann::json Codec::to_document(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    try {
        simdjson::ondemand::value val;
        error = doc.get_value().get(val);
        if (error == simdjson::SCALAR_DOCUMENT_AS_VALUE) {
            throw McpParseError("Message must be a JSON object or array", ErrorKind::InvalidRequest);
        }
        if (error) {
            throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
        }
        nlohmann::json j = simdjson_to_nlohmann(val);
        if (!doc.at_end()) {
            throw McpParseError("Trailing content after JSON value");
        }
        return j;
    } catch (const simdjson::simdjson_error& e) {
        throw McpParseError(std::string("JSON parse error: ") + e.what());
    }
}

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    check_version(j);

    bool has_id = j.contains("id");
    bool has_method = j.contains("method");

    if (has_method && has_id) {
        if (j.at("id").is_null()) {
            throw McpParseError("Request ID must not be null", ErrorKind::InvalidRequest);
        }
        JsonRpcRequest req;
        req.id = read_id(j);
        req.method = read_method(j);
        req.params = read_params(j);
        return req;
    } else if (has_method && !has_id) {
        JsonRpcNotification notif;
        notif.method = read_method(j);
        notif.params = read_params(j);
        return notif;
    } else if (has_id && (j.contains("result") || j.contains("error"))) {
        JsonRpcResponse resp;
        if (!j.at("id").is_null()) resp.id = read_id(j);
        try {
            if (j.contains("result")) resp.result = j.at("result");
            if (j.contains("error")) resp.error = j.at("error").get<JsonRpcError>();
        } catch (const nlohmann::json::exception& e) {
            throw McpParseError(std::string("Malformed error object: ") + e.what(),
                                ErrorKind::InvalidRequest);
        }
        return resp;
    }
    throw McpParseError("Cannot determine message type", ErrorKind::InvalidRequest);
}

JsonRpcMessage Codec::decode_object(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw McpParseError("Message must be a JSON object", ErrorKind::InvalidRequest);
    }
    auto msg = parse_object(j);
    if (std::holds_alternative<JsonRpcResponse>(msg)) {
        throw McpParseError("Message to the server must be a request or notification",
                            ErrorKind::InvalidRequest);
    }
    return msg;
}

Decoded Codec::decode(std::string_view raw) {
    nlohmann::json j = to_document(raw);

    if (j.is_array()) {
        if (j.empty()) {
            throw McpParseError("Empty batch", ErrorKind::InvalidRequest);
        }
        std::vector<BatchItem> items;
        items.reserve(j.size());
        for (const auto& element : j) {
            BatchItem item;
            try {
                item.message = decode_object(element);
            } catch (const McpParseError& e) {
                item.rejected = build_error(e.kind, id_of(element), std::string(e.what()));
            }
            items.push_back(std::move(item));
        }
        return items;
    }
    return decode_object(j);
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    nlohmann::json j = to_document(raw);
    if (!j.is_object()) {
        throw McpParseError("Message must be a JSON object", ErrorKind::InvalidRequest);
    }
    return parse_object(j);
}

std::vector<JsonRpcMessage> Codec::parse_batch(std::string_view raw) {
    nlohmann::json j = to_document(raw);
    if (!j.is_array()) {
        throw McpParseError("Batch must be a JSON array", ErrorKind::InvalidRequest);
    }

    std::vector<JsonRpcMessage> messages;
    messages.reserve(j.size());
    for (const auto& item : j) {
        if (!item.is_object()) {
            throw McpParseError("Each batch item must be a JSON object", ErrorKind::InvalidRequest);
        }
        messages.push_back(parse_object(item));
    }
    return messages;
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    return dump_line(envelope(msg));
}

std::string Codec::serialize_batch(const std::vector<JsonRpcMessage>& msgs) {
    nlohmann::ordered_json arr = nlohmann::ordered_json::array();
    for (const auto& msg : msgs) {
        arr.push_back(envelope(msg));
    }
    return dump_line(arr);
}

JsonRpcResponse Codec::build_error(ErrorKind kind,
                                   std::optional<RequestId> id,
                                   std::optional<std::string> detail) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.error = JsonRpcError{
        error_kind_to_code(kind),
        std::string(error_kind_message(kind)),
        std::nullopt
    };
    if (detail && !detail->empty()) {
        resp.error->data = nlohmann::json{{"detail", *detail}};
    }
    return resp;
}

bool Codec::is_initialize_request(std::string_view raw) noexcept {
    auto j = nlohmann::json::parse(raw.begin(), raw.end(), nullptr, false);
    if (!j.is_object()) return false;
    auto it = j.find("method");
    return it != j.end() && it->is_string() && it->get_ref<const std::string&>() == "initialize";
}

std::optional<RequestId> Codec::peek_id(std::string_view raw) noexcept {
    return id_of(nlohmann::json::parse(raw.begin(), raw.end(), nullptr, false));
}

} // namespace mcprt
