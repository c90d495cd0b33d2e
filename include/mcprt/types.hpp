#pragma once
#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <nlohmann/json.hpp>

namespace mcprt {

// ---------- Content ----------

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

struct ImageContent {
    std::string data;       // base64
    std::string mime_type;

    bool operator==(const ImageContent& o) const {
        return data == o.data && mime_type == o.mime_type;
    }
};

/// Resource contents as returned by resources/read and embedded in content.
struct ResourceContent {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // base64

    bool operator==(const ResourceContent& o) const {
        return uri == o.uri && mime_type == o.mime_type && text == o.text
               && blob == o.blob;
    }
};

struct EmbeddedResource {
    ResourceContent resource;

    bool operator==(const EmbeddedResource& o) const { return resource == o.resource; }
};

using Content = std::variant<TextContent, ImageContent, EmbeddedResource>;

// ---------- Tool ----------

struct ToolDefinition {
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    nlohmann::json input_schema = nlohmann::json{{"type", "object"}};
    std::optional<nlohmann::json> output_schema;
    std::optional<nlohmann::json> annotations;
    std::optional<nlohmann::json> meta;

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && title == o.title && description == o.description
               && input_schema == o.input_schema && output_schema == o.output_schema
               && annotations == o.annotations && meta == o.meta;
    }
};

/// Result of tools/call. is_error marks an operation that failed while the
/// call itself succeeded at the protocol level.
struct CallToolResult {
    std::vector<Content> content;
    std::optional<nlohmann::json> structured_content;
    bool is_error = false;

    static CallToolResult text(std::string text) {
        CallToolResult r;
        r.content.push_back(TextContent{std::move(text)});
        return r;
    }

    static CallToolResult error(std::string message) {
        CallToolResult r = text(std::move(message));
        r.is_error = true;
        return r;
    }

    bool operator==(const CallToolResult& o) const {
        return content == o.content && structured_content == o.structured_content
               && is_error == o.is_error;
    }
};

// ---------- Resource ----------

struct ResourceDefinition {
    std::string uri;
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;
    std::optional<nlohmann::json> annotations;

    bool operator==(const ResourceDefinition& o) const {
        return uri == o.uri && name == o.name && title == o.title
               && description == o.description && mime_type == o.mime_type
               && annotations == o.annotations;
    }
};

struct ResourceTemplate {
    std::string uri_template;
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;
    std::optional<nlohmann::json> annotations;

    bool operator==(const ResourceTemplate& o) const {
        return uri_template == o.uri_template && name == o.name && title == o.title
               && description == o.description && mime_type == o.mime_type
               && annotations == o.annotations;
    }
};

// ---------- Prompt ----------

struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;

    bool operator==(const PromptArgument& o) const {
        return name == o.name && description == o.description && required == o.required;
    }
};

struct PromptDefinition {
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;

    bool operator==(const PromptDefinition& o) const {
        return name == o.name && title == o.title && description == o.description
               && arguments == o.arguments;
    }
};

struct PromptMessage {
    std::string role;  // "user" or "assistant"
    Content content;

    bool operator==(const PromptMessage& o) const {
        return role == o.role && content == o.content;
    }
};

struct GetPromptResult {
    std::optional<std::string> description;
    std::vector<PromptMessage> messages;

    bool operator==(const GetPromptResult& o) const {
        return description == o.description && messages == o.messages;
    }
};

// ---------- Lifecycle ----------

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;
    std::optional<nlohmann::json> resources;
    std::optional<nlohmann::json> prompts;

    bool operator==(const ServerCapabilities& o) const {
        return tools == o.tools && resources == o.resources && prompts == o.prompts;
    }
};

struct Implementation {
    std::string name;
    std::optional<std::string> title;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && title == o.title && version == o.version;
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;

    bool operator==(const InitializeResult& o) const {
        return protocol_version == o.protocol_version && capabilities == o.capabilities
               && server_info == o.server_info && instructions == o.instructions;
    }
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);
void to_json(nlohmann::json& j, const ImageContent& t);
void from_json(const nlohmann::json& j, ImageContent& t);
void to_json(nlohmann::json& j, const ResourceContent& t);
void from_json(const nlohmann::json& j, ResourceContent& t);
void to_json(nlohmann::json& j, const EmbeddedResource& t);
void from_json(const nlohmann::json& j, EmbeddedResource& t);
void to_json(nlohmann::json& j, const Content& c);
void from_json(const nlohmann::json& j, Content& c);

void to_json(nlohmann::json& j, const ToolDefinition& t);
void from_json(const nlohmann::json& j, ToolDefinition& t);
void to_json(nlohmann::json& j, const CallToolResult& t);
void from_json(const nlohmann::json& j, CallToolResult& t);

void to_json(nlohmann::json& j, const ResourceDefinition& t);
void from_json(const nlohmann::json& j, ResourceDefinition& t);
void to_json(nlohmann::json& j, const ResourceTemplate& t);
void from_json(const nlohmann::json& j, ResourceTemplate& t);

void to_json(nlohmann::json& j, const PromptArgument& t);
void from_json(const nlohmann::json& j, PromptArgument& t);
void to_json(nlohmann::json& j, const PromptDefinition& t);
void from_json(const nlohmann::json& j, PromptDefinition& t);
void to_json(nlohmann::json& j, const PromptMessage& t);
void from_json(const nlohmann::json& j, PromptMessage& t);
void to_json(nlohmann::json& j, const GetPromptResult& t);
void from_json(const nlohmann::json& j, GetPromptResult& t);

void to_json(nlohmann::json& j, const ServerCapabilities& t);
void from_json(const nlohmann::json& j, ServerCapabilities& t);
void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);
void to_json(nlohmann::json& j, const InitializeResult& t);
void from_json(const nlohmann::json& j, InitializeResult& t);

} // namespace mcprt
