#include "mcprt/types.hpp"
#include <stdexcept>

namespace mcprt {

namespace {

template <typename T>
void put(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

template <typename T>
void take(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) out = it->template get<T>();
}

} // namespace

// ---------- Content ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    t.text = j.at("text").get<std::string>();
}

void to_json(nlohmann::json& j, const ImageContent& t) {
    j = {{"type", "image"}, {"data", t.data}, {"mimeType", t.mime_type}};
}

void from_json(const nlohmann::json& j, ImageContent& t) {
    t.data = j.at("data").get<std::string>();
    t.mime_type = j.at("mimeType").get<std::string>();
}

void to_json(nlohmann::json& j, const ResourceContent& t) {
    j = {{"uri", t.uri}};
    put(j, "mimeType", t.mime_type);
    put(j, "text", t.text);
    put(j, "blob", t.blob);
}

void from_json(const nlohmann::json& j, ResourceContent& t) {
    t.uri = j.at("uri").get<std::string>();
    take(j, "mimeType", t.mime_type);
    take(j, "text", t.text);
    take(j, "blob", t.blob);
}

void to_json(nlohmann::json& j, const EmbeddedResource& t) {
    j = {{"type", "resource"}, {"resource", t.resource}};
}

void from_json(const nlohmann::json& j, EmbeddedResource& t) {
    t.resource = j.at("resource").get<ResourceContent>();
}

void to_json(nlohmann::json& j, const Content& c) {
    std::visit([&j](const auto& value) { to_json(j, value); }, c);
}

void from_json(const nlohmann::json& j, Content& c) {
    const auto type = j.at("type").get<std::string>();
    if (type == "text") c = j.get<TextContent>();
    else if (type == "image") c = j.get<ImageContent>();
    else if (type == "resource") c = j.get<EmbeddedResource>();
    else throw std::invalid_argument("Unknown content type: " + type);
}

// ---------- Tool ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"inputSchema", t.input_schema}};
    put(j, "title", t.title);
    put(j, "description", t.description);
    put(j, "outputSchema", t.output_schema);
    put(j, "annotations", t.annotations);
    put(j, "_meta", t.meta);
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    t.name = j.at("name").get<std::string>();
    if (j.contains("inputSchema")) t.input_schema = j.at("inputSchema");
    take(j, "title", t.title);
    take(j, "description", t.description);
    take(j, "outputSchema", t.output_schema);
    take(j, "annotations", t.annotations);
    take(j, "_meta", t.meta);
}

void to_json(nlohmann::json& j, const CallToolResult& t) {
    auto content = nlohmann::json::array();
    for (const auto& c : t.content) content.push_back(c);
    j = {{"content", std::move(content)}, {"isError", t.is_error}};
    put(j, "structuredContent", t.structured_content);
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    t.content = j.value("content", nlohmann::json::array()).get<std::vector<Content>>();
    t.is_error = j.value("isError", false);
    take(j, "structuredContent", t.structured_content);
}

// ---------- Resource ----------

void to_json(nlohmann::json& j, const ResourceDefinition& t) {
    j = {{"uri", t.uri}, {"name", t.name}};
    put(j, "title", t.title);
    put(j, "description", t.description);
    put(j, "mimeType", t.mime_type);
    put(j, "annotations", t.annotations);
}

void from_json(const nlohmann::json& j, ResourceDefinition& t) {
    t.uri = j.at("uri").get<std::string>();
    t.name = j.at("name").get<std::string>();
    take(j, "title", t.title);
    take(j, "description", t.description);
    take(j, "mimeType", t.mime_type);
    take(j, "annotations", t.annotations);
}

void to_json(nlohmann::json& j, const ResourceTemplate& t) {
    j = {{"uriTemplate", t.uri_template}, {"name", t.name}};
    put(j, "title", t.title);
    put(j, "description", t.description);
    put(j, "mimeType", t.mime_type);
    put(j, "annotations", t.annotations);
}

void from_json(const nlohmann::json& j, ResourceTemplate& t) {
    t.uri_template = j.at("uriTemplate").get<std::string>();
    t.name = j.at("name").get<std::string>();
    take(j, "title", t.title);
    take(j, "description", t.description);
    take(j, "mimeType", t.mime_type);
    take(j, "annotations", t.annotations);
}

// ---------- Prompt ----------

void to_json(nlohmann::json& j, const PromptArgument& t) {
    j = {{"name", t.name}, {"required", t.required}};
    put(j, "description", t.description);
}

void from_json(const nlohmann::json& j, PromptArgument& t) {
    t.name = j.at("name").get<std::string>();
    t.required = j.value("required", false);
    take(j, "description", t.description);
}

void to_json(nlohmann::json& j, const PromptDefinition& t) {
    j = {{"name", t.name}};
    put(j, "title", t.title);
    put(j, "description", t.description);
    if (!t.arguments.empty()) j["arguments"] = t.arguments;
}

void from_json(const nlohmann::json& j, PromptDefinition& t) {
    t.name = j.at("name").get<std::string>();
    take(j, "title", t.title);
    take(j, "description", t.description);
    if (j.contains("arguments")) t.arguments = j.at("arguments").get<std::vector<PromptArgument>>();
}

void to_json(nlohmann::json& j, const PromptMessage& t) {
    j = {{"role", t.role}, {"content", t.content}};
}

void from_json(const nlohmann::json& j, PromptMessage& t) {
    t.role = j.at("role").get<std::string>();
    t.content = j.at("content").get<Content>();
}

void to_json(nlohmann::json& j, const GetPromptResult& t) {
    j = {{"messages", t.messages}};
    put(j, "description", t.description);
}

void from_json(const nlohmann::json& j, GetPromptResult& t) {
    t.messages = j.at("messages").get<std::vector<PromptMessage>>();
    take(j, "description", t.description);
}

// ---------- Lifecycle ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    put(j, "tools", t.tools);
    put(j, "resources", t.resources);
    put(j, "prompts", t.prompts);
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    take(j, "tools", t.tools);
    take(j, "resources", t.resources);
    take(j, "prompts", t.prompts);
}

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
    put(j, "title", t.title);
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.at("version").get<std::string>();
    take(j, "title", t.title);
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {{"protocolVersion", t.protocol_version},
         {"capabilities", t.capabilities},
         {"serverInfo", t.server_info}};
    put(j, "instructions", t.instructions);
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.capabilities = j.at("capabilities").get<ServerCapabilities>();
    t.server_info = j.at("serverInfo").get<Implementation>();
    take(j, "instructions", t.instructions);
}

} // namespace mcprt
