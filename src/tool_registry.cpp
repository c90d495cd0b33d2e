#include "mcprt/tool_registry.hpp"
#include "mcprt/error.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace mcprt {

void ToolRegistry::add(ToolDefinition def, ToolHandler handler) {
    if (def.name.empty()) throw std::invalid_argument("Tool name must not be empty");
    if (!handler) throw std::invalid_argument("Tool " + def.name + " has no handler");

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.def.name == def.name; });
    if (it != entries_.end()) {
        throw std::invalid_argument("Tool " + def.name + " already registered");
    }
    spdlog::debug("Registered tool {}", def.name);
    entries_.push_back(Entry{std::move(def), std::move(handler)});
}

ToolDefinition ToolRegistry::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.def.name == name; });
    if (it == entries_.end()) throw std::invalid_argument("Tool " + name + " not found");
    ToolDefinition def = std::move(it->def);
    entries_.erase(it);
    return def;
}

std::vector<ToolDefinition> ToolRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ToolDefinition> defs;
    defs.reserve(entries_.size());
    for (const auto& e : entries_) defs.push_back(e.def);
    return defs;
}

CallToolResult ToolRegistry::call(const std::string& name, const nlohmann::json& arguments) const {
    ToolHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const Entry& e) { return e.def.name == name; });
        if (it == entries_.end()) {
            throw McpProtocolError(ErrorKind::InvalidParams, "Unknown tool: " + name);
        }
        handler = it->handler;
    }

    if (!arguments.is_null() && !arguments.is_object()) {
        throw McpProtocolError(ErrorKind::InvalidParams, "Tool arguments must be an object");
    }
    const nlohmann::json args = arguments.is_null() ? nlohmann::json::object() : arguments;

    // Handler runs without the lock so a tool may inspect the registry.
    try {
        return handler(args);
    } catch (const McpProtocolError&) {
        throw;
    } catch (const McpCancelledError&) {
        throw;
    } catch (const ContextError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::warn("Tool {} failed: {}", name, e.what());
        return CallToolResult::error(e.what());
    }
}

bool ToolRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(),
                       [&](const Entry& e) { return e.def.name == name; });
}

bool ToolRegistry::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.empty();
}

} // namespace mcprt
