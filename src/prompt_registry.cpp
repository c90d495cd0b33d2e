#include "mcprt/prompt_registry.hpp"
#include "mcprt/error.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace mcprt {

namespace {

void check_required(const PromptDefinition& def, const nlohmann::json& arguments) {
    std::string missing;
    for (const auto& arg : def.arguments) {
        if (!arg.required || arguments.contains(arg.name)) continue;
        if (!missing.empty()) missing += ", ";
        missing += arg.name;
    }
    if (!missing.empty()) {
        throw McpProtocolError(ErrorKind::InvalidParams,
                               "Missing required arguments: " + missing);
    }
}

} // anonymous namespace

void PromptRegistry::add(PromptDefinition def, PromptHandler handler) {
    if (def.name.empty()) throw std::invalid_argument("Prompt name must not be empty");
    if (!handler) throw std::invalid_argument("Prompt " + def.name + " has no handler");

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.def.name == def.name; });
    if (it != entries_.end()) {
        throw std::invalid_argument("Prompt " + def.name + " already registered");
    }
    entries_.push_back(Entry{std::move(def), std::move(handler)});
}

PromptDefinition PromptRegistry::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.def.name == name; });
    if (it == entries_.end()) throw std::invalid_argument("Prompt " + name + " not found");
    PromptDefinition def = std::move(it->def);
    entries_.erase(it);
    return def;
}

std::vector<PromptDefinition> PromptRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PromptDefinition> defs;
    defs.reserve(entries_.size());
    for (const auto& e : entries_) defs.push_back(e.def);
    return defs;
}

GetPromptResult PromptRegistry::get(const std::string& name, const nlohmann::json& arguments) const {
    Entry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const Entry& e) { return e.def.name == name; });
        if (it == entries_.end()) {
            throw McpProtocolError(ErrorKind::InvalidParams, "Unknown prompt: " + name);
        }
        entry = *it;
    }

    if (!arguments.is_null() && !arguments.is_object()) {
        throw McpProtocolError(ErrorKind::InvalidParams, "Prompt arguments must be an object");
    }
    const nlohmann::json args = arguments.is_null() ? nlohmann::json::object() : arguments;
    check_required(entry.def, args);

    GetPromptResult result;
    result.description = entry.def.description;
    result.messages = entry.handler(args);
    return result;
}

bool PromptRegistry::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.empty();
}

} // namespace mcprt
