#pragma once
#include "types.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace mcprt {

/// Renders the messages of a prompt from its (string-valued) arguments.
using PromptHandler = std::function<std::vector<PromptMessage>(const nlohmann::json& arguments)>;

class PromptRegistry {
public:
    /// Throws std::invalid_argument for an empty or already registered name.
    void add(PromptDefinition def, PromptHandler handler);

    /// Throws std::invalid_argument if the prompt is not registered.
    PromptDefinition remove(const std::string& name);

    [[nodiscard]] std::vector<PromptDefinition> list() const;

    /// Unknown prompts and missing required arguments raise
    /// McpProtocolError(InvalidParams).
    GetPromptResult get(const std::string& name, const nlohmann::json& arguments) const;

    [[nodiscard]] bool empty() const;

private:
    struct Entry {
        PromptDefinition def;
        PromptHandler handler;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

} // namespace mcprt
