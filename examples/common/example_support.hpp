#pragma once
/// Shared setup for the example servers: stderr logging and a small set of
/// math tools, prompts and resources.

#include <mcprt/mcprt.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <string>
#include <thread>

namespace examples {

/// stdout may carry protocol traffic, so logs go to stderr. The level comes
/// from MCPRT_LOG_LEVEL (trace, debug, info, warn, err, critical, off).
inline void configure_logging() {
    auto logger = spdlog::stderr_color_mt("mcprt");
    spdlog::set_default_logger(logger);
    const char* level = std::getenv("MCPRT_LOG_LEVEL");
    spdlog::set_level(level ? spdlog::level::from_str(level) : spdlog::level::info);
}

inline double number_arg(const nlohmann::json& args, const char* name) {
    if (!args.contains(name) || !args.at(name).is_number()) {
        throw mcprt::McpProtocolError(mcprt::ErrorKind::InvalidParams,
                                      std::string("Argument '") + name + "' must be a number");
    }
    return args.at(name).get<double>();
}

inline nlohmann::json binary_schema() {
    return {
        {"type", "object"},
        {"properties", {{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}}},
        {"required", {"a", "b"}}
    };
}

inline std::string format_number(double v) {
    std::string s = std::to_string(v);
    s.erase(s.find_last_not_of('0') + 1);
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s;
}

inline void register_math(mcprt::McpServer& server) {
    mcprt::ToolDefinition add;
    add.name = "add";
    add.description = "Add two numbers";
    add.input_schema = binary_schema();
    server.add_tool(add, [](const nlohmann::json& args) {
        return mcprt::CallToolResult::text(format_number(number_arg(args, "a") + number_arg(args, "b")));
    });

    mcprt::ToolDefinition divide;
    divide.name = "divide";
    divide.description = "Divide a by b";
    divide.input_schema = binary_schema();
    server.add_tool(divide, [](const nlohmann::json& args) {
        const double b = number_arg(args, "b");
        if (b == 0.0) throw mcprt::ToolError("Cannot divide by zero");
        return mcprt::CallToolResult::text(format_number(number_arg(args, "a") / b));
    });

    // Reports progress once per step; each report also keeps the request alive.
    mcprt::ToolDefinition count;
    count.name = "count";
    count.description = "Count slowly up to n, reporting progress";
    count.input_schema = {
        {"type", "object"},
        {"properties", {{"n", {{"type", "integer"}}}}},
        {"required", {"n"}}
    };
    server.add_tool(count, [&server](const nlohmann::json& args) {
        const auto n = static_cast<int>(number_arg(args, "n"));
        auto& ctx = server.context().get();
        for (int i = 1; i <= n; ++i) {
            ctx.throw_if_cancelled();
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            if (auto* responder = ctx.responder()) {
                responder->report_progress(i, n, "step " + std::to_string(i));
            }
        }
        return mcprt::CallToolResult::text("counted to " + std::to_string(n));
    });

    mcprt::PromptDefinition explain;
    explain.name = "explain";
    explain.description = "Ask for an explanation of a math operation";
    explain.arguments.push_back({"operation", std::string("Operation to explain"), true});
    server.add_prompt(explain, [](const nlohmann::json& args) {
        mcprt::PromptMessage msg;
        msg.role = "user";
        msg.content = mcprt::TextContent{"Explain how " + args.at("operation").get<std::string>()
                                         + " works, with an example."};
        return std::vector<mcprt::PromptMessage>{msg};
    });

    mcprt::ResourceDefinition pi;
    pi.uri = "math://constants/pi";
    pi.name = "pi";
    pi.mime_type = "text/plain";
    server.add_resource(pi, [](const std::string&, const mcprt::ResourceParams&) {
        mcprt::ResourceContent content;
        content.text = "3.141592653589793";
        return std::vector<mcprt::ResourceContent>{content};
    });

    mcprt::ResourceTemplate square;
    square.uri_template = "math://square/{n}";
    square.name = "square";
    square.mime_type = "text/plain";
    server.add_resource_template(square, [](const std::string&, const mcprt::ResourceParams& params) {
        const double n = std::stod(params.at("n"));
        mcprt::ResourceContent content;
        content.text = format_number(n * n);
        return std::vector<mcprt::ResourceContent>{content};
    });
}

} // namespace examples
