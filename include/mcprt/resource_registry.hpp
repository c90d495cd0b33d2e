#pragma once
#include "types.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace mcprt {

/// Values bound to the `{name}` placeholders of a resource template. Empty
/// for static resources.
using ResourceParams = std::map<std::string, std::string>;

using ResourceReadHandler = std::function<std::vector<ResourceContent>(
    const std::string& uri, const ResourceParams& params)>;

/// Static resources and URI templates. Templates use `{name}` placeholders,
/// each matching one non-empty path segment, and must match the whole URI.
class ResourceRegistry {
public:
    /// Throws std::invalid_argument for an empty name or URI, a URI with
    /// placeholders, or a name or URI that is already registered.
    void add(ResourceDefinition def, ResourceReadHandler handler);

    /// Same checks as add(). The template must contain at least one
    /// placeholder, and duplicates are detected on the normalized template.
    void add_template(ResourceTemplate tmpl, ResourceReadHandler handler);

    /// Remove a resource or template by name. Throws std::invalid_argument
    /// if nothing is registered under `name`.
    void remove(const std::string& name);

    [[nodiscard]] std::vector<ResourceDefinition> list() const;
    [[nodiscard]] std::vector<ResourceTemplate> list_templates() const;

    /// Exact static match first, then templates in registration order.
    /// Raises McpProtocolError(ResourceNotFound) when nothing matches.
    std::vector<ResourceContent> read(const std::string& uri) const;

    [[nodiscard]] bool empty() const;

    /// Replace every placeholder with `|` so `a/{x}` and `a/{y}` collide.
    static std::string normalize_uri(const std::string& uri);

    /// Parameters extracted from `uri`, or nullopt if the template does not
    /// match it completely.
    static std::optional<ResourceParams> match_template(const std::string& uri_template,
                                                        const std::string& uri);

private:
    struct Pattern {
        std::regex regex;
        std::vector<std::string> params;
    };

    struct Entry {
        std::string name;
        std::string normalized;
        std::optional<std::string> mime_type;
        std::optional<ResourceDefinition> resource;
        std::optional<ResourceTemplate> tmpl;
        std::optional<Pattern> pattern;
        ResourceReadHandler handler;
    };

    static Pattern compile(const std::string& uri_template);
    static std::optional<ResourceParams> match(const Pattern& pattern, const std::string& uri);
    void insert(Entry entry);

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

} // namespace mcprt
