#include "mcprt/resource_registry.hpp"
#include "mcprt/error.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace mcprt {

namespace {

const std::regex& placeholder_regex() {
    static const std::regex re(R"(\{(\w+)\})");
    return re;
}

std::string escape_regex(const std::string& literal) {
    static const char* special = R"(.^$|()[]{}*+?\)";
    std::string out;
    out.reserve(literal.size() * 2);
    for (char c : literal) {
        if (std::strchr(special, c)) out += '\\';
        out += c;
    }
    return out;
}

} // anonymous namespace

std::string ResourceRegistry::normalize_uri(const std::string& uri) {
    return std::regex_replace(uri, placeholder_regex(), "|");
}

ResourceRegistry::Pattern ResourceRegistry::compile(const std::string& uri_template) {
    Pattern pattern;
    std::string expr;
    auto begin = std::sregex_iterator(uri_template.begin(), uri_template.end(), placeholder_regex());
    size_t pos = 0;
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        const auto& m = *it;
        expr += escape_regex(uri_template.substr(pos, static_cast<size_t>(m.position()) - pos));
        expr += "([^/]+)";
        pattern.params.push_back(m[1].str());
        pos = static_cast<size_t>(m.position() + m.length());
    }
    expr += escape_regex(uri_template.substr(pos));
    pattern.regex = std::regex(expr);
    return pattern;
}

std::optional<ResourceParams> ResourceRegistry::match(const Pattern& pattern, const std::string& uri) {
    std::smatch m;
    if (!std::regex_match(uri, m, pattern.regex)) return std::nullopt;
    ResourceParams params;
    for (size_t i = 0; i < pattern.params.size(); ++i) {
        params[pattern.params[i]] = m[i + 1].str();
    }
    return params;
}

std::optional<ResourceParams> ResourceRegistry::match_template(const std::string& uri_template,
                                                               const std::string& uri) {
    return match(compile(uri_template), uri);
}

void ResourceRegistry::insert(Entry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& e : entries_) {
        if (e.name == entry.name) {
            throw std::invalid_argument("Resource " + entry.name + " already registered");
        }
        if (e.normalized == entry.normalized) {
            throw std::invalid_argument("Resource URI " + entry.normalized
                                        + " already registered under the name " + e.name);
        }
    }
    spdlog::debug("Registered resource {} ({})", entry.name, entry.normalized);
    entries_.push_back(std::move(entry));
}

void ResourceRegistry::add(ResourceDefinition def, ResourceReadHandler handler) {
    if (def.name.empty()) throw std::invalid_argument("Resource name must not be empty");
    if (def.uri.empty()) throw std::invalid_argument("Resource " + def.name + " has no URI");
    if (!handler) throw std::invalid_argument("Resource " + def.name + " has no handler");
    if (std::regex_search(def.uri, placeholder_regex())) {
        throw std::invalid_argument("Resource URI " + def.uri + " has placeholders, use add_template");
    }

    Entry entry;
    entry.name = def.name;
    entry.normalized = def.uri;
    entry.mime_type = def.mime_type;
    entry.resource = std::move(def);
    entry.handler = std::move(handler);
    insert(std::move(entry));
}

void ResourceRegistry::add_template(ResourceTemplate tmpl, ResourceReadHandler handler) {
    if (tmpl.name.empty()) throw std::invalid_argument("Resource template name must not be empty");
    if (!handler) throw std::invalid_argument("Resource template " + tmpl.name + " has no handler");

    Pattern pattern = compile(tmpl.uri_template);
    if (pattern.params.empty()) {
        throw std::invalid_argument("Resource template " + tmpl.uri_template + " has no placeholders");
    }

    Entry entry;
    entry.name = tmpl.name;
    entry.normalized = normalize_uri(tmpl.uri_template);
    entry.mime_type = tmpl.mime_type;
    entry.tmpl = std::move(tmpl);
    entry.pattern = std::move(pattern);
    entry.handler = std::move(handler);
    insert(std::move(entry));
}

void ResourceRegistry::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.name == name; });
    if (it == entries_.end()) throw std::invalid_argument("Resource " + name + " not found");
    entries_.erase(it);
}

std::vector<ResourceDefinition> ResourceRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ResourceDefinition> defs;
    for (const auto& e : entries_) {
        if (e.resource) defs.push_back(*e.resource);
    }
    return defs;
}

std::vector<ResourceTemplate> ResourceRegistry::list_templates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ResourceTemplate> templates;
    for (const auto& e : entries_) {
        if (e.tmpl) templates.push_back(*e.tmpl);
    }
    return templates;
}

std::vector<ResourceContent> ResourceRegistry::read(const std::string& uri) const {
    ResourceReadHandler handler;
    ResourceParams params;
    std::optional<std::string> mime_type;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto exact = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) {
            return e.resource && e.normalized == uri;
        });
        if (exact != entries_.end()) {
            handler = exact->handler;
            mime_type = exact->mime_type;
        } else {
            for (const auto& e : entries_) {
                if (!e.pattern) continue;
                if (auto matched = match(*e.pattern, uri)) {
                    handler = e.handler;
                    mime_type = e.mime_type;
                    params = std::move(*matched);
                    break;
                }
            }
        }
    }

    if (!handler) {
        throw McpProtocolError(ErrorKind::ResourceNotFound, "Resource " + uri + " not found");
    }

    auto contents = handler(uri, params);
    for (auto& c : contents) {
        if (c.uri.empty()) c.uri = uri;
        if (!c.mime_type) c.mime_type = mime_type;
    }
    return contents;
}

bool ResourceRegistry::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.empty();
}

} // namespace mcprt
