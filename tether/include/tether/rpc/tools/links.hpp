#pragma once
// RPC Link Tools: link_items, unlink_items, get_related, connection_graph

#include "../types.hpp"
#include "../../service.hpp"
#include <sstream>

namespace tether::rpc::tools::links {

using json = nlohmann::json;

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "link_items",
        "Create a manual edge between two items (memory or task). Manual edges "
        "have relevance 1.0 and are never replaced by automatic linking.",
        {
            {"type", "object"},
            {"properties", {
                {"from", {{"type", "string"}, {"description", "Source id"}}},
                {"to", {{"type", "string"}, {"description", "Target id"}}},
                {"type", {{"type", "string"},
                          {"enum", {"related", "blocks", "implements", "references", "caused_by", "research"}},
                          {"default", "related"}}},
                {"reason", {{"type", "string"}}}
            }},
            {"required", {"from", "to"}}
        }
    });

    tools.push_back({
        "unlink_items",
        "Remove the edges between two items, in both directions.",
        {
            {"type", "object"},
            {"properties", {
                {"from", {{"type", "string"}}},
                {"to", {{"type", "string"}}}
            }},
            {"required", {"from", "to"}}
        }
    });

    tools.push_back({
        "get_related",
        "Connected items plus scored suggestions that are not linked yet.",
        {{"type", "object"}, {"properties", {{"id", {{"type", "string"}}}}}, {"required", {"id"}}}
    });

    tools.push_back({
        "connection_graph",
        "Nodes and edges of the memory/task graph, optionally for one project.",
        {{"type", "object"}, {"properties", {{"project", {{"type", "string"}}}}}, {"required", json::array()}}
    });
}

inline json related_json(const RelatedItem& r) {
    return {
        {"id", r.id},
        {"kind", kind_to_string(r.kind)},
        {"title", r.title},
        {"relevance", r.relevance},
        {"type", r.type},
        {"direction", r.direction},
        {"matched_terms", r.matched_terms}
    };
}

inline ToolResult link_items(Service* service, const json& params) {
    std::string err = validate_required(params, {"from", "to"});
    if (!err.empty()) return ToolResult::error(err);

    Connection c = service->link_items(params["from"].get<std::string>(),
                                       params["to"].get<std::string>(),
                                       get_param<std::string>(params, "type", "related"),
                                       get_param<std::string>(params, "reason", ""));
    json result = connection_to_json(c);
    result["from"] = c.from_id;
    return ToolResult::ok("Linked " + c.from_id + " --[" + connection_type_to_string(c.type) +
                          "]--> " + c.to_id, result);
}

inline ToolResult unlink_items(Service* service, const json& params) {
    std::string err = validate_required(params, {"from", "to"});
    if (!err.empty()) return ToolResult::error(err);

    size_t removed = service->unlink_items(params["from"].get<std::string>(),
                                           params["to"].get<std::string>());
    return ToolResult::ok(removed ? "Removed " + std::to_string(removed) + " edges" : "No edges between them",
                          {{"removed", removed}});
}

inline ToolResult get_related(Service* service, const json& params) {
    std::string err = validate_required(params, {"id"});
    if (!err.empty()) return ToolResult::error(err);

    RelatedResult r = service->get_related(params["id"].get<std::string>());
    json connected = json::array();
    json suggestions = json::array();
    std::ostringstream ss;
    ss << r.connected.size() << " connected to " << r.id << "\n";
    for (const auto& item : r.connected) {
        connected.push_back(related_json(item));
        ss << "  " << static_cast<int>(item.relevance * 100) << "% [" << item.type << "] "
           << item.title << " (" << item.id << ")\n";
    }
    if (!r.suggestions.empty()) ss << "Suggested:\n";
    for (const auto& item : r.suggestions) {
        suggestions.push_back(related_json(item));
        ss << "  " << static_cast<int>(item.relevance * 100) << "% " << item.title
           << " (" << item.id << ")\n";
    }
    return ToolResult::ok(ss.str(), {{"id", r.id}, {"connected", connected}, {"suggestions", suggestions}});
}

inline ToolResult connection_graph(Service* service, const json& params) {
    ConnectionGraph g = service->connection_graph(get_param<std::string>(params, "project", ""));

    json nodes = json::array();
    for (const auto& n : g.nodes) {
        json j = {
            {"id", n.id},
            {"kind", kind_to_string(n.kind)},
            {"title", n.title},
            {"project", n.project}
        };
        if (n.status) j["status"] = status_to_string(*n.status);
        nodes.push_back(j);
    }
    json edges = json::array();
    for (const auto& c : g.edges) {
        json j = connection_to_json(c);
        j["from"] = c.from_id;
        edges.push_back(j);
    }
    return ToolResult::ok(std::to_string(g.nodes.size()) + " nodes, " + std::to_string(g.edges.size()) + " edges",
                          {{"nodes", nodes}, {"edges", edges}});
}

inline void register_handlers(Service* service,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["link_items"] = [service](const json& p) { return link_items(service, p); };
    handlers["unlink_items"] = [service](const json& p) { return unlink_items(service, p); };
    handlers["get_related"] = [service](const json& p) { return get_related(service, p); };
    handlers["connection_graph"] = [service](const json& p) { return connection_graph(service, p); };
}

} // namespace tether::rpc::tools::links
