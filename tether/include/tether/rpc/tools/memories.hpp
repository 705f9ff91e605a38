#pragma once
// RPC Memory Tools: add, update, delete, get, list

#include "../types.hpp"
#include "../../service.hpp"
#include <sstream>

namespace tether::rpc::tools::memories {

using json = nlohmann::json;

inline json memory_properties() {
    return {
        {"content", {{"type", "string"}, {"minLength", 3}, {"description", "What was learned or decided"}}},
        {"title", {{"type", "string"}}},
        {"summary", {{"type", "string"}}},
        {"tags", {{"type", "array"}, {"items", {{"type", "string"}}}}},
        {"category", {{"type", "string"}}},
        {"project", {{"type", "string"}}},
        {"priority", {{"type", "string"}, {"enum", {"low", "medium", "high", "urgent"}}}},
        {"complexity", {{"type", "integer"}, {"minimum", 1}, {"maximum", 4}, {"default", 1}}}
    };
}

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "add_memory",
        "Store a memory. Related tasks are linked automatically and may change "
        "status on the next automation check.",
        {{"type", "object"}, {"properties", memory_properties()}, {"required", {"content"}}}
    });

    json update = memory_properties();
    update["id"] = {{"type", "string"}};
    tools.push_back({
        "update_memory",
        "Update memory fields; links are refreshed.",
        {{"type", "object"}, {"properties", update}, {"required", {"id"}}}
    });

    tools.push_back({
        "delete_memory",
        "Delete a memory and every edge pointing at it.",
        {{"type", "object"}, {"properties", {{"id", {{"type", "string"}}}}}, {"required", {"id"}}}
    });

    tools.push_back({
        "get_memory",
        "Fetch one memory. Counts as an access.",
        {{"type", "object"}, {"properties", {{"id", {{"type", "string"}}}}}, {"required", {"id"}}}
    });

    json filter = {
        {"project", {{"type", "string"}}},
        {"category", {{"type", "string"}}},
        {"tag", {{"type", "string"}}},
        {"since", {{"type", "string"}}},
        {"offset", {{"type", "integer"}, {"minimum", 0}}},
        {"limit", {{"type", "integer"}, {"minimum", 0}, {"default", 20}}}
    };
    tools.push_back({
        "list_memories",
        "List memories, newest first.",
        {{"type", "object"}, {"properties", filter}, {"required", json::array()}}
    });
}

inline MemoryInput memory_input(const json& params) {
    MemoryInput in;
    in.content = get_optional<std::string>(params, "content");
    in.title = get_optional<std::string>(params, "title");
    in.summary = get_optional<std::string>(params, "summary");
    in.tags = get_tags(params);
    in.category = get_optional<std::string>(params, "category");
    in.project = get_optional<std::string>(params, "project");
    in.priority = get_priority(params);
    in.complexity = get_optional<int>(params, "complexity");
    return in;
}

inline ToolResult add_memory(Service* service, const json& params) {
    std::string err = validate_required(params, {"content"});
    if (!err.empty()) return ToolResult::error(err);

    Memory m = service->add_memory(memory_input(params));
    std::ostringstream ss;
    ss << "Stored " << memory_line(m);
    if (!m.connections.empty()) ss << ", linked to " << m.connections.size() << " tasks";
    return ToolResult::ok(ss.str(), memory_json(m));
}

inline ToolResult update_memory(Service* service, const json& params) {
    std::string err = validate_required(params, {"id"});
    if (!err.empty()) return ToolResult::error(err);

    Memory m = service->update_memory(params["id"].get<std::string>(), memory_input(params));
    return ToolResult::ok("Updated " + memory_line(m), memory_json(m));
}

inline ToolResult delete_memory(Service* service, const json& params) {
    std::string err = validate_required(params, {"id"});
    if (!err.empty()) return ToolResult::error(err);

    Memory m = service->delete_memory(params["id"].get<std::string>());
    return ToolResult::ok("Deleted " + memory_line(m), {{"id", m.id}, {"deleted", true}});
}

inline ToolResult get_memory(Service* service, const json& params) {
    std::string err = validate_required(params, {"id"});
    if (!err.empty()) return ToolResult::error(err);

    Memory m = service->touch_memory(params["id"].get<std::string>());
    std::ostringstream ss;
    if (!m.title.empty()) ss << m.title << "\n\n";
    ss << m.content << "\n";
    ss << "\n  " << m.id << " | " << m.project << " | " << to_iso8601(m.timestamp);
    return ToolResult::ok(ss.str(), memory_json(m));
}

inline ToolResult list_memories(Service* service, const json& params) {
    ListFilter filter = get_filter(params);
    if (!params.contains("limit")) filter.limit = 20;

    Page<Memory> page = service->list_memories(filter);
    json items = json::array();
    std::ostringstream ss;
    ss << page.total << " memories\n";
    for (const auto& m : page.items) {
        items.push_back(memory_json(m));
        ss << "  " << memory_line(m) << "\n";
    }
    return ToolResult::ok(ss.str(), {{"total", page.total}, {"offset", page.offset}, {"memories", items}});
}

inline void register_handlers(Service* service,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["add_memory"] = [service](const json& p) { return add_memory(service, p); };
    handlers["update_memory"] = [service](const json& p) { return update_memory(service, p); };
    handlers["delete_memory"] = [service](const json& p) { return delete_memory(service, p); };
    handlers["get_memory"] = [service](const json& p) { return get_memory(service, p); };
    handlers["list_memories"] = [service](const json& p) { return list_memories(service, p); };
}

} // namespace tether::rpc::tools::memories
