#pragma once
// RPC Task Tools: create, update, delete, get, list, search, context, stats

#include "../types.hpp"
#include "../../service.hpp"
#include <sstream>

namespace tether::rpc::tools::tasks {

using json = nlohmann::json;

inline json task_properties() {
    return {
        {"title", {{"type", "string"}, {"minLength", 5}, {"description", "Short imperative title"}}},
        {"description", {{"type", "string"}, {"description", "Free-form body"}}},
        {"status", {{"type", "string"}, {"enum", {"todo", "in_progress", "done", "blocked"}}}},
        {"priority", {{"type", "string"}, {"enum", {"low", "medium", "high", "urgent"}}}},
        {"project", {{"type", "string"}, {"description", "Project name (default project when omitted)"}}},
        {"category", {{"type", "string"}, {"description", "Free category; drives serial prefix and workflows"}}},
        {"tags", {{"type", "array"}, {"items", {{"type", "string"}}}}},
        {"parent_id", {{"type", "string"}, {"description", "Parent task id (empty clears)"}}},
        {"status_reason", {{"type", "string"}}}
    };
}

inline json filter_properties() {
    return {
        {"project", {{"type", "string"}}},
        {"status", {{"type", "string"}, {"enum", {"todo", "in_progress", "done", "blocked"}}}},
        {"category", {{"type", "string"}}},
        {"tag", {{"type", "string"}}},
        {"since", {{"type", "string"}, {"description", "ISO-8601 date; created at or after"}}},
        {"has_memory", {{"type", "boolean"}}},
        {"offset", {{"type", "integer"}, {"minimum", 0}, {"default", 0}}},
        {"limit", {{"type", "integer"}, {"minimum", 0}, {"default", 20}}}
    };
}

inline void register_schemas(std::vector<ToolSchema>& tools) {
    json create = task_properties();
    tools.push_back({
        "create_task",
        "Create a task. Related memories are linked automatically.",
        {{"type", "object"}, {"properties", create}, {"required", {"title"}}}
    });

    json update = task_properties();
    update["id"] = {{"type", "string"}, {"description", "Task id or serial (typos tolerated)"}};
    tools.push_back({
        "update_task",
        "Update task fields. Status changes must follow the task lifecycle.",
        {{"type", "object"}, {"properties", update}, {"required", {"id"}}}
    });

    tools.push_back({
        "delete_task",
        "Delete a task and every edge pointing at it. Subtasks become top-level.",
        {{"type", "object"}, {"properties", {{"id", {{"type", "string"}}}}}, {"required", {"id"}}}
    });

    tools.push_back({
        "get_task",
        "Fetch one task by id or serial.",
        {{"type", "object"}, {"properties", {{"id", {{"type", "string"}}}}}, {"required", {"id"}}}
    });

    tools.push_back({
        "list_tasks",
        "List tasks, newest first, with optional filters and pagination.",
        {{"type", "object"}, {"properties", filter_properties()}, {"required", json::array()}}
    });

    json search = filter_properties();
    search["query"] = {{"type", "string"}, {"description", "Words to look for in title and description"}};
    tools.push_back({
        "search_tasks",
        "Keyword search over tasks, best match first.",
        {{"type", "object"}, {"properties", search}, {"required", {"query"}}}
    });

    tools.push_back({
        "task_context",
        "Task with its parent, subtasks and connected memories. "
        "deep=true adds memories of sibling and child tasks and tasks sharing a memory.",
        {
            {"type", "object"},
            {"properties", {
                {"id", {{"type", "string"}}},
                {"deep", {{"type", "boolean"}, {"default", false}}}
            }},
            {"required", {"id"}}
        }
    });

    tools.push_back({
        "task_stats",
        "Task counts by status, priority and project.",
        {{"type", "object"}, {"properties", {{"project", {{"type", "string"}}}}}, {"required", json::array()}}
    });
}

inline TaskInput task_input(const json& params) {
    TaskInput in;
    in.title = get_optional<std::string>(params, "title");
    in.description = get_optional<std::string>(params, "description");
    in.status = get_status(params);
    in.priority = get_priority(params);
    in.project = get_optional<std::string>(params, "project");
    in.category = get_optional<std::string>(params, "category");
    in.tags = get_tags(params);
    in.parent_id = get_optional<std::string>(params, "parent_id");
    in.status_reason = get_optional<std::string>(params, "status_reason");
    return in;
}

inline ToolResult create_task(Service* service, const json& params) {
    std::string err = validate_required(params, {"title"});
    if (!err.empty()) return ToolResult::error(err);

    Task t = service->create_task(task_input(params));
    return ToolResult::ok("Created " + task_line(t), task_json(t));
}

inline ToolResult update_task(Service* service, const json& params) {
    std::string err = validate_required(params, {"id"});
    if (!err.empty()) return ToolResult::error(err);

    Task t = service->update_task(params["id"].get<std::string>(), task_input(params));
    return ToolResult::ok("Updated " + task_line(t), task_json(t));
}

inline ToolResult delete_task(Service* service, const json& params) {
    std::string err = validate_required(params, {"id"});
    if (!err.empty()) return ToolResult::error(err);

    Task t = service->delete_task(params["id"].get<std::string>());
    return ToolResult::ok("Deleted " + task_line(t), {{"id", t.id}, {"deleted", true}});
}

inline ToolResult get_task(Service* service, const json& params) {
    std::string err = validate_required(params, {"id"});
    if (!err.empty()) return ToolResult::error(err);

    Task t = service->get_task(params["id"].get<std::string>());
    std::ostringstream ss;
    ss << task_line(t) << "\n";
    ss << "  priority: " << priority_to_string(t.priority) << ", project: " << t.project;
    if (!t.category.empty()) ss << ", category: " << t.category;
    ss << "\n";
    if (!t.description.empty()) ss << "\n" << t.description << "\n";
    if (!t.connections.empty()) ss << "\n  " << t.connections.size() << " connections\n";
    return ToolResult::ok(ss.str(), task_json(t));
}

inline ToolResult list_tasks(Service* service, const json& params) {
    ListFilter filter = get_filter(params);
    if (!params.contains("limit")) filter.limit = 20;

    Page<Task> page = service->list_tasks(filter);
    json items = json::array();
    std::ostringstream ss;
    ss << page.total << " tasks";
    if (page.items.size() < page.total) {
        ss << " (showing " << page.offset + 1 << "-" << page.offset + page.items.size() << ")";
    }
    ss << "\n";
    for (const auto& t : page.items) {
        items.push_back(task_json(t));
        ss << "  " << task_line(t) << "\n";
    }
    return ToolResult::ok(ss.str(), {{"total", page.total}, {"offset", page.offset}, {"tasks", items}});
}

inline ToolResult search_tasks(Service* service, const json& params) {
    std::string err = validate_required(params, {"query"});
    if (!err.empty()) return ToolResult::error(err);

    ListFilter filter = get_filter(params);
    if (!params.contains("limit")) filter.limit = 20;

    auto hits = service->search_tasks(params["query"].get<std::string>(), filter);
    json items = json::array();
    std::ostringstream ss;
    ss << hits.size() << " matching tasks\n";
    for (const auto& h : hits) {
        json j = task_json(h.task);
        j["score"] = h.score;
        items.push_back(j);
        ss << "  " << static_cast<int>(h.score * 100) << "% " << task_line(h.task) << "\n";
    }
    return ToolResult::ok(ss.str(), {{"results", items}});
}

inline ToolResult task_context(Service* service, const json& params) {
    std::string err = validate_required(params, {"id"});
    if (!err.empty()) return ToolResult::error(err);

    bool deep = get_param<bool>(params, "deep", false);
    TaskContext ctx = service->task_context(params["id"].get<std::string>(), deep);

    json result = {{"task", task_json(ctx.task)}, {"parent", nullptr}};
    std::ostringstream ss;
    ss << task_line(ctx.task) << "\n";
    if (ctx.parent) {
        result["parent"] = task_json(*ctx.parent);
        ss << "Parent: " << task_line(*ctx.parent) << "\n";
    }

    auto list = [&](const char* key, const char* label, const auto& items, auto to_json, auto to_line) {
        json arr = json::array();
        if (!items.empty()) ss << label << ":\n";
        for (const auto& item : items) {
            arr.push_back(to_json(item));
            ss << "  " << to_line(item) << "\n";
        }
        result[key] = arr;
    };
    auto tj = [](const Task& t) { return task_json(t); };
    auto tl = [](const Task& t) { return task_line(t); };
    auto mj = [](const Memory& m) { return memory_json(m); };
    auto ml = [](const Memory& m) { return memory_line(m); };

    list("subtasks", "Subtasks", ctx.subtasks, tj, tl);
    list("memories", "Memories", ctx.memories, mj, ml);
    if (deep) {
        list("related_memories", "Related memories", ctx.related_memories, mj, ml);
        list("related_tasks", "Related tasks", ctx.related_tasks, tj, tl);
    }
    return ToolResult::ok(ss.str(), result);
}

inline ToolResult task_stats(Service* service, const json& params) {
    TaskStats s = service->task_stats(get_param<std::string>(params, "project", ""));

    std::ostringstream ss;
    ss << s.total << " tasks, " << s.with_memories << " with linked memories\n";
    for (const auto& [status, n] : s.by_status) ss << "  " << status << ": " << n << "\n";

    return ToolResult::ok(ss.str(), {
        {"total", s.total},
        {"with_memories", s.with_memories},
        {"by_status", s.by_status},
        {"by_priority", s.by_priority},
        {"by_project", s.by_project}
    });
}

inline void register_handlers(Service* service,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["create_task"] = [service](const json& p) { return create_task(service, p); };
    handlers["update_task"] = [service](const json& p) { return update_task(service, p); };
    handlers["delete_task"] = [service](const json& p) { return delete_task(service, p); };
    handlers["get_task"] = [service](const json& p) { return get_task(service, p); };
    handlers["list_tasks"] = [service](const json& p) { return list_tasks(service, p); };
    handlers["search_tasks"] = [service](const json& p) { return search_tasks(service, p); };
    handlers["task_context"] = [service](const json& p) { return task_context(service, p); };
    handlers["task_stats"] = [service](const json& p) { return task_stats(service, p); };
}

} // namespace tether::rpc::tools::tasks
