#pragma once
// RPC Types: tool schema, tool result, parameter parsing, entity views
//
// Tool handlers receive loosely typed JSON arguments. Everything that
// turns those into service inputs (and service results back into JSON)
// lives here so each tool body stays a few lines long.

#include "../types.hpp"
#include "../errors.hpp"
#include "../document.hpp"
#include "../index.hpp"
#include "../service.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace tether::rpc {

using json = nlohmann::json;

struct ToolSchema {
    std::string name;
    std::string description;
    json input_schema;
};

struct ToolResult {
    bool is_error = false;
    std::string content;      // Human-readable text
    json structured;          // Machine-readable payload

    static ToolResult ok(const std::string& text, const json& data = json()) {
        return {false, text, data};
    }

    static ToolResult error(const std::string& message, const json& data = json()) {
        return {true, message, data};
    }
};

using ToolHandler = std::function<ToolResult(const json&)>;

// ═══════════════════════════════════════════════════════════════════════════
// Parameters
// ═══════════════════════════════════════════════════════════════════════════

// Empty string when all present, otherwise the first missing key
inline std::string validate_required(const json& params, std::initializer_list<const char*> required) {
    for (const char* key : required) {
        if (!params.contains(key) || params[key].is_null()) {
            return std::string("Missing required parameter: ") + key;
        }
    }
    return "";
}

// Absent or null gives default_val; a value of the wrong type is a ValidationError
template<typename T>
inline T get_param(const json& params, const char* key, T default_val) {
    if (!params.contains(key) || params[key].is_null()) return default_val;
    try {
        return params[key].get<T>();
    } catch (const json::type_error&) {
        throw ValidationError(key, std::string("Parameter '") + key + "' has the wrong type");
    }
}

template<typename T>
inline std::optional<T> get_optional(const json& params, const char* key) {
    if (!params.contains(key) || params[key].is_null()) return std::nullopt;
    return get_param<T>(params, key, T{});
}

// Array of strings or a comma-separated string
inline std::optional<std::vector<std::string>> get_tags(const json& params, const char* key = "tags") {
    if (!params.contains(key) || params[key].is_null()) return std::nullopt;
    const json& v = params[key];
    if (v.is_array()) return get_param<std::vector<std::string>>(params, key, {});
    if (!v.is_string()) throw ValidationError(key, std::string("Parameter '") + key + "' must be a list");

    std::vector<std::string> tags;
    std::stringstream ss(v.get<std::string>());
    std::string tag;
    while (std::getline(ss, tag, ',')) {
        tag = trim(tag);
        if (!tag.empty()) tags.push_back(tag);
    }
    return tags;
}

inline std::optional<Status> get_status(const json& params, const char* key = "status") {
    auto raw = get_optional<std::string>(params, key);
    if (!raw) return std::nullopt;
    auto s = parse_status(*raw);
    if (!s) throw ValidationError(key, "Unknown status '" + *raw + "' (todo, in_progress, done, blocked)");
    return s;
}

inline std::optional<Priority> get_priority(const json& params, const char* key = "priority") {
    auto raw = get_optional<std::string>(params, key);
    if (!raw) return std::nullopt;
    auto p = parse_priority(*raw);
    if (!p) throw ValidationError(key, "Unknown priority '" + *raw + "' (low, medium, high, urgent)");
    return p;
}

inline ListFilter get_filter(const json& params) {
    ListFilter f;
    f.project = get_param<std::string>(params, "project", "");
    f.status = get_status(params);
    f.category = get_param<std::string>(params, "category", "");
    f.tag = get_param<std::string>(params, "tag", "");
    if (auto since = get_optional<std::string>(params, "since")) {
        auto ts = from_iso8601(*since);
        if (!ts) throw ValidationError("since", "Unreadable date '" + *since + "'");
        f.since = *ts;
    }
    f.has_memory = get_optional<bool>(params, "has_memory");
    f.offset = get_param<size_t>(params, "offset", 0);
    f.limit = get_param<size_t>(params, "limit", 0);
    return f;
}

// ═══════════════════════════════════════════════════════════════════════════
// Entity views
// ═══════════════════════════════════════════════════════════════════════════

inline json task_json(const Task& t) {
    json j = task_front_matter(t);
    j["description"] = t.description;
    return j;
}

inline json memory_json(const Memory& m) {
    json j = memory_front_matter(m);
    j["content"] = m.content;
    return j;
}

inline std::string task_line(const Task& t) {
    std::ostringstream ss;
    ss << "[" << status_to_string(t.status) << "] ";
    if (!t.serial.empty()) ss << t.serial << " ";
    ss << t.title << " (" << t.id << ")";
    return ss.str();
}

inline std::string memory_line(const Memory& m, size_t max_len = 60) {
    std::string head = m.title.empty() ? m.content : m.title;
    size_t newline = head.find('\n');
    if (newline != std::string::npos) head = head.substr(0, newline);
    if (head.size() > max_len) head = head.substr(0, max_len) + "...";
    return head + " (" + m.id + ")";
}

inline json proposal_json(const Proposal& p) {
    return {
        {"task_id", p.task_id},
        {"from", status_to_string(p.from)},
        {"to", status_to_string(p.to)},
        {"confidence", p.confidence},
        {"rule", p.rule},
        {"reason", p.reason},
        {"details", p.details},
        {"created", to_iso8601(p.created)}
    };
}

inline json advisory_json(const Advisory& a) {
    return {
        {"task_id", a.task_id},
        {"type", a.type},
        {"message", a.message},
        {"confidence", a.confidence}
    };
}

} // namespace tether::rpc
