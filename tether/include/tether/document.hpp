#pragma once
// Document codec: front-matter header + body
//
// A project file is a sequence of blocks:
//
//   ---
//   project: "api"
//   kind: "tasks"
//   ---
//   # api Tasks
//
//   ---
//   id: "task-2026-03-14-1a2b3c4d"
//   title: "Implement JWT auth"
//   tags: ["auth","security"]
//   ---
//   Description text...
//
// Each front-matter line is `key: <JSON value>`; JSON flow values are
// also valid YAML. Body lines that are exactly "---" (after any leading
// backslashes) gain one extra backslash so they never read as delimiters.

#include "types.hpp"
#include "errors.hpp"
#include "version.hpp"
#include <nlohmann/json.hpp>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

namespace tether {

using json = nlohmann::json;

struct Block {
    json fields = json::object();
    std::string body;
    size_t line = 0;              // 1-based line of the opening delimiter
};

struct ParsedDocument {
    std::optional<Block> header;
    std::vector<Block> blocks;
    std::vector<std::string> errors;   // Malformed blocks, with line numbers
};

// ═══════════════════════════════════════════════════════════════════════════
// Body escaping
// ═══════════════════════════════════════════════════════════════════════════

// Readers drop a trailing CR before matching, so the check does too
inline bool is_delimiter_like(const std::string& line) {
    size_t i = 0;
    while (i < line.size() && line[i] == '\\') ++i;
    size_t end = line.size();
    if (end > i && line[end - 1] == '\r') --end;
    return line.compare(i, end - i, "---") == 0;
}

inline std::string escape_body(const std::string& body) {
    std::stringstream in(body);
    std::string out, line;
    bool first = true;
    while (std::getline(in, line)) {
        if (!first) out += '\n';
        first = false;
        if (is_delimiter_like(line)) out += '\\';
        out += line;
    }
    return out;
}

inline std::string unescape_line(const std::string& line) {
    if (!line.empty() && line[0] == '\\' && is_delimiter_like(line)) {
        return line.substr(1);
    }
    return line;
}

inline std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Block rendering and parsing
// ═══════════════════════════════════════════════════════════════════════════

inline void render_block(std::string& out, const json& fields, const std::string& body) {
    out += "---\n";
    for (auto it = fields.begin(); it != fields.end(); ++it) {
        out += it.key();
        out += ": ";
        out += it.value().dump(-1, ' ', false, json::error_handler_t::replace);
        out += '\n';
    }
    out += "---\n";
    if (!body.empty()) {
        out += escape_body(body);
        out += '\n';
    }
    out += '\n';
}

inline ParsedDocument parse_document(const std::string& text) {
    ParsedDocument doc;

    std::vector<std::string> lines;
    {
        std::stringstream in(text);
        std::string line;
        while (std::getline(in, line)) lines.push_back(line);
    }
    // Fences tolerate CRLF files; body lines keep their CR
    auto fence = [](const std::string& line) { return line == "---" || line == "---\r"; };

    size_t i = 0;
    // Skip anything before the first delimiter
    while (i < lines.size() && !fence(lines[i])) ++i;

    bool first = true;
    while (i < lines.size()) {
        Block block;
        block.line = i + 1;
        ++i;  // opening ---

        bool closed = false;
        bool bad = false;
        std::string bad_reason;
        for (; i < lines.size(); ++i) {
            const std::string& line = lines[i];
            if (fence(line)) { closed = true; ++i; break; }
            if (trim(line).empty()) continue;

            auto colon = line.find(':');
            if (colon == std::string::npos || colon == 0) {
                bad = true;
                bad_reason = "missing key at line " + std::to_string(i + 1);
                continue;
            }
            std::string key = trim(line.substr(0, colon));
            std::string value = trim(line.substr(colon + 1));
            try {
                block.fields[key] = value.empty() ? json() : json::parse(value);
            } catch (const json::parse_error&) {
                bad = true;
                bad_reason = "unparseable value for '" + key + "' at line " + std::to_string(i + 1);
            }
        }

        if (!closed) {
            doc.errors.push_back("unterminated front-matter at line " + std::to_string(block.line));
            break;
        }

        std::vector<std::string> body_lines;
        for (; i < lines.size() && !fence(lines[i]); ++i) {
            body_lines.push_back(unescape_line(lines[i]));
        }
        while (!body_lines.empty() && trim(body_lines.back()).empty()) body_lines.pop_back();
        for (size_t k = 0; k < body_lines.size(); ++k) {
            if (k) block.body += '\n';
            block.body += body_lines[k];
        }

        if (bad) {
            doc.errors.push_back("malformed block at line " + std::to_string(block.line) + ": " + bad_reason);
        } else if (first && block.fields.contains("kind") && !block.fields.contains("id")) {
            doc.header = std::move(block);
        } else {
            doc.blocks.push_back(std::move(block));
        }
        first = false;
    }

    return doc;
}

// ═══════════════════════════════════════════════════════════════════════════
// Entity <-> front-matter
// ═══════════════════════════════════════════════════════════════════════════

inline json connection_to_json(const Connection& c) {
    json j = {
        {"to", c.to_id},
        {"type", connection_type_to_string(c.type)},
        {"relevance", c.relevance},
        {"matched_terms", c.matched_terms},
        {"created", to_iso8601(c.created)},
        {"updated", to_iso8601(c.updated)}
    };
    if (c.manual) {
        j["manual"] = true;
        j["reason"] = c.reason;
    }
    return j;
}

inline Timestamp read_time(const json& j, const char* key, Timestamp fallback = 0) {
    if (!j.contains(key) || j[key].is_null()) return fallback;
    if (j[key].is_number_integer()) return j[key].get<Timestamp>();
    if (j[key].is_string()) {
        auto ts = from_iso8601(j[key].get<std::string>());
        if (ts) return *ts;
    }
    throw ValidationError(key, std::string("unreadable timestamp in '") + key + "'");
}

inline std::vector<Connection> connections_from_json(const json& arr, const std::string& owner) {
    std::vector<Connection> out;
    if (!arr.is_array()) return out;
    for (const auto& item : arr) {
        Connection c;
        c.from_id = owner;
        c.to_id = item.value("to", "");
        if (c.to_id.empty() || c.to_id == owner) continue;  // No self-loops
        c.type = parse_connection_type(item.value("type", "related")).value_or(ConnectionType::Related);
        c.relevance = clamp01(item.value("relevance", 0.0f));
        c.matched_terms = item.value("matched_terms", std::vector<std::string>{});
        c.created = read_time(item, "created");
        c.updated = read_time(item, "updated", c.created);
        c.manual = item.value("manual", false);
        c.reason = item.value("reason", "");
        out.push_back(std::move(c));
    }
    return out;
}

inline json memory_front_matter(const Memory& m) {
    json j;
    j["id"] = m.id;
    if (!m.title.empty()) j["title"] = m.title;
    if (!m.summary.empty()) j["summary"] = m.summary;
    j["timestamp"] = to_iso8601(m.timestamp);
    j["complexity"] = m.complexity;
    j["category"] = m.category;
    j["project"] = m.project;
    j["tags"] = m.tags;
    j["priority"] = priority_to_string(m.priority);
    j["access_count"] = m.access_count;
    if (m.last_accessed) j["last_accessed"] = to_iso8601(m.last_accessed);
    json conns = json::array();
    for (const auto& c : m.connections) conns.push_back(connection_to_json(c));
    j["connections"] = conns;
    j["metadata"] = {{"content_type", "text"}, {"size", m.size()}};
    return j;
}

inline Memory memory_from_block(const Block& b) {
    const json& j = b.fields;
    Memory m;
    m.id = j.value("id", "");
    if (m.id.empty()) throw ValidationError("id", "memory block has no id");
    m.content = b.body;
    m.title = j.value("title", "");
    m.summary = j.value("summary", "");
    m.timestamp = read_time(j, "timestamp");
    m.complexity = std::clamp(j.value("complexity", 1), 1, 4);
    m.category = j.value("category", "");
    m.project = j.value("project", "");
    m.tags = unique_tags(j.value("tags", std::vector<std::string>{}));
    m.priority = parse_priority(j.value("priority", "medium")).value_or(Priority::Medium);
    m.access_count = j.value("access_count", size_t(0));
    m.last_accessed = read_time(j, "last_accessed");
    m.connections = connections_from_json(j.value("connections", json::array()), m.id);
    return m;
}

inline json automation_to_json(const AutomationRecord& r) {
    return {
        {"type", r.type},
        {"confidence", r.confidence},
        {"timestamp", to_iso8601(r.timestamp)},
        {"details", r.details}
    };
}

inline json task_front_matter(const Task& t) {
    json j;
    j["id"] = t.id;
    j["serial"] = t.serial;
    j["title"] = t.title;
    j["status"] = status_to_string(t.status);
    j["priority"] = priority_to_string(t.priority);
    j["project"] = t.project;
    j["category"] = t.category;
    j["tags"] = t.tags;
    if (!t.parent_id.empty()) j["parent_id"] = t.parent_id;
    j["subtasks"] = t.subtasks;
    json conns = json::array();
    for (const auto& c : t.connections) conns.push_back(connection_to_json(c));
    j["connections"] = conns;
    j["created"] = to_iso8601(t.created);
    j["updated"] = to_iso8601(t.updated);
    if (!t.status_reason.empty()) j["status_reason"] = t.status_reason;
    if (t.automation_applied) j["automation_applied"] = automation_to_json(*t.automation_applied);
    return j;
}

inline Task task_from_block(const Block& b) {
    const json& j = b.fields;
    Task t;
    t.id = j.value("id", "");
    if (t.id.empty()) throw ValidationError("id", "task block has no id");
    t.serial = j.value("serial", "");
    t.title = j.value("title", "");
    t.description = b.body;

    auto status = parse_status(j.value("status", "todo"));
    if (!status) throw ValidationError("status", "unknown status '" + j.value("status", "") + "'");
    t.status = *status;
    t.priority = parse_priority(j.value("priority", "medium")).value_or(Priority::Medium);

    t.project = j.value("project", "");
    t.category = j.value("category", "");
    t.tags = unique_tags(j.value("tags", std::vector<std::string>{}));
    t.parent_id = j.value("parent_id", "");
    t.subtasks = j.value("subtasks", std::vector<std::string>{});
    t.connections = connections_from_json(j.value("connections", json::array()), t.id);
    t.created = read_time(j, "created");
    t.updated = read_time(j, "updated", t.created);
    t.status_reason = j.value("status_reason", "");

    if (j.contains("automation_applied") && j["automation_applied"].is_object()) {
        const auto& a = j["automation_applied"];
        AutomationRecord r;
        r.type = a.value("type", "");
        r.confidence = a.value("confidence", 0.0f);
        r.timestamp = read_time(a, "timestamp");
        r.details = a.value("details", json());
        t.automation_applied = r;
    }
    return t;
}

// ═══════════════════════════════════════════════════════════════════════════
// Whole-file rendering
// ═══════════════════════════════════════════════════════════════════════════

inline json file_header(const std::string& project, const char* kind, Timestamp updated) {
    json h;
    h["project"] = project;
    h["kind"] = kind;
    h["format"] = std::to_string(TETHER_FORMAT_VERSION_MAJOR) + "." +
                  std::to_string(TETHER_FORMAT_VERSION_MINOR);
    h["updated"] = to_iso8601(updated);
    return h;
}

inline std::string render_tasks(const std::string& project, const std::vector<Task>& tasks) {
    std::string out;
    render_block(out, file_header(project, "tasks", now()), "# " + project + " Tasks");
    for (const auto& t : tasks) render_block(out, task_front_matter(t), t.description);
    return out;
}

inline std::string render_memories(const std::string& project, const std::vector<Memory>& memories) {
    std::string out;
    render_block(out, file_header(project, "memories", now()), "# " + project + " Memories");
    for (const auto& m : memories) render_block(out, memory_front_matter(m), m.content);
    return out;
}

// Header values are strings when written here; hand edits may leave a
// bare number (format: 1.0), which reads back as its JSON text
inline std::string header_field(const Block& header, const std::string& key,
                                const std::string& fallback) {
    auto it = header.fields.find(key);
    if (it == header.fields.end() || it->is_null()) return fallback;
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

// "1.0" -> compatible with this reader?
inline bool header_compatible(const Block& header) {
    std::string fmt = header_field(header, "format", "1.0");
    int major = 0, minor = 0;
    if (std::sscanf(fmt.c_str(), "%d.%d", &major, &minor) != 2) return false;
    return version::format_compatible(major, minor);
}

} // namespace tether
