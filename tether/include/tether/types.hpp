#pragma once
// Core types: memories, tasks, and the edges between them
//
// Two entity kinds share one id space. Tasks form a tree through
// parent_id; both kinds carry outgoing connections. Time is Unix millis
// in memory and ISO-8601 on disk.

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <random>
#include <string>
#include <vector>

// POSIX headers for atomic file persistence (must be outside namespace)
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

namespace tether {

// Timestamp as Unix millis
using Timestamp = int64_t;

constexpr Timestamp HOUR_MS = 60LL * 60 * 1000;
constexpr Timestamp DAY_MS = 24 * HOUR_MS;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// 2026-03-14T09:26:53.589Z
inline std::string to_iso8601(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / 1000);
    int millis = static_cast<int>(ts % 1000);
    if (millis < 0) { millis += 1000; secs -= 1; }
    std::tm tm{};
    ::gmtime_r(&secs, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buf;
}

// Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS", optional ".mmm" and "Z"
inline std::optional<Timestamp> from_iso8601(const std::string& s) {
    std::tm tm{};
    int millis = 0;
    int n = std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d",
                        &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                        &tm.tm_hour, &tm.tm_min, &tm.tm_sec);
    if (n != 6) {
        n = std::sscanf(s.c_str(), "%4d-%2d-%2d %2d:%2d:%2d",
                        &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                        &tm.tm_hour, &tm.tm_min, &tm.tm_sec);
    }
    if (n != 6 && n != 3) return std::nullopt;
    if (n == 3) { tm.tm_hour = tm.tm_min = tm.tm_sec = 0; }
    if (tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31) {
        return std::nullopt;
    }

    auto dot = s.find('.');
    if (n == 6 && dot != std::string::npos) {
        std::string frac;
        for (size_t i = dot + 1; i < s.size() && frac.size() < 3 && std::isdigit(static_cast<unsigned char>(s[i])); ++i) {
            frac += s[i];
        }
        while (frac.size() < 3) frac += '0';
        millis = std::stoi(frac);
    }

    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    std::time_t secs = ::timegm(&tm);
    return static_cast<Timestamp>(secs) * 1000 + millis;
}

// "2026-03-14"
inline std::string date_stamp(Timestamp ts) {
    return to_iso8601(ts).substr(0, 10);
}

inline float clamp01(float v) {
    return std::clamp(v, 0.0f, 1.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Enumerations
// ═══════════════════════════════════════════════════════════════════════════

enum class EntityKind : uint8_t {
    Memory = 0,
    Task = 1
};

enum class Status : uint8_t {
    Todo = 0,
    InProgress = 1,
    Done = 2,
    Blocked = 3
};

enum class Priority : uint8_t {
    Low = 0,
    Medium = 1,
    High = 2,
    Urgent = 3
};

enum class ConnectionType : uint8_t {
    Related = 0,
    Blocks = 1,
    Implements = 2,
    References = 3,
    CausedBy = 4,
    Research = 5
};

inline const char* kind_to_string(EntityKind k) {
    return k == EntityKind::Task ? "task" : "memory";
}

inline const char* status_to_string(Status s) {
    switch (s) {
        case Status::Todo: return "todo";
        case Status::InProgress: return "in_progress";
        case Status::Done: return "done";
        case Status::Blocked: return "blocked";
    }
    return "todo";
}

inline std::optional<Status> parse_status(const std::string& s) {
    if (s == "todo") return Status::Todo;
    if (s == "in_progress") return Status::InProgress;
    if (s == "done") return Status::Done;
    if (s == "blocked") return Status::Blocked;
    return std::nullopt;
}

inline const char* priority_to_string(Priority p) {
    switch (p) {
        case Priority::Low: return "low";
        case Priority::Medium: return "medium";
        case Priority::High: return "high";
        case Priority::Urgent: return "urgent";
    }
    return "medium";
}

inline std::optional<Priority> parse_priority(const std::string& s) {
    if (s == "low") return Priority::Low;
    if (s == "medium") return Priority::Medium;
    if (s == "high") return Priority::High;
    if (s == "urgent") return Priority::Urgent;
    return std::nullopt;
}

inline const char* connection_type_to_string(ConnectionType t) {
    switch (t) {
        case ConnectionType::Related: return "related";
        case ConnectionType::Blocks: return "blocks";
        case ConnectionType::Implements: return "implements";
        case ConnectionType::References: return "references";
        case ConnectionType::CausedBy: return "caused_by";
        case ConnectionType::Research: return "research";
    }
    return "related";
}

inline std::optional<ConnectionType> parse_connection_type(const std::string& s) {
    if (s == "related") return ConnectionType::Related;
    if (s == "blocks") return ConnectionType::Blocks;
    if (s == "implements") return ConnectionType::Implements;
    if (s == "references") return ConnectionType::References;
    if (s == "caused_by") return ConnectionType::CausedBy;
    if (s == "research") return ConnectionType::Research;
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════
// Entities
// ═══════════════════════════════════════════════════════════════════════════

// Directed, scored edge. Stored on the from_id entity.
struct Connection {
    std::string from_id;
    std::string to_id;
    ConnectionType type = ConnectionType::Related;
    float relevance = 0.0f;                  // Always within [0,1]
    std::vector<std::string> matched_terms;  // Audit trail for auto-links
    Timestamp created = 0;
    Timestamp updated = 0;
    bool manual = false;                     // Set by link_items
    std::string reason;

    Timestamp touched() const { return std::max(created, updated); }
};

// Provenance left by the automation engine on every applied change
struct AutomationRecord {
    std::string type;         // Rule that produced the change
    float confidence = 0.0f;
    Timestamp timestamp = 0;
    nlohmann::json details;
};

struct Memory {
    std::string id;
    std::string content;
    std::string title;
    std::string summary;
    std::vector<std::string> tags;   // Ordered, duplicates removed
    std::string category;
    std::string project;
    Priority priority = Priority::Medium;
    Timestamp timestamp = 0;
    int complexity = 1;              // 1-4
    size_t access_count = 0;
    Timestamp last_accessed = 0;
    std::vector<Connection> connections;

    size_t size() const { return content.size(); }
};

struct Task {
    std::string id;
    std::string serial;              // PRJ-C0001
    std::string title;
    std::string description;
    Status status = Status::Todo;
    Priority priority = Priority::Medium;
    std::string project;
    std::string category;
    std::vector<std::string> tags;
    std::string parent_id;
    std::vector<std::string> subtasks;
    std::vector<Connection> connections;
    Timestamp created = 0;
    Timestamp updated = 0;
    std::string status_reason;
    std::optional<AutomationRecord> automation_applied;
};

// Ordered, duplicate-free tag list
inline std::vector<std::string> unique_tags(const std::vector<std::string>& tags) {
    std::vector<std::string> out;
    for (const auto& t : tags) {
        if (t.empty()) continue;
        if (std::find(out.begin(), out.end(), t) == out.end()) out.push_back(t);
    }
    return out;
}

// ═══════════════════════════════════════════════════════════════════════════
// Id generation
// ═══════════════════════════════════════════════════════════════════════════

inline std::string random_hex(size_t len) {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len);
    for (size_t i = 0; i < len; ++i) {
        out += digits[gen() & 0xF];
    }
    return out;
}

// task-2026-03-14-1a2b3c4d / mem-2026-03-14-1a2b3c4d
inline std::string generate_id(EntityKind kind, Timestamp ts = now()) {
    return std::string(kind == EntityKind::Task ? "task-" : "mem-")
        + date_stamp(ts) + "-" + random_hex(8);
}

// ═══════════════════════════════════════════════════════════════════════════
// Atomic file persistence: write temp → fsync → rename → fsync dir
// ═══════════════════════════════════════════════════════════════════════════

// Fsync parent directory for durability
inline bool fsync_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string dir = (slash == std::string::npos) ? "." : path.substr(0, slash);
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) return false;
    int rc = ::fsync(dfd);
    ::close(dfd);
    return rc == 0;
}

// Atomic save: write to temp file, fsync, rename to final path
// Writer function takes FILE* and returns true on success
template <typename Writer>
bool safe_save(const std::string& path, Writer&& write_fn) {
    std::string tmp = path + ".tmp." + std::to_string(::getpid());
    FILE* f = ::fopen(tmp.c_str(), "wb");
    if (!f) return false;

    bool ok = write_fn(f) && ::fflush(f) == 0 && ::fsync(::fileno(f)) == 0;
    ::fclose(f);
    if (!ok) { ::remove(tmp.c_str()); return false; }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        ::remove(tmp.c_str());
        return false;
    }

    fsync_dir(path);
    return true;
}

} // namespace tether
