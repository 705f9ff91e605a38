#pragma once
// Index: the authoritative in-memory view of every memory and task
//
// Rebuilt from DocumentStore at startup, then updated on every save and
// delete. Ids are unique across projects and kinds. Readers get copies
// (get_*) or short-lived pointers (find_*) that are invalidated by the
// next mutation.

#include "types.hpp"
#include "document_store.hpp"
#include "id_resolver.hpp"
#include "tag_index.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <iostream>

namespace tether {

struct ListFilter {
    std::string project;
    std::optional<Status> status;      // Tasks only
    std::string category;
    std::string tag;
    Timestamp since = 0;               // Created at or after
    std::optional<bool> has_memory;    // Tasks only: has an edge to a memory
    size_t offset = 0;
    size_t limit = 0;                  // 0 = unlimited
};

template <typename T>
struct Page {
    std::vector<T> items;
    size_t total = 0;                  // Matches before pagination
    size_t offset = 0;
};

class Index {
public:
    Index() = default;
    Index(const Index&) = delete;
    Index& operator=(const Index&) = delete;

    // ═══════════════════════════════════════════════════════════════════
    // Build and mutate
    // ═══════════════════════════════════════════════════════════════════

    // Replace everything with a fresh load. Returns the number of records
    // dropped because their id was already taken.
    size_t rebuild(const LoadResult& loaded) {
        clear();
        size_t dropped = 0;
        for (const auto& t : loaded.tasks) {
            if (contains(t.id)) { report_duplicate(t.id); ++dropped; continue; }
            put(t);
        }
        for (const auto& m : loaded.memories) {
            if (contains(m.id)) { report_duplicate(m.id); ++dropped; continue; }
            put(m);
        }
        return dropped;
    }

    void clear() {
        memories_.clear();
        tasks_.clear();
        serials_.clear();
        slot_of_.clear();
        slot_ids_.clear();
        free_slots_.clear();
        tags_.clear();
    }

    void put(const Memory& m) {
        tasks_.erase(m.id);
        memories_[m.id] = m;
        tags_.assign(slot_for(m.id), m.tags);
    }

    void put(const Task& t) {
        memories_.erase(t.id);
        auto old = tasks_.find(t.id);
        if (old != tasks_.end() && !old->second.serial.empty()) {
            serials_.erase(IdResolver::normalize_id(old->second.serial));
        }
        tasks_[t.id] = t;
        if (!t.serial.empty()) serials_[IdResolver::normalize_id(t.serial)] = t.id;
        tags_.assign(slot_for(t.id), t.tags);
    }

    bool erase(const std::string& id) {
        auto t = tasks_.find(id);
        if (t != tasks_.end()) {
            if (!t->second.serial.empty()) serials_.erase(IdResolver::normalize_id(t->second.serial));
            tasks_.erase(t);
        } else if (!memories_.erase(id)) {
            return false;
        }
        auto s = slot_of_.find(id);
        if (s != slot_of_.end()) {
            tags_.remove(s->second);
            slot_ids_[s->second].clear();
            free_slots_.push_back(s->second);
            slot_of_.erase(s);
        }
        return true;
    }

    // ═══════════════════════════════════════════════════════════════════
    // Point reads
    // ═══════════════════════════════════════════════════════════════════

    bool contains(const std::string& id) const {
        return tasks_.count(id) || memories_.count(id);
    }

    std::optional<EntityKind> kind_of(const std::string& id) const {
        if (tasks_.count(id)) return EntityKind::Task;
        if (memories_.count(id)) return EntityKind::Memory;
        return std::nullopt;
    }

    const Task* find_task(const std::string& id) const {
        auto it = tasks_.find(id);
        return it == tasks_.end() ? nullptr : &it->second;
    }

    const Memory* find_memory(const std::string& id) const {
        auto it = memories_.find(id);
        return it == memories_.end() ? nullptr : &it->second;
    }

    std::optional<Task> get_task(const std::string& id) const {
        auto* t = find_task(id);
        if (!t) return std::nullopt;
        return *t;
    }

    std::optional<Memory> get_memory(const std::string& id) const {
        auto* m = find_memory(id);
        if (!m) return std::nullopt;
        return *m;
    }

    // Outgoing edges of either kind
    const std::vector<Connection>* connections_of(const std::string& id) const {
        if (auto* t = find_task(id)) return &t->connections;
        if (auto* m = find_memory(id)) return &m->connections;
        return nullptr;
    }

    // Edges stored on other entities that point at id
    std::vector<Connection> incoming(const std::string& id) const {
        std::vector<Connection> out;
        auto scan = [&](const std::vector<Connection>& conns) {
            for (const auto& c : conns) {
                if (c.to_id == id) out.push_back(c);
            }
        };
        for (const auto& [_, t] : tasks_) scan(t.connections);
        for (const auto& [_, m] : memories_) scan(m.connections);
        return out;
    }

    // Tolerant lookup over ids and serials
    Resolution resolve(const std::string& requested) const {
        return IdResolver::resolve(requested, ids(), serials_);
    }

    std::vector<std::string> ids() const {
        std::vector<std::string> out;
        out.reserve(size());
        for (const auto& [id, _] : tasks_) out.push_back(id);
        for (const auto& [id, _] : memories_) out.push_back(id);
        return out;
    }

    const std::unordered_map<std::string, Task>& tasks() const { return tasks_; }
    const std::unordered_map<std::string, Memory>& memories() const { return memories_; }

    size_t size() const { return tasks_.size() + memories_.size(); }
    size_t task_count() const { return tasks_.size(); }
    size_t memory_count() const { return memories_.size(); }

    // ═══════════════════════════════════════════════════════════════════
    // Queries
    // ═══════════════════════════════════════════════════════════════════

    // Newest first; ties by id
    Page<Task> list_tasks(const ListFilter& f) const {
        std::vector<Task> hits;
        auto keep = [&](const Task& t) {
            if (!f.project.empty() && t.project != f.project) return false;
            if (f.status && t.status != *f.status) return false;
            if (!f.category.empty() && t.category != f.category) return false;
            if (f.since && t.created < f.since) return false;
            if (f.has_memory) {
                bool linked = std::any_of(t.connections.begin(), t.connections.end(),
                                          [&](const Connection& c) { return memories_.count(c.to_id) > 0; });
                if (linked != *f.has_memory) return false;
            }
            return true;
        };

        if (!f.tag.empty()) {
            for (uint32_t slot : tags_.slots_with_tag(f.tag)) {
                auto* t = find_task(slot_ids_[slot]);
                if (t && keep(*t)) hits.push_back(*t);
            }
        } else {
            for (const auto& [_, t] : tasks_) {
                if (keep(t)) hits.push_back(t);
            }
        }

        std::sort(hits.begin(), hits.end(), [](const Task& a, const Task& b) {
            if (a.created != b.created) return a.created > b.created;
            return a.id < b.id;
        });
        return paginate(std::move(hits), f);
    }

    Page<Memory> list_memories(const ListFilter& f) const {
        std::vector<Memory> hits;
        auto keep = [&](const Memory& m) {
            if (!f.project.empty() && m.project != f.project) return false;
            if (!f.category.empty() && m.category != f.category) return false;
            if (f.since && m.timestamp < f.since) return false;
            return true;
        };

        if (!f.tag.empty()) {
            for (uint32_t slot : tags_.slots_with_tag(f.tag)) {
                auto* m = find_memory(slot_ids_[slot]);
                if (m && keep(*m)) hits.push_back(*m);
            }
        } else {
            for (const auto& [_, m] : memories_) {
                if (keep(m)) hits.push_back(m);
            }
        }

        std::sort(hits.begin(), hits.end(), [](const Memory& a, const Memory& b) {
            if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
            return a.id < b.id;
        });
        return paginate(std::move(hits), f);
    }

    std::vector<std::string> children_of(const std::string& task_id) const {
        std::vector<std::string> out;
        for (const auto& [id, t] : tasks_) {
            if (t.parent_id == task_id) out.push_back(id);
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    // PRJ-C0001: project prefix, category initial, per-project counter
    std::string next_serial(const std::string& project, const std::string& category) const {
        std::string prefix;
        for (char c : project) {
            if (prefix.size() == 3) break;
            if (std::isalnum(static_cast<unsigned char>(c))) {
                prefix += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
        }
        if (prefix.empty()) prefix = "TSK";
        char cat = category.empty() ? 'G' : static_cast<char>(std::toupper(static_cast<unsigned char>(category[0])));

        size_t count = 0;
        for (const auto& [_, t] : tasks_) {
            if (t.project == project) ++count;
        }
        for (size_t n = count + 1;; ++n) {
            char buf[16];
            std::snprintf(buf, sizeof(buf), "%04zu", n);
            std::string serial = prefix + "-" + cat + buf;
            if (!serials_.count(IdResolver::normalize_id(serial))) return serial;
        }
    }

    const TagIndex& tag_index() const { return tags_; }

private:
    template <typename T>
    static Page<T> paginate(std::vector<T> hits, const ListFilter& f) {
        Page<T> page;
        page.total = hits.size();
        page.offset = f.offset;
        if (f.offset >= hits.size()) return page;
        auto begin = hits.begin() + static_cast<std::ptrdiff_t>(f.offset);
        auto end = (f.limit == 0 || f.offset + f.limit >= hits.size())
                       ? hits.end()
                       : begin + static_cast<std::ptrdiff_t>(f.limit);
        page.items.assign(std::make_move_iterator(begin), std::make_move_iterator(end));
        return page;
    }

    uint32_t slot_for(const std::string& id) {
        auto it = slot_of_.find(id);
        if (it != slot_of_.end()) return it->second;
        uint32_t slot;
        if (!free_slots_.empty()) {
            slot = free_slots_.back();
            free_slots_.pop_back();
            slot_ids_[slot] = id;
        } else {
            slot = static_cast<uint32_t>(slot_ids_.size());
            slot_ids_.push_back(id);
        }
        slot_of_[id] = slot;
        return slot;
    }

    void report_duplicate(const std::string& id) const {
        std::cerr << "[Index] Duplicate id " << id << " ignored\n";
    }

    std::unordered_map<std::string, Memory> memories_;
    std::unordered_map<std::string, Task> tasks_;
    std::unordered_map<std::string, std::string> serials_;   // normalized serial -> id
    std::unordered_map<std::string, uint32_t> slot_of_;
    std::vector<std::string> slot_ids_;
    std::vector<uint32_t> free_slots_;
    TagIndex tags_;
};

} // namespace tether
