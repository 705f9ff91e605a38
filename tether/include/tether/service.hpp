#pragma once
// Service: the one object a host talks to
//
// Owns the Index, the DocumentStore and every engine, and hands the
// Index to each engine by reference. Every public call takes the
// service lock, so writes to a project file are serialized.
//
// Write order: DocumentStore first, then Index. When a write fails the
// error is logged with its path, the Index is resynced from disk, and
// the host gets a generic StorageError.

#include "types.hpp"
#include "errors.hpp"
#include "config.hpp"
#include "document_store.hpp"
#include "index.hpp"
#include "classifier.hpp"
#include "ranker.hpp"
#include "linker.hpp"
#include "dedup.hpp"
#include "automation.hpp"
#include "transitions.hpp"
#include "text.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>
#include <iostream>

namespace tether {

// Unset fields keep their current (or default) value
struct TaskInput {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<Status> status;
    std::optional<Priority> priority;
    std::optional<std::string> project;
    std::optional<std::string> category;
    std::optional<std::vector<std::string>> tags;
    std::optional<std::string> parent_id;        // Empty string clears
    std::optional<std::string> status_reason;
};

struct MemoryInput {
    std::optional<std::string> content;
    std::optional<std::string> title;
    std::optional<std::string> summary;
    std::optional<std::vector<std::string>> tags;
    std::optional<std::string> category;
    std::optional<std::string> project;
    std::optional<Priority> priority;
    std::optional<int> complexity;
};

struct TaskContext {
    Task task;
    std::optional<Task> parent;
    std::vector<Task> subtasks;
    std::vector<Memory> memories;              // Directly connected
    std::vector<Memory> related_memories;      // deep: via siblings and children
    std::vector<Task> related_tasks;           // deep: share a direct memory
};

struct TaskStats {
    size_t total = 0;
    size_t with_memories = 0;
    std::map<std::string, size_t> by_status;
    std::map<std::string, size_t> by_priority;
    std::map<std::string, size_t> by_project;
};

struct SearchHit {
    Task task;
    float score = 0.0f;                        // Fraction of query terms present
};

class Service {
public:
    explicit Service(Config config,
                     std::shared_ptr<StorageBackend> backend = nullptr,
                     std::unique_ptr<Classifier> classifier = nullptr)
        : config_(std::move(config)),
          store_(backend ? std::move(backend) : std::make_shared<FileBackend>(),
                 config_.store, config_.quiet),
          classifier_(classifier ? std::move(classifier) : default_classifier(config_)),
          ranker_(index_, config_.ranking),
          linker_(index_, ranker_, *classifier_, config_.linker),
          dedup_(index_, ranker_, linker_),
          automation_(index_, *classifier_, config_.automation) {
        config_.validate();
        ranker_.set_semantic_k(config_.linker.semantic_k);
        automation_.on_commit([this](const Task& t) { commit_task(t); });
        linker_.set_quiet(config_.quiet);
        automation_.set_quiet(config_.quiet);
        dedup_.set_quiet(config_.quiet);
        for (const auto& p : config_.validation.placeholder_patterns) {
            try {
                placeholders_.emplace_back(p, std::regex::ECMAScript | std::regex::icase);
            } catch (const std::regex_error& e) {
                throw ValidationError("validation.placeholder_patterns",
                                      "Invalid placeholder pattern '" + p + "': " + e.what());
            }
        }
    }

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    // Load every project into the Index. Returns the number of entities.
    size_t open() {
        std::lock_guard<std::mutex> lock(mutex_);
        resync();
        if (!config_.quiet) {
            std::cerr << "[Service] Opened " << store_.base_dir() << ": "
                      << index_.task_count() << " tasks, " << index_.memory_count() << " memories\n";
        }
        return index_.size();
    }

    // Attach or detach an embedding provider
    void set_similarity(const SimilarityProvider* similarity) {
        std::lock_guard<std::mutex> lock(mutex_);
        ranker_.set_similarity(similarity);
        dedup_.set_similarity(similarity);
    }

    const Config& config() const { return config_; }
    const Index& index() const { return index_; }
    AutomationEngine& automation() { return automation_; }

    // ═══════════════════════════════════════════════════════════════════
    // Tasks
    // ═══════════════════════════════════════════════════════════════════

    Task create_task(const TaskInput& in) {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp at = now();

        Task t;
        t.title = validate_title(in.title.value_or(""));
        t.description = trim(in.description.value_or(""));
        t.status = in.status.value_or(Status::Todo);
        t.priority = in.priority.value_or(Priority::Medium);
        t.project = project_or_default(in.project);
        t.category = trim(in.category.value_or(""));
        t.tags = unique_tags(in.tags.value_or(std::vector<std::string>{}));
        t.status_reason = in.status_reason.value_or("");
        t.created = t.updated = at;
        t.id = fresh_id(EntityKind::Task, at);
        t.serial = index_.next_serial(t.project, t.category);

        std::optional<Task> parent;
        if (in.parent_id && !in.parent_id->empty()) {
            parent = *index_.find_task(resolve(*in.parent_id, EntityKind::Task));
            t.parent_id = parent->id;
            if (std::find(parent->subtasks.begin(), parent->subtasks.end(), t.id) == parent->subtasks.end()) {
                parent->subtasks.push_back(t.id);
            }
            parent->updated = at;
        }

        write("create task", t.id, [&] {
            store_.save(t.project, t);
            index_.put(t);
            if (parent) {
                store_.save(parent->project, *parent);
                index_.put(*parent);
            }
        });

        relink(t.id, at);
        return *index_.find_task(t.id);
    }

    Task update_task(const std::string& requested, const TaskInput& in) {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp at = now();
        std::string id = resolve(requested, EntityKind::Task);
        Task before = *index_.find_task(id);
        Task t = before;

        if (in.title) t.title = validate_title(*in.title);
        if (in.description) t.description = trim(*in.description);
        if (in.priority) t.priority = *in.priority;
        if (in.project) t.project = project_or_default(in.project);
        if (in.category) t.category = trim(*in.category);
        if (in.tags) t.tags = unique_tags(*in.tags);
        if (in.status_reason) t.status_reason = *in.status_reason;

        if (in.status && *in.status != t.status) {
            if (!is_legal_transition(t.status, *in.status, TransitionOrigin::Manual)) {
                throw InvalidTransitionError(t.status, *in.status);
            }
            t.status = *in.status;
        }

        std::vector<Task> peers;   // Old and new parents
        if (in.parent_id) {
            std::string new_parent;
            if (!in.parent_id->empty()) {
                new_parent = resolve(*in.parent_id, EntityKind::Task);
                check_parent(id, new_parent);
            }
            if (new_parent != t.parent_id) {
                if (auto* old = index_.find_task(t.parent_id)) {
                    Task p = *old;
                    p.subtasks.erase(std::remove(p.subtasks.begin(), p.subtasks.end(), id), p.subtasks.end());
                    p.updated = at;
                    peers.push_back(std::move(p));
                }
                if (!new_parent.empty()) {
                    Task p = *index_.find_task(new_parent);
                    if (std::find(p.subtasks.begin(), p.subtasks.end(), id) == p.subtasks.end()) {
                        p.subtasks.push_back(id);
                    }
                    p.updated = at;
                    peers.push_back(std::move(p));
                }
                t.parent_id = new_parent;
            }
        }
        t.updated = at;

        write("update task", id, [&] {
            if (before.project != t.project) store_.remove_task(before.project, id);
            store_.save(t.project, t);
            index_.put(t);
            for (const auto& p : peers) {
                store_.save(p.project, p);
                index_.put(p);
            }
        });

        relink(id, at);
        return *index_.find_task(id);
    }

    // Removes the task, every edge that targets it, and its place in the
    // hierarchy. Children become top-level tasks.
    Task delete_task(const std::string& requested) {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp at = now();
        std::string id = resolve(requested, EntityKind::Task);
        Task doomed = *index_.find_task(id);

        std::set<std::string> touched;
        linker_.detach(id, touched);

        std::vector<Task> peers;
        if (auto* parent = index_.find_task(doomed.parent_id)) {
            Task p = *parent;
            p.subtasks.erase(std::remove(p.subtasks.begin(), p.subtasks.end(), id), p.subtasks.end());
            p.updated = at;
            peers.push_back(std::move(p));
        }
        for (const auto& child_id : index_.children_of(id)) {
            Task c = *index_.find_task(child_id);
            c.parent_id.clear();
            c.updated = at;
            peers.push_back(std::move(c));
        }

        write("delete task", id, [&] {
            store_.remove_task(doomed.project, id);
            index_.erase(id);
            touched.erase(id);
            for (const auto& p : peers) {
                index_.put(p);
                touched.insert(p.id);
            }
            persist(touched);
        });
        return doomed;
    }

    Task get_task(const std::string& requested) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return *index_.find_task(resolve(requested, EntityKind::Task));
    }

    Page<Task> list_tasks(const ListFilter& filter) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.list_tasks(filter);
    }

    // Term-overlap search over title and description
    std::vector<SearchHit> search_tasks(const std::string& query, ListFilter filter) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> terms = text::keywords(query);
        if (terms.empty()) terms = text::split_words(text::normalize(query));
        if (terms.empty()) return {};

        size_t offset = filter.offset, limit = filter.limit;
        filter.offset = 0;
        filter.limit = 0;

        std::vector<SearchHit> hits;
        for (auto& t : index_.list_tasks(filter).items) {
            std::string hay = text::normalize(t.title + " " + t.description);
            size_t present = 0;
            for (const auto& term : terms) {
                if (text::contains_term(hay, term)) ++present;
            }
            if (!present) continue;
            float score = static_cast<float>(present) / static_cast<float>(terms.size());
            hits.push_back({std::move(t), score});
        }
        std::sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
            if (a.score != b.score) return a.score > b.score;
            if (a.task.updated != b.task.updated) return a.task.updated > b.task.updated;
            return a.task.id < b.task.id;
        });

        if (offset >= hits.size()) return {};
        hits.erase(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(offset));
        if (limit && hits.size() > limit) hits.resize(limit);
        return hits;
    }

    TaskStats task_stats(const std::string& project = "") const {
        std::lock_guard<std::mutex> lock(mutex_);
        TaskStats s;
        for (const auto& [_, t] : index_.tasks()) {
            if (!project.empty() && t.project != project) continue;
            ++s.total;
            ++s.by_status[status_to_string(t.status)];
            ++s.by_priority[priority_to_string(t.priority)];
            ++s.by_project[t.project];
            bool linked = std::any_of(t.connections.begin(), t.connections.end(),
                                      [&](const Connection& c) { return index_.find_memory(c.to_id) != nullptr; });
            if (linked) ++s.with_memories;
        }
        return s;
    }

    TaskContext task_context(const std::string& requested, bool deep = false) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string id = resolve(requested, EntityKind::Task);
        TaskContext ctx;
        ctx.task = *index_.find_task(id);

        if (auto* p = index_.find_task(ctx.task.parent_id)) ctx.parent = *p;
        for (const auto& sid : ctx.task.subtasks) {
            if (auto* s = index_.find_task(sid)) ctx.subtasks.push_back(*s);
        }

        std::set<std::string> direct = memories_of(id);
        for (const auto& mid : direct) ctx.memories.push_back(*index_.find_memory(mid));
        if (!deep) return ctx;

        std::set<std::string> family;
        for (const auto& s : ctx.subtasks) family.insert(s.id);
        if (ctx.parent) {
            for (const auto& sid : ctx.parent->subtasks) {
                if (sid != id) family.insert(sid);
            }
        }
        std::set<std::string> indirect;
        for (const auto& fid : family) {
            for (const auto& mid : memories_of(fid)) {
                if (!direct.count(mid)) indirect.insert(mid);
            }
        }
        for (const auto& mid : indirect) ctx.related_memories.push_back(*index_.find_memory(mid));

        std::set<std::string> related;
        for (const auto& mid : direct) {
            for (const auto& tid : tasks_of(mid)) {
                if (tid != id) related.insert(tid);
            }
        }
        for (const auto& tid : related) ctx.related_tasks.push_back(*index_.find_task(tid));
        return ctx;
    }

    // ═══════════════════════════════════════════════════════════════════
    // Memories
    // ═══════════════════════════════════════════════════════════════════

    Memory add_memory(const MemoryInput& in) {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp at = now();

        Memory m;
        m.content = validate_content(in.content.value_or(""));
        m.title = trim(in.title.value_or(""));
        m.summary = trim(in.summary.value_or(""));
        m.tags = unique_tags(in.tags.value_or(std::vector<std::string>{}));
        m.category = trim(in.category.value_or(""));
        m.project = project_or_default(in.project);
        m.priority = in.priority.value_or(Priority::Medium);
        m.complexity = std::clamp(in.complexity.value_or(1), 1, 4);
        m.timestamp = at;
        m.id = fresh_id(EntityKind::Memory, at);

        write("add memory", m.id, [&] {
            store_.save(m.project, m);
            index_.put(m);
        });

        relink(m.id, at);
        return *index_.find_memory(m.id);
    }

    Memory update_memory(const std::string& requested, const MemoryInput& in) {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp at = now();
        std::string id = resolve(requested, EntityKind::Memory);
        Memory before = *index_.find_memory(id);
        Memory m = before;

        if (in.content) m.content = validate_content(*in.content);
        if (in.title) m.title = trim(*in.title);
        if (in.summary) m.summary = trim(*in.summary);
        if (in.tags) m.tags = unique_tags(*in.tags);
        if (in.category) m.category = trim(*in.category);
        if (in.project) m.project = project_or_default(in.project);
        if (in.priority) m.priority = *in.priority;
        if (in.complexity) m.complexity = std::clamp(*in.complexity, 1, 4);

        write("update memory", id, [&] {
            if (before.project != m.project) store_.remove_memory(before.project, id);
            store_.save(m.project, m);
            index_.put(m);
        });

        relink(id, at);
        return *index_.find_memory(id);
    }

    Memory delete_memory(const std::string& requested) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string id = resolve(requested, EntityKind::Memory);
        Memory doomed = *index_.find_memory(id);

        std::set<std::string> touched;
        linker_.detach(id, touched);
        write("delete memory", id, [&] {
            store_.remove_memory(doomed.project, id);
            index_.erase(id);
            touched.erase(id);
            persist(touched);
        });
        return doomed;
    }

    Memory get_memory(const std::string& requested) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return *index_.find_memory(resolve(requested, EntityKind::Memory));
    }

    // Record a read: access_count and last_accessed
    Memory touch_memory(const std::string& requested) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string id = resolve(requested, EntityKind::Memory);
        Memory m = *index_.find_memory(id);
        ++m.access_count;
        m.last_accessed = now();
        write("touch memory", id, [&] {
            store_.save(m.project, m);
            index_.put(m);
        });
        return m;
    }

    Page<Memory> list_memories(const ListFilter& filter) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.list_memories(filter);
    }

    // ═══════════════════════════════════════════════════════════════════
    // Relationships
    // ═══════════════════════════════════════════════════════════════════

    Connection link_items(const std::string& from, const std::string& to,
                          const std::string& type, const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto parsed = parse_connection_type(type.empty() ? "related" : type);
        if (!parsed) throw ValidationError("type", "Unknown connection type '" + type + "'");

        std::string a = resolve(from);
        std::string b = resolve(to);
        std::set<std::string> touched;
        Connection edge = linker_.link_items(a, b, *parsed, reason, touched);
        write("link", a + " -> " + b, [&] { persist(touched); });
        return edge;
    }

    // Returns the number of edges removed (0 when none existed)
    size_t unlink_items(const std::string& from, const std::string& to) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string a = resolve(from);
        std::string b = resolve(to);
        std::set<std::string> touched;
        size_t removed = linker_.unlink(a, b, touched);
        if (removed) write("unlink", a + " -> " + b, [&] { persist(touched); });
        return removed;
    }

    RelatedResult get_related(const std::string& requested) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return linker_.related(resolve(requested));
    }

    ConnectionGraph connection_graph(const std::string& project = "") const {
        std::lock_guard<std::mutex> lock(mutex_);
        return linker_.graph(project);
    }

    // ═══════════════════════════════════════════════════════════════════
    // Automation and maintenance
    // ═══════════════════════════════════════════════════════════════════

    AutomationReport run_automation_check() {
        std::lock_guard<std::mutex> lock(mutex_);
        AutomationReport report = automation_.run_check(now());
        if (!config_.quiet) {
            std::cerr << "[Service] Automation: " << report.evaluated << " evaluated, "
                      << report.proposals.size() << " proposed, " << report.applied.size()
                      << " applied, " << report.advisories.size() << " advisories\n";
        }
        return report;
    }

    Evaluation evaluate_task(const std::string& requested) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return automation_.evaluate(resolve(requested, EntityKind::Task), now());
    }

    Task apply_automated_update(const Proposal& proposal) {
        std::lock_guard<std::mutex> lock(mutex_);
        return automation_.apply(proposal, now());
    }

    DedupReport deduplicate(const std::string& project = "",
                            std::optional<float> threshold = std::nullopt,
                            bool dry_run = true) {
        std::lock_guard<std::mutex> lock(mutex_);
        float th = threshold.value_or(config_.dedup.threshold);
        if (th < 0.0f || th > 1.0f) throw ValidationError("threshold", "threshold must be within [0,1]");

        DedupReport report = dedup_.run(project, th, dry_run);
        if (!dry_run && !report.groups.empty()) {
            write("deduplicate", project.empty() ? "*" : project, [&] {
                for (const auto& m : report.removed) store_.remove_memory(m.project, m.id);
                persist(report.touched);
            });
        }
        return report;
    }

private:
    static std::unique_ptr<Classifier> default_classifier(const Config& config) {
        if (!config.automation.classifier_path.empty()) {
            return std::make_unique<PatternClassifier>(
                PatternClassifier::from_file(config.automation.classifier_path));
        }
        return std::make_unique<PatternClassifier>();
    }

    // Exact or tolerant; NotFoundError carries suggestions
    std::string resolve(const std::string& requested,
                        std::optional<EntityKind> kind = std::nullopt) const {
        Resolution r = index_.resolve(requested);
        if (!r.found()) throw NotFoundError(requested, r.suggestions);
        if (kind && index_.kind_of(r.id) != kind) {
            throw NotFoundError(requested, {});
        }
        return r.id;
    }

    std::string fresh_id(EntityKind kind, Timestamp at) const {
        std::string id;
        do { id = generate_id(kind, at); } while (index_.contains(id));
        return id;
    }

    std::string project_or_default(const std::optional<std::string>& project) const {
        std::string p = trim(project.value_or(""));
        return p.empty() ? config_.store.default_project : p;
    }

    bool is_placeholder(const std::string& s) const {
        for (const auto& re : placeholders_) {
            if (text::regex_search_bounded(s, re)) return true;
        }
        return false;
    }

    std::string validate_title(const std::string& raw) const {
        std::string title = trim(raw);
        if (title.empty()) throw ValidationError("title", "Task title is required");
        if (title.size() < config_.validation.min_title_length) {
            throw ValidationError("title", "Task title must be at least " +
                                  std::to_string(config_.validation.min_title_length) + " characters");
        }
        if (is_placeholder(title)) {
            throw ValidationError("title", "Task title looks like placeholder data: " + title);
        }
        return title;
    }

    std::string validate_content(const std::string& raw) const {
        std::string content = trim(raw);
        if (content.empty()) throw ValidationError("content", "Memory content is required");
        if (content.size() < config_.validation.min_content_length) {
            throw ValidationError("content", "Memory content must be at least " +
                                  std::to_string(config_.validation.min_content_length) + " characters");
        }
        if (is_placeholder(content)) {
            throw ValidationError("content", "Memory content looks like placeholder data");
        }
        return content;
    }

    // Walking up from the new parent must never reach the task itself
    void check_parent(const std::string& id, const std::string& parent_id) const {
        if (parent_id == id) throw ValidationError("parent_id", "A task cannot be its own parent");
        std::set<std::string> seen;
        std::string cur = parent_id;
        while (!cur.empty()) {
            if (cur == id) throw ValidationError("parent_id", "Parent link would create a cycle");
            if (!seen.insert(cur).second) break;
            const Task* t = index_.find_task(cur);
            cur = t ? t->parent_id : "";
        }
    }

    std::set<std::string> memories_of(const std::string& task_id) const {
        std::set<std::string> out;
        if (auto* t = index_.find_task(task_id)) {
            for (const auto& c : t->connections) {
                if (index_.find_memory(c.to_id)) out.insert(c.to_id);
            }
        }
        for (const auto& c : index_.incoming(task_id)) {
            if (index_.find_memory(c.from_id)) out.insert(c.from_id);
        }
        return out;
    }

    std::set<std::string> tasks_of(const std::string& memory_id) const {
        std::set<std::string> out;
        if (auto* m = index_.find_memory(memory_id)) {
            for (const auto& c : m->connections) {
                if (index_.find_task(c.to_id)) out.insert(c.to_id);
            }
        }
        for (const auto& c : index_.incoming(memory_id)) {
            if (index_.find_task(c.from_id)) out.insert(c.from_id);
        }
        return out;
    }

    void relink(const std::string& id, Timestamp at) {
        if (!config_.linker.auto_link) return;
        LinkResult result = linker_.link(id, at);
        if (!result.touched.empty()) {
            write("link", id, [&] { persist(result.touched); });
        }
    }

    // Save every listed entity that still exists
    void persist(const std::set<std::string>& ids) {
        for (const auto& id : ids) {
            if (auto* t = index_.find_task(id)) {
                store_.save(t->project, *t);
            } else if (auto* m = index_.find_memory(id)) {
                store_.save(m->project, *m);
            }
        }
    }

    // Automation commit path; the caller already holds the lock
    void commit_task(const Task& t) {
        write("automation update", t.id, [&] {
            store_.save(t.project, t);
            index_.put(t);
        });
    }

    template <typename Fn>
    void write(const char* op, const std::string& target, Fn&& fn) {
        try {
            fn();
        } catch (const StorageError& e) {
            std::cerr << "[Service] " << op << " " << target << " failed: " << e.what() << "\n";
            resync();
            throw StorageError(op, target, "storage unavailable");
        }
    }

    void resync() {
        LoadResult loaded = store_.load_all();
        index_.rebuild(loaded);
    }

    Config config_;
    mutable std::mutex mutex_;
    DocumentStore store_;
    Index index_;
    std::unique_ptr<Classifier> classifier_;
    RelevanceRanker ranker_;
    RelationshipLinker linker_;
    DeduplicationEngine dedup_;
    AutomationEngine automation_;
    std::vector<std::regex> placeholders_;
};

} // namespace tether
