#pragma once
// Relationship Linker: scored edges between memories and tasks
//
// Auto-linking ranks the opposite pool against an entity and writes the
// accepted matches in both directions. Re-linking merges into the
// existing edge (union of matched terms, max relevance) so an unchanged
// neighbourhood produces no new edges and no writes.
//
// The linker edits entities in the Index and reports which ids it
// touched; persisting them is the caller's job.

#include "types.hpp"
#include "errors.hpp"
#include "config.hpp"
#include "index.hpp"
#include "ranker.hpp"
#include "classifier.hpp"
#include <algorithm>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>
#include <iostream>

namespace tether {

struct LinkResult {
    size_t created = 0;
    size_t updated = 0;
    std::vector<Connection> edges;          // Accepted edges from the linked entity
    std::set<std::string> touched;          // Entities whose connections changed
};

struct RelatedItem {
    std::string id;
    EntityKind kind = EntityKind::Memory;
    std::string title;
    float relevance = 0.0f;
    std::string type;                       // Connection type, or "suggested"
    std::string direction;                  // outgoing | incoming | suggestion
    std::vector<std::string> matched_terms;
};

struct RelatedResult {
    std::string id;
    std::vector<RelatedItem> connected;
    std::vector<RelatedItem> suggestions;
};

struct GraphNode {
    std::string id;
    EntityKind kind = EntityKind::Memory;
    std::string title;
    std::string project;
    std::optional<Status> status;
};

struct ConnectionGraph {
    std::vector<GraphNode> nodes;
    std::vector<Connection> edges;
};

class RelationshipLinker {
public:
    RelationshipLinker(Index& index, const RelevanceRanker& ranker,
                       const Classifier& classifier, LinkerConfig config)
        : index_(index), ranker_(ranker), classifier_(classifier), config_(std::move(config)) {}

    void set_quiet(bool quiet) { quiet_ = quiet; }

    // ═══════════════════════════════════════════════════════════════════
    // Auto-discovery
    // ═══════════════════════════════════════════════════════════════════

    LinkResult link(const std::string& id, Timestamp at = now()) {
        LinkResult result;
        auto kind = index_.kind_of(id);
        if (!kind) throw NotFoundError(id);

        Item target = *kind == EntityKind::Task ? Item::of(*index_.find_task(id))
                                                : Item::of(*index_.find_memory(id));

        RankOptions opts;
        opts.pool = *kind == EntityKind::Task ? EntityKind::Memory : EntityKind::Task;
        opts.skip_done = opts.pool == EntityKind::Task && config_.skip_done_tasks;
        opts.threshold = config_.threshold;
        opts.limit = config_.top_n;

        for (const auto& cand : ranker_.rank(target, opts, at)) {
            // Edge type follows the memory's wording
            const std::string& memory_id = *kind == EntityKind::Memory ? id : cand.id;
            ConnectionType type = classifier_.auto_link_type(index_.find_memory(memory_id)->content);

            Connection edge;
            edge.type = type;
            edge.relevance = clamp01(cand.score);
            edge.matched_terms = cand.matched_terms;
            edge.created = edge.updated = at;

            int forward = upsert(id, cand.id, edge, result.touched);
            upsert(cand.id, id, edge, result.touched);
            if (forward > 0) ++result.created;
            else if (forward == 0) ++result.updated;

            for (const auto& c : *index_.connections_of(id)) {
                if (c.to_id == cand.id) result.edges.push_back(c);
            }
        }

        if (!quiet_ && !result.touched.empty()) {
            std::cerr << "[Linker] " << id << ": " << result.created << " new, "
                      << result.updated << " updated edges\n";
        }
        return result;
    }

    // ═══════════════════════════════════════════════════════════════════
    // Manual edges
    // ═══════════════════════════════════════════════════════════════════

    // Ids must already be resolved. A repeat link merges into the existing edge.
    Connection link_items(const std::string& from, const std::string& to, ConnectionType type,
                          const std::string& reason, std::set<std::string>& touched,
                          Timestamp at = now()) {
        if (!index_.contains(from)) throw NotFoundError(from);
        if (!index_.contains(to)) throw NotFoundError(to);
        if (from == to) throw ValidationError("to", "Cannot link an item to itself");

        Connection edge;
        edge.type = type;
        edge.relevance = 1.0f;
        edge.created = edge.updated = at;
        edge.manual = true;
        edge.reason = reason;
        upsert(from, to, edge, touched);

        for (const auto& c : *index_.connections_of(from)) {
            if (c.to_id == to) return c;
        }
        return edge;
    }

    // Removes edges in both directions; returns how many were removed
    size_t unlink(const std::string& a, const std::string& b, std::set<std::string>& touched) {
        return remove_edges(a, [&](const Connection& c) { return c.to_id == b; }, touched) +
               remove_edges(b, [&](const Connection& c) { return c.to_id == a; }, touched);
    }

    // Drop every edge that targets id (before deleting it)
    size_t detach(const std::string& id, std::set<std::string>& touched) {
        size_t removed = 0;
        for (const auto& owner : owners_of_edges_to(id)) {
            removed += remove_edges(owner, [&](const Connection& c) { return c.to_id == id; }, touched);
        }
        return removed;
    }

    // Point every edge at a retired id to survivor instead, merging
    // duplicates and dropping edges that would become self-loops.
    // The retired entities' own edges move onto the survivor.
    void redirect(const std::vector<std::string>& retired, const std::string& survivor,
                  std::set<std::string>& touched, Timestamp at = now()) {
        std::unordered_set<std::string> gone(retired.begin(), retired.end());

        for (const auto& old : retired) {
            auto* conns = index_.connections_of(old);
            if (!conns) continue;
            std::vector<Connection> own = *conns;
            for (const auto& edge : own) {
                if (edge.to_id == survivor || gone.count(edge.to_id)) continue;
                upsert(survivor, edge.to_id, edge, touched, at);
            }
        }

        for (const auto& old : retired) {
            for (const auto& owner : owners_of_edges_to(old)) {
                if (gone.count(owner)) continue;
                std::vector<Connection> moved;
                for (const auto& c : *index_.connections_of(owner)) {
                    if (c.to_id == old) moved.push_back(c);
                }
                remove_edges(owner, [&](const Connection& c) { return c.to_id == old; }, touched);
                if (owner == survivor) continue;
                for (auto edge : moved) {
                    upsert(owner, survivor, edge, touched, at);
                }
            }
        }
    }

    // ═══════════════════════════════════════════════════════════════════
    // Queries
    // ═══════════════════════════════════════════════════════════════════

    RelatedResult related(const std::string& id, Timestamp at = now()) const {
        RelatedResult result;
        result.id = id;
        auto kind = index_.kind_of(id);
        if (!kind) throw NotFoundError(id);

        std::unordered_set<std::string> seen;
        for (const auto& c : *index_.connections_of(id)) {
            result.connected.push_back(describe(c.to_id, c, "outgoing"));
            seen.insert(c.to_id);
        }
        for (const auto& c : index_.incoming(id)) {
            if (seen.count(c.from_id)) continue;
            result.connected.push_back(describe(c.from_id, c, "incoming"));
            seen.insert(c.from_id);
        }
        std::sort(result.connected.begin(), result.connected.end(),
                  [](const RelatedItem& a, const RelatedItem& b) {
                      if (a.relevance != b.relevance) return a.relevance > b.relevance;
                      return a.id < b.id;
                  });

        Item target = *kind == EntityKind::Task ? Item::of(*index_.find_task(id))
                                                : Item::of(*index_.find_memory(id));
        RankOptions opts;
        opts.threshold = config_.threshold;
        opts.exclude = seen;

        std::vector<ScoredCandidate> pool;
        for (EntityKind k : {EntityKind::Memory, EntityKind::Task}) {
            opts.pool = k;
            auto part = ranker_.rank(target, opts, at);
            pool.insert(pool.end(), part.begin(), part.end());
        }
        RelevanceRanker::sort(pool);
        if (pool.size() > config_.suggestion_limit) pool.resize(config_.suggestion_limit);

        for (const auto& cand : pool) {
            RelatedItem item;
            item.id = cand.id;
            item.kind = cand.kind;
            item.title = title_of(cand.id);
            item.relevance = cand.score;
            item.type = "suggested";
            item.direction = "suggestion";
            item.matched_terms = cand.matched_terms;
            result.suggestions.push_back(std::move(item));
        }
        return result;
    }

    ConnectionGraph graph(const std::string& project = "") const {
        ConnectionGraph g;
        std::unordered_set<std::string> ids;
        for (const auto& [id, t] : index_.tasks()) {
            if (!project.empty() && t.project != project) continue;
            g.nodes.push_back({id, EntityKind::Task, t.title, t.project, t.status});
            ids.insert(id);
        }
        for (const auto& [id, m] : index_.memories()) {
            if (!project.empty() && m.project != project) continue;
            g.nodes.push_back({id, EntityKind::Memory, title_of(id), m.project, std::nullopt});
            ids.insert(id);
        }
        std::sort(g.nodes.begin(), g.nodes.end(),
                  [](const GraphNode& a, const GraphNode& b) { return a.id < b.id; });

        for (const auto& node : g.nodes) {
            for (const auto& c : *index_.connections_of(node.id)) {
                if (ids.count(c.to_id)) g.edges.push_back(c);
            }
        }
        return g;
    }

    std::string title_of(const std::string& id) const {
        if (auto* t = index_.find_task(id)) return t->title;
        if (auto* m = index_.find_memory(id)) {
            if (!m->title.empty()) return m->title;
            std::string first = m->content.substr(0, m->content.find('\n'));
            return first.size() > 80 ? first.substr(0, 77) + "..." : first;
        }
        return "";
    }

private:
    // Returns 1 when a new edge was added, 0 when an existing edge changed,
    // -1 when nothing changed
    int upsert(const std::string& owner, const std::string& to, const Connection& incoming,
               std::set<std::string>& touched, Timestamp at = 0) {
        if (owner == to) return -1;
        Timestamp stamp = at ? at : incoming.updated;

        auto apply = [&](std::vector<Connection>& conns) -> int {
            for (auto& c : conns) {
                if (c.to_id != to) continue;
                bool changed = false;
                for (const auto& term : incoming.matched_terms) {
                    if (std::find(c.matched_terms.begin(), c.matched_terms.end(), term) == c.matched_terms.end()) {
                        c.matched_terms.push_back(term);
                        changed = true;
                    }
                }
                float rel = clamp01(std::max(c.relevance, incoming.relevance));
                if (rel != c.relevance) { c.relevance = rel; changed = true; }
                if (incoming.manual && (!c.manual || c.type != incoming.type || c.reason != incoming.reason)) {
                    c.manual = true;
                    c.type = incoming.type;
                    c.reason = incoming.reason;
                    changed = true;
                }
                if (!changed) return -1;
                c.updated = stamp;
                return 0;
            }
            Connection fresh = incoming;
            fresh.from_id = owner;
            fresh.to_id = to;
            fresh.relevance = clamp01(fresh.relevance);
            if (at) fresh.created = fresh.updated = at;
            conns.push_back(std::move(fresh));
            return 1;
        };

        int outcome = -1;
        if (auto* t = index_.find_task(owner)) {
            Task copy = *t;
            outcome = apply(copy.connections);
            if (outcome >= 0) index_.put(copy);
        } else if (auto* m = index_.find_memory(owner)) {
            Memory copy = *m;
            outcome = apply(copy.connections);
            if (outcome >= 0) index_.put(copy);
        }
        if (outcome >= 0) touched.insert(owner);
        return outcome;
    }

    template <typename Pred>
    size_t remove_edges(const std::string& owner, Pred pred, std::set<std::string>& touched) {
        auto strip = [&](std::vector<Connection>& conns) {
            auto before = conns.size();
            conns.erase(std::remove_if(conns.begin(), conns.end(), pred), conns.end());
            return before - conns.size();
        };
        size_t removed = 0;
        if (auto* t = index_.find_task(owner)) {
            Task copy = *t;
            removed = strip(copy.connections);
            if (removed) index_.put(copy);
        } else if (auto* m = index_.find_memory(owner)) {
            Memory copy = *m;
            removed = strip(copy.connections);
            if (removed) index_.put(copy);
        }
        if (removed) touched.insert(owner);
        return removed;
    }

    std::vector<std::string> owners_of_edges_to(const std::string& id) const {
        std::vector<std::string> owners;
        for (const auto& c : index_.incoming(id)) {
            if (std::find(owners.begin(), owners.end(), c.from_id) == owners.end()) {
                owners.push_back(c.from_id);
            }
        }
        return owners;
    }

    RelatedItem describe(const std::string& other, const Connection& c, const char* direction) const {
        RelatedItem item;
        item.id = other;
        item.kind = index_.kind_of(other).value_or(EntityKind::Memory);
        item.title = title_of(other);
        item.relevance = c.relevance;
        item.type = connection_type_to_string(c.type);
        item.direction = direction;
        item.matched_terms = c.matched_terms;
        return item;
    }

    Index& index_;
    const RelevanceRanker& ranker_;
    const Classifier& classifier_;
    LinkerConfig config_;
    bool quiet_ = false;
};

} // namespace tether
