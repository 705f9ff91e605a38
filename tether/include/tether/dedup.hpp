#pragma once
// Deduplication Engine: duplicate memory groups and their resolution
//
// Pairs at or above the threshold are merged with union-find, so groups
// are transitive: A~B and B~C put A, B and C together even when A~C is
// low. Similarity comes from the embedding provider when one is
// attached, otherwise from keyword-set overlap.
//
// Survivor order: has title and summary, then newest, then longest
// content, then smallest id. Every edge to a retired memory is
// redirected to the survivor before the retired memory is removed.

#include "types.hpp"
#include "index.hpp"
#include "ranker.hpp"
#include "linker.hpp"
#include "text.hpp"
#include <algorithm>
#include <map>
#include <numeric>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <iostream>

namespace tether {

struct SimilarPair {
    std::string a;
    std::string b;
    float similarity = 0.0f;
};

struct DedupGroup {
    std::string survivor;
    std::vector<std::string> duplicates;   // Retired in favour of survivor
    std::vector<SimilarPair> pairs;        // Evidence, above threshold
    std::string project;
};

struct DedupReport {
    bool dry_run = true;
    float threshold = 0.0f;
    std::string project;                   // Empty: all projects
    size_t scanned = 0;
    std::vector<DedupGroup> groups;
    std::vector<Memory> removed;           // Empty on dry runs
    std::set<std::string> touched;         // Survivors and peers with rewritten edges
};

class DeduplicationEngine {
public:
    DeduplicationEngine(Index& index, const RelevanceRanker& ranker, RelationshipLinker& linker,
                        const SimilarityProvider* similarity = nullptr)
        : index_(index), ranker_(ranker), linker_(linker), similarity_(similarity) {}

    void set_similarity(const SimilarityProvider* similarity) { similarity_ = similarity; }
    void set_quiet(bool quiet) { quiet_ = quiet; }

    // Groups only; touches nothing
    DedupReport analyze(const std::string& project, float threshold) const {
        DedupReport report;
        report.project = project;
        report.threshold = threshold;

        std::vector<const Memory*> pool;
        for (const auto& [_, m] : index_.memories()) {
            if (project.empty() || m.project == project) pool.push_back(&m);
        }
        std::sort(pool.begin(), pool.end(),
                  [](const Memory* a, const Memory* b) { return a->id < b->id; });
        report.scanned = pool.size();

        std::unordered_map<std::string, size_t> pos;
        for (size_t i = 0; i < pool.size(); ++i) pos[pool[i]->id] = i;

        std::vector<size_t> parent(pool.size());
        std::iota(parent.begin(), parent.end(), 0);
        auto root_of = [&](size_t x) {
            while (parent[x] != x) { parent[x] = parent[parent[x]]; x = parent[x]; }
            return x;
        };

        std::vector<SimilarPair> edges;
        for (const auto& p : similar_pairs(pool, pos)) {
            if (p.similarity <= threshold) continue;   // Strictly above
            size_t ra = root_of(pos[p.a]), rb = root_of(pos[p.b]);
            if (ra != rb) parent[std::max(ra, rb)] = std::min(ra, rb);
            edges.push_back(p);
        }

        std::map<size_t, std::vector<const Memory*>> members;
        for (size_t i = 0; i < pool.size(); ++i) members[root_of(i)].push_back(pool[i]);

        for (auto& [root, group] : members) {
            if (group.size() < 2) continue;
            const Memory* keep = *std::min_element(group.begin(), group.end(), &DeduplicationEngine::better);

            DedupGroup g;
            g.survivor = keep->id;
            g.project = keep->project;
            for (const auto* m : group) {
                if (m != keep) g.duplicates.push_back(m->id);
            }
            for (const auto& e : edges) {
                if (root_of(pos[e.a]) == root) g.pairs.push_back(e);
            }
            report.groups.push_back(std::move(g));
        }
        return report;
    }

    // Analyze, then (unless dry_run) retire duplicates from the Index.
    // The caller persists report.touched and deletes report.removed.
    DedupReport run(const std::string& project, float threshold, bool dry_run, Timestamp at = now()) {
        DedupReport report = analyze(project, threshold);
        report.dry_run = dry_run;
        if (dry_run) return report;

        for (const auto& g : report.groups) {
            linker_.redirect(g.duplicates, g.survivor, report.touched, at);
            for (const auto& id : g.duplicates) {
                const Memory* m = index_.find_memory(id);
                if (!m) continue;
                report.removed.push_back(*m);
                index_.erase(id);
                report.touched.erase(id);
            }
            if (!quiet_) std::cerr << "[Dedup] Kept " << g.survivor << ", retired " << g.duplicates.size() << "\n";
        }
        return report;
    }

    // Survivor ordering: true when a should be kept over b
    static bool better(const Memory* a, const Memory* b) {
        bool a_full = !a->title.empty() && !a->summary.empty();
        bool b_full = !b->title.empty() && !b->summary.empty();
        if (a_full != b_full) return a_full;
        if (a->timestamp != b->timestamp) return a->timestamp > b->timestamp;
        if (a->content.size() != b->content.size()) return a->content.size() > b->content.size();
        return a->id < b->id;
    }

private:
    std::vector<SimilarPair> similar_pairs(const std::vector<const Memory*>& pool,
                                           const std::unordered_map<std::string, size_t>& pos) const {
        std::vector<SimilarPair> out;

        if (similarity_) {
            // Symmetric: keep the higher of the two directions
            std::map<std::pair<std::string, std::string>, float> best;
            for (const auto* m : pool) {
                for (const auto& hit : similarity_->find_similar(Item::of(*m), pool.size())) {
                    if (hit.id == m->id || !pos.count(hit.id)) continue;
                    auto key = std::minmax(m->id, hit.id);
                    auto& slot = best[{key.first, key.second}];
                    slot = std::max(slot, clamp01(hit.relevance));
                }
            }
            for (const auto& [key, sim] : best) out.push_back({key.first, key.second, sim});
            return out;
        }

        std::vector<Item> items;
        items.reserve(pool.size());
        for (const auto* m : pool) items.push_back(Item::of(*m));
        for (size_t i = 0; i < items.size(); ++i) {
            for (size_t j = i + 1; j < items.size(); ++j) {
                float sim = ranker_.lexical_similarity(items[i], items[j]);
                if (sim > 0.0f) out.push_back({items[i].id, items[j].id, sim});
            }
        }
        return out;
    }

    Index& index_;
    const RelevanceRanker& ranker_;
    RelationshipLinker& linker_;
    const SimilarityProvider* similarity_;
    bool quiet_ = false;
};

} // namespace tether
