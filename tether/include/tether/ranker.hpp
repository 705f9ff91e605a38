#pragma once
// Relevance Ranker: multi-signal 0-1 score between two entities
//
// Candidates are gathered by three strategies and unioned:
//   keyword   shares project/category/tag, contains a keyword or technical
//             term, or was created within keyword_window_days of the target
//   semantic  whatever the similarity provider returns (absent: nothing)
//   context   same project, or created within context_window_days of now
//
// score = semantic*w + project + category + tag_ratio*w
//       + min(keyword_hits/saturation, 1)*w + tech_ratio*w
//       + time + status + priority + multi_strategy + complexity
// clamped to [0,1]. Without a provider the semantic term is omitted.

#include "types.hpp"
#include "config.hpp"
#include "index.hpp"
#include "text.hpp"
#include <algorithm>
#include <cstdlib>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tether {

// Uniform view over memories and tasks
struct Item {
    std::string id;
    EntityKind kind = EntityKind::Memory;
    std::string title;
    std::string text;                  // Title and body
    std::string project;
    std::string category;
    std::vector<std::string> tags;
    Timestamp timestamp = 0;           // Memory timestamp or task created
    std::optional<Status> status;
    Priority priority = Priority::Medium;
    int complexity = 1;

    static Item of(const Memory& m) {
        Item it;
        it.id = m.id;
        it.kind = EntityKind::Memory;
        it.title = m.title;
        it.text = m.title.empty() ? m.content : m.title + "\n" + m.content;
        it.project = m.project;
        it.category = m.category;
        it.tags = m.tags;
        it.timestamp = m.timestamp;
        it.priority = m.priority;
        it.complexity = m.complexity;
        return it;
    }

    static Item of(const Task& t) {
        Item it;
        it.id = t.id;
        it.kind = EntityKind::Task;
        it.title = t.title;
        it.text = t.description.empty() ? t.title : t.title + "\n" + t.description;
        it.project = t.project;
        it.category = t.category;
        it.tags = t.tags;
        it.timestamp = t.created;
        it.status = t.status;
        it.priority = t.priority;
        return it;
    }
};

struct SimilarityHit {
    std::string id;
    float relevance = 0.0f;
};

// External embedding collaborator
class SimilarityProvider {
public:
    virtual ~SimilarityProvider() = default;
    virtual std::vector<SimilarityHit> find_similar(const Item& item, size_t k) const = 0;
};

enum Strategy : uint8_t {
    STRATEGY_KEYWORD = 1 << 0,
    STRATEGY_SEMANTIC = 1 << 1,
    STRATEGY_CONTEXT = 1 << 2
};

struct ScoredCandidate {
    std::string id;
    EntityKind kind = EntityKind::Memory;
    float score = 0.0f;
    uint8_t strategies = 0;
    std::vector<std::string> matched_terms;
    Timestamp timestamp = 0;
};

struct RankOptions {
    EntityKind pool = EntityKind::Task;   // Which kind to rank against the target
    bool skip_done = false;               // Drop done tasks from the pool
    float threshold = -1.0f;              // Keep scores strictly above
    size_t limit = 0;                     // 0 = all
    std::unordered_set<std::string> exclude;
};

class RelevanceRanker {
public:
    RelevanceRanker(const Index& index, RankingWeights weights,
                    const SimilarityProvider* similarity = nullptr)
        : index_(index), w_(std::move(weights)), similarity_(similarity) {}

    void set_similarity(const SimilarityProvider* similarity) { similarity_ = similarity; }
    bool has_similarity() const { return similarity_ != nullptr; }

    // Gather, score, sort, then apply threshold and limit
    std::vector<ScoredCandidate> rank(const Item& target, const RankOptions& opts,
                                      Timestamp at = now()) const {
        Terms terms = extract(target);

        std::unordered_map<std::string, float> semantic;
        if (similarity_) {
            for (const auto& hit : similarity_->find_similar(target, semantic_k_)) {
                semantic[hit.id] = clamp01(hit.relevance);
            }
        }

        std::vector<ScoredCandidate> out;
        auto consider = [&](const Item& cand) {
            if (cand.id == target.id || opts.exclude.count(cand.id)) return;
            if (opts.skip_done && cand.status == Status::Done) return;

            uint8_t strategies = gather(target, terms, cand, at);
            std::optional<float> sem;
            auto s = semantic.find(cand.id);
            if (s != semantic.end()) {
                sem = s->second;
                strategies |= STRATEGY_SEMANTIC;
            }
            if (!strategies) return;

            ScoredCandidate sc;
            sc.id = cand.id;
            sc.kind = cand.kind;
            sc.strategies = strategies;
            sc.timestamp = cand.timestamp;
            sc.score = score(target, terms, cand, strategies, sem, &sc.matched_terms);
            if (sc.score > opts.threshold) out.push_back(std::move(sc));
        };

        if (opts.pool == EntityKind::Task) {
            for (const auto& [_, t] : index_.tasks()) consider(Item::of(t));
        } else {
            for (const auto& [_, m] : index_.memories()) consider(Item::of(m));
        }

        sort(out);
        if (opts.limit && out.size() > opts.limit) out.resize(opts.limit);
        return out;
    }

    // Score one pair as if matched by the given strategies
    float score(const Item& target, const Item& candidate, uint8_t strategies,
                std::optional<float> semantic = std::nullopt,
                std::vector<std::string>* matched = nullptr) const {
        return score(target, extract(target), candidate, strategies, semantic, matched);
    }

    // Keyword-set overlap in [0,1], used where no embedding is available
    float lexical_similarity(const Item& a, const Item& b) const {
        return text::jaccard(text::keywords(a.text), text::keywords(b.text));
    }

    static void sort(std::vector<ScoredCandidate>& v) {
        std::sort(v.begin(), v.end(), [](const ScoredCandidate& a, const ScoredCandidate& b) {
            if (a.score != b.score) return a.score > b.score;
            if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
            return a.id < b.id;
        });
    }

    void set_semantic_k(size_t k) { semantic_k_ = k; }

private:
    struct Terms {
        std::vector<std::string> keywords;   // Normalized words and quoted phrases
        std::vector<std::string> tech;       // Case preserved
    };

    static Terms extract(const Item& item) {
        Terms t;
        t.keywords = text::keywords(item.text);
        for (const auto& q : text::quoted(item.text)) {
            std::string phrase = text::to_lower(q);
            if (std::find(t.keywords.begin(), t.keywords.end(), phrase) == t.keywords.end()) {
                t.keywords.push_back(phrase);
            }
        }
        t.tech = text::tech_terms(item.text);
        return t;
    }

    static bool shares(const std::string& a, const std::string& b) {
        return !a.empty() && a == b;
    }

    static size_t tag_overlap(const Item& a, const Item& b) {
        size_t n = 0;
        for (const auto& tag : a.tags) {
            if (std::find(b.tags.begin(), b.tags.end(), tag) != b.tags.end()) ++n;
        }
        return n;
    }

    uint8_t gather(const Item& target, const Terms& terms, const Item& cand, Timestamp at) const {
        uint8_t strategies = 0;
        Timestamp gap = std::llabs(target.timestamp - cand.timestamp);

        bool keyword = shares(target.project, cand.project) ||
                       shares(target.category, cand.category) ||
                       tag_overlap(target, cand) > 0 ||
                       gap <= w_.keyword_window_days * DAY_MS;
        if (!keyword) {
            std::string hay = text::normalize(cand.text);
            for (const auto& k : terms.keywords) {
                if (text::contains_term(hay, text::normalize(k))) { keyword = true; break; }
            }
            if (!keyword) {
                for (const auto& t : terms.tech) {
                    if (text::contains_term(cand.text, t)) { keyword = true; break; }
                }
            }
        }
        if (keyword) strategies |= STRATEGY_KEYWORD;

        if (shares(target.project, cand.project) ||
            at - cand.timestamp <= w_.context_window_days * DAY_MS) {
            strategies |= STRATEGY_CONTEXT;
        }
        return strategies;
    }

    float score(const Item& target, const Terms& terms, const Item& cand, uint8_t strategies,
                std::optional<float> semantic, std::vector<std::string>* matched) const {
        float s = 0.0f;

        if (semantic) s += *semantic * w_.semantic;
        if (shares(target.project, cand.project)) s += w_.same_project;
        if (shares(target.category, cand.category)) s += w_.same_category;

        size_t overlap = tag_overlap(target, cand);
        size_t tag_max = std::max(target.tags.size(), cand.tags.size());
        if (overlap && tag_max) {
            s += w_.tag_overlap * static_cast<float>(overlap) / static_cast<float>(tag_max);
        }

        std::string hay = text::normalize(cand.text);
        size_t keyword_hits = 0;
        for (const auto& k : terms.keywords) {
            if (text::contains_term(hay, text::normalize(k))) {
                ++keyword_hits;
                if (matched) matched->push_back(k);
            }
        }
        s += w_.keywords * std::min(1.0f, static_cast<float>(keyword_hits) /
                                          static_cast<float>(w_.keyword_saturation));

        size_t tech_hits = 0;
        for (const auto& t : terms.tech) {
            if (text::contains_term(cand.text, t)) {
                ++tech_hits;
                if (matched) matched->push_back(t);
            }
        }
        s += w_.tech_terms * static_cast<float>(tech_hits) /
             static_cast<float>(std::max<size_t>(terms.tech.size(), 1));

        Timestamp gap = std::llabs(target.timestamp - cand.timestamp);
        if (gap <= DAY_MS) s += w_.time_day;
        else if (gap <= 7 * DAY_MS) s += w_.time_week;
        else if (gap <= 30 * DAY_MS) s += w_.time_month;

        // Status and priority come from the task side of the pair
        const Item* task = cand.kind == EntityKind::Task ? &cand
                         : target.kind == EntityKind::Task ? &target : nullptr;
        if (task && task->status) {
            switch (*task->status) {
                case Status::InProgress: s += w_.status_in_progress; break;
                case Status::Todo: s += w_.status_todo; break;
                case Status::Blocked: s += w_.status_blocked; break;
                case Status::Done: break;
            }
        }
        if (task) {
            if (task->priority == Priority::Urgent) s += w_.priority_urgent;
            else if (task->priority == Priority::High) s += w_.priority_high;
        }

        // Complexity comes from the memory side
        const Item* memory = target.kind == EntityKind::Memory ? &target
                           : cand.kind == EntityKind::Memory ? &cand : nullptr;
        if (memory && memory->complexity >= w_.complexity_min) s += w_.complexity;

        int strategy_count = ((strategies & STRATEGY_KEYWORD) ? 1 : 0) +
                             ((strategies & STRATEGY_SEMANTIC) ? 1 : 0) +
                             ((strategies & STRATEGY_CONTEXT) ? 1 : 0);
        if (strategy_count > 1) s += w_.multi_strategy;

        return clamp01(s);
    }

    const Index& index_;
    RankingWeights w_;
    const SimilarityProvider* similarity_;
    size_t semantic_k_ = 10;
};

} // namespace tether
