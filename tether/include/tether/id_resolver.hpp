#pragma once
// Id Resolver: tolerant lookup of entity ids and task serials
//
// Resolution order:
//   1. exact id
//   2. serial (case-insensitive), e.g. "api-c0003"
//   3. normalized id (case, quotes, '_'/' ' vs '-')
//   4. unique prefix of at least 8 characters
//   5. unique nearest id within edit distance 2
// Anything else is NotFound (or Ambiguous) with the nearest ids as suggestions.

#include "text.hpp"
#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

namespace tether {

enum class ResolveStatus {
    Exact,
    Resolved,      // Unambiguous near-match
    Ambiguous,
    NotFound
};

struct Resolution {
    ResolveStatus status = ResolveStatus::NotFound;
    std::string id;
    std::vector<std::string> suggestions;

    bool found() const { return status == ResolveStatus::Exact || status == ResolveStatus::Resolved; }
};

class IdResolver {
public:
    static constexpr size_t MIN_PREFIX = 8;
    static constexpr size_t MAX_EDIT_DISTANCE = 2;
    static constexpr size_t MAX_SUGGESTIONS = 3;

    static std::string normalize_id(const std::string& raw) {
        std::string s = raw;
        auto strip = [](char c) { return c == ' ' || c == '\t' || c == '"' || c == '\'' ||
                                         c == '`' || c == '[' || c == ']' || c == '<' || c == '>'; };
        while (!s.empty() && strip(s.front())) s.erase(s.begin());
        while (!s.empty() && strip(s.back())) s.pop_back();
        s = text::to_lower(s);

        std::string out;
        for (char c : s) {
            char d = (c == '_' || c == ' ') ? '-' : c;
            if (d == '-' && !out.empty() && out.back() == '-') continue;
            out += d;
        }
        return out;
    }

    static size_t edit_distance(const std::string& a, const std::string& b) {
        std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
        for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;
        for (size_t i = 1; i <= a.size(); ++i) {
            cur[0] = i;
            for (size_t j = 1; j <= b.size(); ++j) {
                size_t sub = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
                cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, sub});
            }
            std::swap(prev, cur);
        }
        return prev[b.size()];
    }

    // known: every live id; serials: normalized serial -> id
    static Resolution resolve(const std::string& requested,
                              const std::vector<std::string>& known,
                              const std::unordered_map<std::string, std::string>& serials = {}) {
        Resolution r;
        if (std::find(known.begin(), known.end(), requested) != known.end()) {
            r.status = ResolveStatus::Exact;
            r.id = requested;
            return r;
        }

        std::string norm = normalize_id(requested);
        if (norm.empty()) return r;

        auto sit = serials.find(norm);
        if (sit != serials.end()) {
            r.status = ResolveStatus::Resolved;
            r.id = sit->second;
            return r;
        }

        std::vector<std::string> normalized_hits;
        std::vector<std::string> prefix_hits;
        std::vector<std::pair<size_t, std::string>> distances;
        distances.reserve(known.size());

        for (const auto& id : known) {
            std::string n = normalize_id(id);
            if (n == norm) normalized_hits.push_back(id);
            if (norm.size() >= MIN_PREFIX && n.compare(0, norm.size(), norm) == 0) {
                prefix_hits.push_back(id);
            }
            distances.emplace_back(edit_distance(norm, n), id);
        }
        std::sort(distances.begin(), distances.end());

        if (normalized_hits.size() == 1) {
            r.status = ResolveStatus::Resolved;
            r.id = normalized_hits.front();
            return r;
        }
        if (prefix_hits.size() == 1) {
            r.status = ResolveStatus::Resolved;
            r.id = prefix_hits.front();
            return r;
        }
        if (prefix_hits.size() > 1) {
            std::sort(prefix_hits.begin(), prefix_hits.end());
            r.status = ResolveStatus::Ambiguous;
            r.suggestions.assign(prefix_hits.begin(),
                                 prefix_hits.begin() + std::min(MAX_SUGGESTIONS, prefix_hits.size()));
            return r;
        }

        if (!distances.empty() && distances[0].first <= MAX_EDIT_DISTANCE) {
            bool tie = distances.size() > 1 && distances[1].first == distances[0].first;
            if (!tie) {
                r.status = ResolveStatus::Resolved;
                r.id = distances[0].second;
                return r;
            }
            r.status = ResolveStatus::Ambiguous;
        }

        size_t limit = std::max<size_t>(3, norm.size() / 3);
        for (const auto& [d, id] : distances) {
            if (r.suggestions.size() >= MAX_SUGGESTIONS || d > limit) break;
            r.suggestions.push_back(id);
        }
        return r;
    }
};

} // namespace tether
