#pragma once
// Text: token extraction shared by ranking, search and deduplication
//
// keywords()   lower-cased words longer than three characters, stop-words removed
// tech_terms() CamelCase and ALLCAPS runs, case preserved
// quoted()     "double-quoted" or `backticked` phrases
//
// Tokens are found by scanning; regex is kept for short, bounded subjects.

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

namespace tether::text {

inline const std::unordered_set<std::string>& stop_words() {
    static const std::unordered_set<std::string> words = {
        "the", "is", "at", "which", "on", "a", "an", "and", "or", "but",
        "in", "with", "to", "for", "of", "as", "by", "that", "this", "it",
        "from", "be", "are", "been", "being", "have", "has", "had", "do",
        "does", "did", "will", "would", "should", "could", "may", "might",
        "into", "then", "than", "when", "what", "there", "their", "them",
        "they", "these", "those", "also", "just", "some", "such", "about"
    };
    return words;
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool is_word_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

// Lower-case and replace punctuation with spaces
inline std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += is_word_char(c) ? static_cast<char>(std::tolower(static_cast<unsigned char>(c))) : ' ';
    }
    return out;
}

inline std::vector<std::string> split_words(const std::string& normalized) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : normalized) {
        if (c == ' ') {
            if (!cur.empty()) out.push_back(std::move(cur));
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) out.push_back(std::move(cur));
    return out;
}

// Unique, in first-seen order
inline std::vector<std::string> keywords(const std::string& s) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    const auto& stops = stop_words();
    for (auto& w : split_words(normalize(s))) {
        if (w.size() <= 3 || stops.count(w)) continue;
        if (seen.insert(w).second) out.push_back(std::move(w));
    }
    return out;
}

// One ASCII word: ALLCAPS with optional digits, camelCase, or CamelCase
// with at least two humps
inline bool is_tech_term(const std::string& w) {
    auto upper = [](char c) { return c >= 'A' && c <= 'Z'; };
    auto lower = [](char c) { return c >= 'a' && c <= 'z'; };
    auto digit = [](char c) { return c >= '0' && c <= '9'; };
    size_t n = w.size();

    size_t i = 0;
    while (i < n && upper(w[i])) ++i;
    if (i >= 2) {
        size_t j = i;
        while (j < n && digit(w[j])) ++j;
        if (j == n) return true;
    }

    i = 0;
    while (i < n && lower(w[i])) ++i;
    size_t prefix = i, humps = 0;
    while (i < n && upper(w[i])) {
        size_t j = i + 1;
        while (j < n && (lower(w[j]) || digit(w[j]))) ++j;
        if (j == i + 1) return false;
        ++humps;
        i = j;
    }
    if (i != n) return false;
    return prefix ? humps >= 1 : humps >= 2;
}

inline std::vector<std::string> tech_terms(const std::string& s) {
    auto word = [](char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    };
    std::vector<std::string> out;
    size_t i = 0;
    while (i < s.size()) {
        if (!word(s[i])) { ++i; continue; }
        size_t j = i;
        while (j < s.size() && word(s[j])) ++j;
        std::string term = s.substr(i, j - i);
        if (is_tech_term(term) && std::find(out.begin(), out.end(), term) == out.end()) {
            out.push_back(std::move(term));
        }
        i = j;
    }
    return out;
}

// Phrases of two or more characters; an unclosed quote yields nothing
inline std::vector<std::string> quoted(const std::string& s) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < s.size()) {
        char q = s[i];
        if (q != '"' && q != '`') { ++i; continue; }
        size_t close = s.find(q, i + 1);
        if (close == std::string::npos || close - i - 1 < 2) { ++i; continue; }
        std::string phrase = s.substr(i + 1, close - i - 1);
        if (std::find(out.begin(), out.end(), phrase) == out.end()) out.push_back(std::move(phrase));
        i = close + 1;
    }
    return out;
}

// std::regex recursion depth grows with match length, so text is searched
// a line at a time, long lines in REGEX_CHUNK pieces. A match never spans
// a piece; ^ anchors only at the start of the text.
constexpr size_t REGEX_CHUNK = 1024;

inline bool regex_search_bounded(const std::string& s, const std::regex& re, std::string* hit = nullptr) {
    size_t start = 0;
    while (true) {
        size_t nl = s.find('\n', start);
        size_t line_end = nl == std::string::npos ? s.size() : nl;
        size_t pos = start;
        while (true) {
            size_t end = std::min(line_end, pos + REGEX_CHUNK);
            auto flags = pos == 0 ? std::regex_constants::match_default
                                  : std::regex_constants::match_prev_avail;
            std::smatch m;
            if (std::regex_search(s.cbegin() + static_cast<std::ptrdiff_t>(pos),
                                  s.cbegin() + static_cast<std::ptrdiff_t>(end), m, re, flags)) {
                if (hit) *hit = m.str();
                return true;
            }
            if (end >= line_end) break;
            pos = end;
        }
        if (nl == std::string::npos) return false;
        start = nl + 1;
    }
}

// Whole-word (or whole-phrase) containment. Case-sensitive; normalize both
// sides first for a case-insensitive match.
inline bool contains_term(const std::string& haystack, const std::string& term) {
    if (term.empty()) return false;
    size_t pos = 0;
    while ((pos = haystack.find(term, pos)) != std::string::npos) {
        bool left = pos == 0 || !is_word_char(haystack[pos - 1]);
        size_t end = pos + term.size();
        bool right = end >= haystack.size() || !is_word_char(haystack[end]);
        if (left && right) return true;
        ++pos;
    }
    return false;
}

inline float jaccard(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    if (a.empty() && b.empty()) return 0.0f;
    std::unordered_set<std::string> sa(a.begin(), a.end());
    std::unordered_set<std::string> sb(b.begin(), b.end());
    size_t inter = 0;
    for (const auto& x : sa) inter += sb.count(x);
    size_t uni = sa.size() + sb.size() - inter;
    return uni == 0 ? 0.0f : static_cast<float>(inter) / static_cast<float>(uni);
}

} // namespace tether::text
