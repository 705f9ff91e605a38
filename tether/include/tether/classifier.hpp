#pragma once
// Classifier: text heuristics behind linking and automation
//
// The engines only see the Classifier interface. PatternClassifier is the
// default implementation and is driven entirely by a JSON pattern table;
// an embedding-backed classifier can replace it without touching them.
//
// Status intent scoring per status table:
//   +pattern weight for each regex that matches
//   +indicator weight for each indicator phrase present
//   +boost when anything matched
//   +valid_transition when current -> status is legal, same_status when equal
// clamped to [0,1]; the best-scoring status wins.

#include "types.hpp"
#include "errors.hpp"
#include "text.hpp"
#include "transitions.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

namespace tether {

using json = nlohmann::json;

struct StatusIntent {
    std::optional<Status> suggested_status;
    float confidence = 0.0f;
    std::string matched_phrase;
};

struct WorkflowMatch {
    std::string rule;
    Status status = Status::Done;
    float confidence = 0.0f;
    std::vector<std::string> matched;
};

class Classifier {
public:
    virtual ~Classifier() = default;

    virtual StatusIntent parse_status_intent(const std::string& text, Status current) const = 0;

    // Category-specific completion heuristics over task and evidence text
    virtual std::optional<WorkflowMatch> match_workflow(const Task& task, const std::string& text) const = 0;

    // Does the text name what the task is waiting on?
    virtual bool has_blocking_marker(const std::string& text) const = 0;

    // Type for an auto-discovered edge from a memory with this text
    virtual ConnectionType auto_link_type(const std::string& text) const = 0;
};

// Built-in pattern table
inline const char* DEFAULT_PATTERN_TABLE = R"JSON({
  "weights": {"pattern": 0.4, "indicator": 0.25, "valid_transition": 0.1, "same_status": -0.2},
  "status_intents": [
    {
      "status": "done",
      "boost": 0.1,
      "patterns": [
        "\\b(complete[ds]?|finished|done|closed|resolved|achieved|accomplished)\\b",
        "\\b(shipped|deployed|delivered|submitted|released|merged)\\b",
        "\\b(fixed|solved|handled|wrapped up)\\b",
        "\\b(implemented|successfully|tests? pass(ed|ing)?|all tests)\\b"
      ],
      "indicators": ["completed", "finished", "resolved", "fixed", "implemented",
                     "successfully", "tests passing", "shipped", "merged", "deployed"]
    },
    {
      "status": "in_progress",
      "boost": 0.1,
      "patterns": [
        "\\b(start(ed|ing)?|begin(ning)?|working on|in progress|ongoing|currently)\\b",
        "\\b(implementing|developing|building|creating|writing)\\b",
        "\\b(coding|debugging|testing|reviewing|investigating)\\b"
      ],
      "indicators": ["started", "working on", "in progress", "implementing", "halfway"]
    },
    {
      "status": "blocked",
      "boost": 0.15,
      "patterns": [
        "\\b(blocked|stuck|waiting (for|on)|depends on|on hold|halted)\\b",
        "\\b(can't|cannot|unable to|need help)\\b",
        "\\b(broken|failing|crash(es|ed)?)\\b"
      ],
      "indicators": ["blocked by", "waiting for", "stuck on", "can't proceed", "need access"]
    },
    {
      "status": "todo",
      "boost": 0.05,
      "patterns": [
        "\\b(todo|backlog|later|planned|need to|going to|next up)\\b",
        "\\b(postpone[ds]?|defer(red)?|reprioriti[sz]ed)\\b"
      ],
      "indicators": ["not started", "back to todo", "deprioritized", "put on the list"]
    }
  ],
  "workflows": [
    {
      "name": "code_tested_and_reviewed",
      "category": "code",
      "when_status": "in_progress",
      "require_all": [
        "test.*pass|test.*complete|all tests|testing done",
        "review.*complete|code review|pr.*approve|merge.*ready"
      ],
      "propose": "done",
      "confidence": 0.8
    },
    {
      "name": "research_concluded",
      "category": "research",
      "when_status": "in_progress",
      "require_all": [
        "research.*complete|findings|conclusion|result|analysis.*done"
      ],
      "propose": "done",
      "confidence": 0.75
    }
  ],
  "blocking_markers": ["waiting for", "depends on", "blocked by", "need"],
  "research_markers": ["research", "investigation", "analysis", "study"]
})JSON";

class PatternClassifier : public Classifier {
public:
    PatternClassifier() : PatternClassifier(json::parse(DEFAULT_PATTERN_TABLE)) {}

    explicit PatternClassifier(const json& table) {
        try {
            load(table);
        } catch (const std::regex_error& e) {
            throw ValidationError("classifier", std::string("Invalid pattern: ") + e.what());
        } catch (const json::exception& e) {
            throw ValidationError("classifier", std::string("Invalid pattern table: ") + e.what());
        }
    }

    static PatternClassifier from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) throw StorageError("read", path, "cannot open pattern table");
        std::stringstream ss;
        ss << in.rdbuf();
        json table;
        try {
            table = json::parse(ss.str());
        } catch (const json::parse_error& e) {
            throw ValidationError("classifier", std::string("Malformed pattern table: ") + e.what());
        }
        return PatternClassifier(table);
    }

    StatusIntent parse_status_intent(const std::string& text, Status current) const override {
        StatusIntent best;
        std::string lower = text::to_lower(text);

        for (const auto& table : intents_) {
            float score = 0.0f;
            std::vector<std::string> matched;

            for (const auto& re : table.patterns) {
                std::string hit;
                if (text::regex_search_bounded(lower, re, &hit)) {
                    score += pattern_weight_;
                    matched.push_back(hit);
                }
            }
            for (const auto& ind : table.indicators) {
                if (lower.find(ind) != std::string::npos) {
                    score += indicator_weight_;
                    if (std::find(matched.begin(), matched.end(), ind) == matched.end()) {
                        matched.push_back(ind);
                    }
                }
            }
            if (matched.empty()) continue;

            score += table.boost;
            if (table.status == current) {
                score += same_status_weight_;
            } else if (is_legal_transition(current, table.status)) {
                score += valid_transition_weight_;
            }
            score = clamp01(score);

            if (score > best.confidence) {
                best.suggested_status = table.status;
                best.confidence = score;
                best.matched_phrase = join(matched);
            }
        }
        return best;
    }

    std::optional<WorkflowMatch> match_workflow(const Task& task, const std::string& text) const override {
        std::string lower = text::to_lower(text);
        for (const auto& wf : workflows_) {
            if (!wf.category.empty() && text::to_lower(task.category) != wf.category) continue;
            if (wf.when_status && task.status != *wf.when_status) continue;

            WorkflowMatch match;
            bool all = true;
            for (const auto& re : wf.require_all) {
                std::string hit;
                if (!text::regex_search_bounded(lower, re, &hit)) { all = false; break; }
                match.matched.push_back(hit);
            }
            if (!all) continue;

            match.rule = wf.name;
            match.status = wf.propose;
            match.confidence = wf.confidence;
            return match;
        }
        return std::nullopt;
    }

    bool has_blocking_marker(const std::string& text) const override {
        std::string lower = text::to_lower(text);
        for (const auto& marker : blocking_markers_) {
            if (text::contains_term(lower, marker)) return true;
        }
        return false;
    }

    ConnectionType auto_link_type(const std::string& text) const override {
        std::string lower = text::to_lower(text);
        for (const auto& marker : research_markers_) {
            if (lower.find(marker) != std::string::npos) return ConnectionType::Research;
        }
        return ConnectionType::Related;
    }

private:
    struct IntentTable {
        Status status;
        float boost = 0.0f;
        std::vector<std::regex> patterns;
        std::vector<std::string> indicators;
    };

    struct Workflow {
        std::string name;
        std::string category;
        std::optional<Status> when_status;
        std::vector<std::regex> require_all;
        Status propose = Status::Done;
        float confidence = 0.0f;
    };

    static std::regex compile(const std::string& pattern) {
        return std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
    }

    static Status require_status(const json& j, const char* key) {
        auto s = parse_status(j.at(key).get<std::string>());
        if (!s) throw ValidationError("classifier", std::string("Unknown status in '") + key + "'");
        return *s;
    }

    void load(const json& table) {
        if (table.contains("weights")) {
            const auto& w = table["weights"];
            pattern_weight_ = w.value("pattern", pattern_weight_);
            indicator_weight_ = w.value("indicator", indicator_weight_);
            valid_transition_weight_ = w.value("valid_transition", valid_transition_weight_);
            same_status_weight_ = w.value("same_status", same_status_weight_);
        }

        for (const auto& entry : table.value("status_intents", json::array())) {
            IntentTable t;
            t.status = require_status(entry, "status");
            t.boost = entry.value("boost", 0.0f);
            for (const auto& p : entry.value("patterns", std::vector<std::string>{})) {
                t.patterns.push_back(compile(p));
            }
            for (const auto& ind : entry.value("indicators", std::vector<std::string>{})) {
                t.indicators.push_back(text::to_lower(ind));
            }
            intents_.push_back(std::move(t));
        }

        for (const auto& entry : table.value("workflows", json::array())) {
            Workflow wf;
            wf.name = entry.value("name", "workflow");
            wf.category = text::to_lower(entry.value("category", ""));
            if (entry.contains("when_status")) wf.when_status = require_status(entry, "when_status");
            for (const auto& p : entry.value("require_all", std::vector<std::string>{})) {
                wf.require_all.push_back(compile(p));
            }
            if (wf.require_all.empty()) {
                throw ValidationError("classifier", "Workflow '" + wf.name + "' has no patterns");
            }
            wf.propose = require_status(entry, "propose");
            wf.confidence = clamp01(entry.value("confidence", 0.0f));
            workflows_.push_back(std::move(wf));
        }

        for (const auto& m : table.value("blocking_markers", std::vector<std::string>{})) {
            blocking_markers_.push_back(text::to_lower(m));
        }
        for (const auto& m : table.value("research_markers", std::vector<std::string>{})) {
            research_markers_.push_back(text::to_lower(m));
        }
    }

    static std::string join(const std::vector<std::string>& parts) {
        std::string out;
        for (const auto& p : parts) {
            if (!out.empty()) out += ", ";
            out += p;
        }
        return out;
    }

    float pattern_weight_ = 0.4f;
    float indicator_weight_ = 0.25f;
    float valid_transition_weight_ = 0.1f;
    float same_status_weight_ = -0.2f;
    std::vector<IntentTable> intents_;
    std::vector<Workflow> workflows_;
    std::vector<std::string> blocking_markers_;
    std::vector<std::string> research_markers_;
};

} // namespace tether
