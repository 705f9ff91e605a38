#pragma once
// Config: typed settings loaded from a JSON data file
//
// Every field has a working default; a config file only needs the keys
// it overrides. validate() rejects values the engines cannot run with.
//
//   {
//     "store": {"base_dir": "~/.tether"},
//     "linker": {"top_n": 5, "threshold": 0.3},
//     "automation": {"interval_ms": 60000, "batch_size": 10}
//   }

#include "types.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <iostream>

namespace tether {

using json = nlohmann::json;

struct StoreConfig {
    std::string base_dir = "tether-data";     // Root of {base}/{project}/...
    std::string tasks_file = "tasks.md";
    std::string memories_file = "memories.md";
    std::string default_project = "default";
};

// Weighted-sum terms of the relevance score
struct RankingWeights {
    float semantic = 0.35f;            // Only when a similarity provider is present
    float same_project = 0.25f;
    float same_category = 0.15f;
    float tag_overlap = 0.15f;
    float keywords = 0.12f;
    float tech_terms = 0.10f;
    float time_day = 0.08f;
    float time_week = 0.06f;
    float time_month = 0.04f;
    float status_in_progress = 0.05f;
    float status_todo = 0.03f;
    float status_blocked = 0.02f;
    float priority_urgent = 0.04f;
    float priority_high = 0.03f;
    float multi_strategy = 0.05f;
    float complexity = 0.02f;
    size_t keyword_saturation = 5;     // Hits needed for the full keyword term
    int complexity_min = 3;
    int keyword_window_days = 30;      // Keyword strategy: created within N days
    int context_window_days = 7;       // Context strategy: created within N days of now
};

struct LinkerConfig {
    bool auto_link = true;             // Link on every create/update
    size_t top_n = 5;
    float threshold = 0.3f;            // Strictly above
    size_t semantic_k = 10;            // findSimilar fan-out
    bool skip_done_tasks = true;       // Done tasks are not link candidates
    size_t suggestion_limit = 5;       // get_related content suggestions
};

struct AutomationConfig {
    int64_t interval_ms = 60000;               // Scheduler tick
    size_t batch_size = 10;
    bool auto_apply = true;                    // Apply proposals on tick
    int64_t staleness_ms = HOUR_MS;            // Apply window
    int64_t evidence_window_ms = DAY_MS;       // Memory evidence lookback
    float evidence_min_confidence = 0.6f;      // Per-signal floor
    float evidence_avg_threshold = 0.7f;       // Average must exceed
    size_t evidence_min_signals = 1;
    int64_t stale_in_progress_ms = 7 * DAY_MS;
    int64_t urgent_todo_ms = 3 * DAY_MS;
    int64_t long_blocked_ms = 5 * DAY_MS;
    float subtasks_done_confidence = 0.95f;
    float subtask_blocked_confidence = 0.7f;
    float parent_resumed_confidence = 0.8f;
    float advisory_confidence = 0.6f;
    float urgent_delay_confidence = 0.7f;
    std::string classifier_path;               // Empty: built-in pattern tables
};

struct DedupConfig {
    float threshold = 0.85f;
};

struct ValidationConfig {
    size_t min_title_length = 5;
    size_t min_content_length = 3;
    std::vector<std::string> placeholder_patterns = {
        "^mock-\\d+",
        "\\btest task\\b",
        "\\bsample.*task\\b",
        "\\blorem ipsum\\b",
        "\\bfake.*task\\b",
        "\\bplaceholder.*task\\b",
        "\\bdummy.*task\\b",
        "\\btodo.*test.*task\\b"
    };
};

struct Config {
    StoreConfig store;
    RankingWeights ranking;
    LinkerConfig linker;
    AutomationConfig automation;
    DedupConfig dedup;
    ValidationConfig validation;
    bool quiet = false;                // Suppress informational log lines

    // Overlay a JSON document onto the defaults
    static Config from_json(const json& j) {
        Config c;
        if (!j.is_object()) {
            throw ValidationError("config", "Config root must be a JSON object");
        }
        c.quiet = j.value("quiet", c.quiet);

        if (j.contains("store")) {
            const auto& s = j["store"];
            c.store.base_dir = s.value("base_dir", c.store.base_dir);
            c.store.tasks_file = s.value("tasks_file", c.store.tasks_file);
            c.store.memories_file = s.value("memories_file", c.store.memories_file);
            c.store.default_project = s.value("default_project", c.store.default_project);
        }

        if (j.contains("ranking")) {
            const auto& r = j["ranking"];
            auto& w = c.ranking;
            w.semantic = r.value("semantic", w.semantic);
            w.same_project = r.value("same_project", w.same_project);
            w.same_category = r.value("same_category", w.same_category);
            w.tag_overlap = r.value("tag_overlap", w.tag_overlap);
            w.keywords = r.value("keywords", w.keywords);
            w.tech_terms = r.value("tech_terms", w.tech_terms);
            w.time_day = r.value("time_day", w.time_day);
            w.time_week = r.value("time_week", w.time_week);
            w.time_month = r.value("time_month", w.time_month);
            w.status_in_progress = r.value("status_in_progress", w.status_in_progress);
            w.status_todo = r.value("status_todo", w.status_todo);
            w.status_blocked = r.value("status_blocked", w.status_blocked);
            w.priority_urgent = r.value("priority_urgent", w.priority_urgent);
            w.priority_high = r.value("priority_high", w.priority_high);
            w.multi_strategy = r.value("multi_strategy", w.multi_strategy);
            w.complexity = r.value("complexity", w.complexity);
            w.keyword_saturation = r.value("keyword_saturation", w.keyword_saturation);
            w.complexity_min = r.value("complexity_min", w.complexity_min);
            w.keyword_window_days = r.value("keyword_window_days", w.keyword_window_days);
            w.context_window_days = r.value("context_window_days", w.context_window_days);
        }

        if (j.contains("linker")) {
            const auto& l = j["linker"];
            c.linker.auto_link = l.value("auto_link", c.linker.auto_link);
            c.linker.top_n = l.value("top_n", c.linker.top_n);
            c.linker.threshold = l.value("threshold", c.linker.threshold);
            c.linker.semantic_k = l.value("semantic_k", c.linker.semantic_k);
            c.linker.skip_done_tasks = l.value("skip_done_tasks", c.linker.skip_done_tasks);
            c.linker.suggestion_limit = l.value("suggestion_limit", c.linker.suggestion_limit);
        }

        if (j.contains("automation")) {
            const auto& a = j["automation"];
            auto& ac = c.automation;
            ac.interval_ms = a.value("interval_ms", ac.interval_ms);
            ac.batch_size = a.value("batch_size", ac.batch_size);
            ac.auto_apply = a.value("auto_apply", ac.auto_apply);
            ac.staleness_ms = a.value("staleness_ms", ac.staleness_ms);
            ac.evidence_window_ms = a.value("evidence_window_ms", ac.evidence_window_ms);
            ac.evidence_min_confidence = a.value("evidence_min_confidence", ac.evidence_min_confidence);
            ac.evidence_avg_threshold = a.value("evidence_avg_threshold", ac.evidence_avg_threshold);
            ac.evidence_min_signals = a.value("evidence_min_signals", ac.evidence_min_signals);
            ac.stale_in_progress_ms = a.value("stale_in_progress_ms", ac.stale_in_progress_ms);
            ac.urgent_todo_ms = a.value("urgent_todo_ms", ac.urgent_todo_ms);
            ac.long_blocked_ms = a.value("long_blocked_ms", ac.long_blocked_ms);
            ac.classifier_path = a.value("classifier_path", ac.classifier_path);
        }

        if (j.contains("dedup")) {
            c.dedup.threshold = j["dedup"].value("threshold", c.dedup.threshold);
        }

        if (j.contains("validation")) {
            const auto& v = j["validation"];
            c.validation.min_title_length = v.value("min_title_length", c.validation.min_title_length);
            c.validation.min_content_length = v.value("min_content_length", c.validation.min_content_length);
            if (v.contains("placeholder_patterns")) {
                c.validation.placeholder_patterns =
                    v["placeholder_patterns"].get<std::vector<std::string>>();
            }
        }

        c.validate();
        return c;
    }

    static Config load(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            throw StorageError("read", path, "cannot open config");
        }
        std::stringstream ss;
        ss << in.rdbuf();
        try {
            return from_json(json::parse(ss.str()));
        } catch (const json::exception& e) {
            throw ValidationError("config", std::string("Malformed config ") + path + ": " + e.what());
        }
    }

    void validate() const {
        auto unit = [](const char* field, float v) {
            if (v < 0.0f || v > 1.0f) {
                throw ValidationError(field, std::string(field) + " must be within [0,1]");
            }
        };
        unit("ranking.semantic", ranking.semantic);
        unit("ranking.same_project", ranking.same_project);
        unit("ranking.same_category", ranking.same_category);
        unit("ranking.tag_overlap", ranking.tag_overlap);
        unit("ranking.keywords", ranking.keywords);
        unit("ranking.tech_terms", ranking.tech_terms);
        unit("linker.threshold", linker.threshold);
        unit("dedup.threshold", dedup.threshold);
        unit("automation.evidence_min_confidence", automation.evidence_min_confidence);
        unit("automation.evidence_avg_threshold", automation.evidence_avg_threshold);

        if (store.base_dir.empty()) {
            throw ValidationError("store.base_dir", "store.base_dir must not be empty");
        }
        if (ranking.keyword_saturation == 0) {
            throw ValidationError("ranking.keyword_saturation", "keyword_saturation must be positive");
        }
        if (linker.top_n == 0) {
            throw ValidationError("linker.top_n", "linker.top_n must be positive");
        }
        if (automation.interval_ms <= 0) {
            throw ValidationError("automation.interval_ms", "automation.interval_ms must be positive");
        }
        if (automation.batch_size == 0) {
            throw ValidationError("automation.batch_size", "automation.batch_size must be positive");
        }
        if (automation.staleness_ms <= 0) {
            throw ValidationError("automation.staleness_ms", "automation.staleness_ms must be positive");
        }
        if (validation.min_title_length == 0) {
            throw ValidationError("validation.min_title_length", "min_title_length must be positive");
        }
    }
};

} // namespace tether
