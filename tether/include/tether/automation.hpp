#pragma once
// Automation Engine: rule-driven task status proposals
//
// Rules run in priority order; the first proposal wins. Advisories
// (stale or long-blocked tasks) are collected but never change state
// and never stop evaluation. A rule that throws has no opinion.
//
//   1. subtasks         all subtasks done -> done; a subtask blocked -> blocked
//   2. memory_evidence  recently linked memories read as a status
//   3. time             stale in_progress / delayed urgent todo (advisory)
//   4. dependency       parent resumed -> todo; long-blocked (advisory)
//   5. workflow         category-specific completion phrases in title/description
//
// Applying re-reads the task, rejects stale decisions and illegal
// transitions, and stamps automation_applied provenance.

#include "types.hpp"
#include "errors.hpp"
#include "config.hpp"
#include "index.hpp"
#include "classifier.hpp"
#include "transitions.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <functional>
#include <future>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <iostream>

namespace tether {

using json = nlohmann::json;

struct Proposal {
    std::string task_id;
    Status from = Status::Todo;
    Status to = Status::Todo;
    float confidence = 0.0f;
    std::string rule;
    std::string reason;
    json details = json::object();
    Timestamp created = 0;              // Evaluation time; drives the staleness guard
};

struct Advisory {
    std::string task_id;
    std::string type;                   // stale_task | urgent_task_delay | long_blocked_task
    std::string message;
    float confidence = 0.0f;
};

struct RuleOutcome {
    std::optional<Proposal> proposal;
    std::optional<Advisory> advisory;
};

struct Evaluation {
    std::string task_id;
    std::optional<Proposal> proposal;
    std::vector<Advisory> advisories;
    std::vector<std::string> errors;    // Rules that threw
};

struct AutomationReport {
    size_t evaluated = 0;
    size_t batches = 0;
    std::vector<Proposal> proposals;
    std::vector<Proposal> applied;
    std::vector<std::pair<Proposal, std::string>> rejected;
    std::vector<Advisory> advisories;
    std::vector<std::string> errors;
};

class AutomationEngine {
public:
    using Rule = std::function<RuleOutcome(const Task&, Timestamp)>;
    using CommitFn = std::function<void(const Task&)>;

    AutomationEngine(const Index& index, const Classifier& classifier, AutomationConfig config)
        : index_(index), classifier_(classifier), config_(std::move(config)) {
        rules_.push_back({"subtasks", [this](const Task& t, Timestamp at) { return rule_subtasks(t, at); }});
        rules_.push_back({"memory_evidence", [this](const Task& t, Timestamp at) { return rule_memory_evidence(t, at); }});
        rules_.push_back({"time", [this](const Task& t, Timestamp at) { return rule_time(t, at); }});
        rules_.push_back({"dependency", [this](const Task& t, Timestamp at) { return rule_dependency(t, at); }});
        rules_.push_back({"workflow", [this](const Task& t, Timestamp at) { return rule_workflow(t, at); }});
    }

    AutomationEngine(const AutomationEngine&) = delete;
    AutomationEngine& operator=(const AutomationEngine&) = delete;

    // Persist an applied change (set by the owning service)
    void on_commit(CommitFn fn) { commit_ = std::move(fn); }

    // Insert a rule before position (clamped to the end)
    void insert_rule(size_t position, std::string name, Rule rule) {
        position = std::min(position, rules_.size());
        rules_.insert(rules_.begin() + static_cast<std::ptrdiff_t>(position),
                      NamedRule{std::move(name), std::move(rule)});
    }

    std::vector<std::string> rule_names() const {
        std::vector<std::string> out;
        for (const auto& r : rules_) out.push_back(r.name);
        return out;
    }

    const AutomationConfig& config() const { return config_; }
    void set_quiet(bool quiet) { quiet_ = quiet; }

    // ═══════════════════════════════════════════════════════════════════
    // Evaluation
    // ═══════════════════════════════════════════════════════════════════

    Evaluation evaluate(const std::string& task_id, Timestamp at = now()) const {
        Evaluation ev;
        ev.task_id = task_id;
        const Task* task = index_.find_task(task_id);
        if (!task) throw NotFoundError(task_id);
        if (task->status == Status::Done) return ev;   // Terminal

        for (const auto& rule : rules_) {
            RuleOutcome outcome;
            try {
                outcome = rule.fn(*task, at);
            } catch (const std::exception& e) {
                ev.errors.push_back(rule.name + ": " + e.what());
                std::cerr << "[Automation] Rule " << rule.name << " failed on " << task_id
                          << ": " << e.what() << "\n";
                continue;
            }
            if (outcome.advisory) ev.advisories.push_back(*outcome.advisory);
            if (outcome.proposal) {
                ev.proposal = std::move(outcome.proposal);
                break;
            }
        }
        return ev;
    }

    // Validated copy of the task with the proposal applied. Does not persist.
    Task prepare(const Proposal& p, Timestamp at = now()) const {
        const Task* current = index_.find_task(p.task_id);
        if (!current) throw NotFoundError(p.task_id);

        Timestamp age = at - p.created;
        if (age > config_.staleness_ms) throw StaleAutomationError(age);

        if (!is_legal_transition(current->status, p.to, TransitionOrigin::Automatic)) {
            throw InvalidTransitionError(current->status, p.to);
        }

        Task updated = *current;
        updated.status = p.to;
        updated.updated = at;
        updated.status_reason = p.reason;

        AutomationRecord record;
        record.type = p.rule;
        record.confidence = p.confidence;
        record.timestamp = at;
        record.details = p.details;
        record.details["from"] = status_to_string(current->status);
        record.details["to"] = status_to_string(p.to);
        updated.automation_applied = record;
        return updated;
    }

    // Validate, then hand the updated task to the commit callback
    Task apply(const Proposal& p, Timestamp at = now()) const {
        Task updated = prepare(p, at);
        if (commit_) commit_(updated);
        if (!quiet_) std::cerr << "[Automation] " << p.task_id << ": " << status_to_string(p.from) << " -> "
                  << status_to_string(p.to) << " (" << p.rule << ", "
                  << static_cast<int>(p.confidence * 100) << "%)\n";
        return updated;
    }

    // One scheduler tick: fixed-size batches, parallel evaluation inside a
    // batch, sequential applies, batches one after another.
    AutomationReport run_check(Timestamp at = now()) const {
        AutomationReport report;

        std::vector<std::string> ids;
        for (const auto& [id, t] : index_.tasks()) {
            if (t.status != Status::Done) ids.push_back(id);
        }
        std::sort(ids.begin(), ids.end());

        for (size_t start = 0; start < ids.size(); start += config_.batch_size) {
            size_t end = std::min(ids.size(), start + config_.batch_size);
            ++report.batches;

            std::vector<std::future<Evaluation>> pending;
            for (size_t i = start; i < end; ++i) {
                pending.push_back(std::async(std::launch::async,
                                             [this, id = ids[i], at]() { return evaluate(id, at); }));
            }

            std::vector<Evaluation> results;
            for (auto& f : pending) {
                try {
                    results.push_back(f.get());
                } catch (const std::exception& e) {
                    report.errors.push_back(e.what());
                }
            }

            for (auto& ev : results) {
                ++report.evaluated;
                for (auto& a : ev.advisories) report.advisories.push_back(std::move(a));
                for (auto& err : ev.errors) report.errors.push_back(ev.task_id + ": " + err);
                if (!ev.proposal) continue;

                report.proposals.push_back(*ev.proposal);
                if (!config_.auto_apply) continue;
                try {
                    apply(*ev.proposal, at);
                    report.applied.push_back(*ev.proposal);
                } catch (const Error& e) {
                    std::cerr << "[Automation] Not applied to " << ev.task_id << ": " << e.what() << "\n";
                    report.rejected.emplace_back(*ev.proposal, e.what());
                }
            }
        }
        return report;
    }

    // ═══════════════════════════════════════════════════════════════════
    // Rules
    // ═══════════════════════════════════════════════════════════════════

    RuleOutcome rule_subtasks(const Task& task, Timestamp at) const {
        RuleOutcome out;
        std::vector<const Task*> subs;
        for (const auto& id : task.subtasks) {
            if (auto* s = index_.find_task(id)) subs.push_back(s);
        }
        if (subs.empty()) return out;

        bool all_done = std::all_of(subs.begin(), subs.end(),
                                    [](const Task* s) { return s->status == Status::Done; });
        if (all_done && task.status != Status::Done) {
            out.proposal = make(task, Status::Done, config_.subtasks_done_confidence, "subtasks",
                                "All " + std::to_string(subs.size()) + " subtasks are done", at);
            out.proposal->details["subtasks"] = subs.size();
            return out;
        }

        if (task.status == Status::InProgress) {
            for (const auto* s : subs) {
                if (s->status != Status::Blocked) continue;
                out.proposal = make(task, Status::Blocked, config_.subtask_blocked_confidence, "subtasks",
                                    "Subtask " + s->id + " is blocked", at);
                out.proposal->details["blocked_subtask"] = s->id;
                return out;
            }
        }
        return out;
    }

    RuleOutcome rule_memory_evidence(const Task& task, Timestamp at) const {
        RuleOutcome out;
        Timestamp since = at - config_.evidence_window_ms;

        // Memories joined by a recent edge in either direction
        std::vector<std::string> memory_ids;
        auto consider = [&](const std::string& memory_id, const Connection& c) {
            if (c.touched() < since || !index_.find_memory(memory_id)) return;
            if (std::find(memory_ids.begin(), memory_ids.end(), memory_id) == memory_ids.end()) {
                memory_ids.push_back(memory_id);
            }
        };
        for (const auto& c : task.connections) consider(c.to_id, c);
        for (const auto& c : index_.incoming(task.id)) consider(c.from_id, c);
        std::sort(memory_ids.begin(), memory_ids.end());

        struct Tally { size_t count = 0; float sum = 0.0f; json signals = json::array(); };
        std::map<Status, Tally> tallies;

        for (const auto& mid : memory_ids) {
            const Memory* m = index_.find_memory(mid);
            StatusIntent intent = classifier_.parse_status_intent(m->content, task.status);
            if (!intent.suggested_status || *intent.suggested_status == task.status) continue;
            if (intent.confidence <= config_.evidence_min_confidence) continue;

            auto& t = tallies[*intent.suggested_status];
            ++t.count;
            t.sum += intent.confidence;
            t.signals.push_back({{"memory_id", mid},
                                 {"confidence", intent.confidence},
                                 {"matched_phrase", intent.matched_phrase}});
        }

        std::optional<Status> best;
        float best_avg = 0.0f;
        for (Status s : {Status::Done, Status::Blocked, Status::InProgress, Status::Todo}) {
            auto it = tallies.find(s);
            if (it == tallies.end() || it->second.count < config_.evidence_min_signals) continue;
            float avg = it->second.sum / static_cast<float>(it->second.count);
            if (avg > config_.evidence_avg_threshold && avg > best_avg) {
                best = s;
                best_avg = avg;
            }
        }
        if (!best) return out;

        const auto& tally = tallies[*best];
        out.proposal = make(task, *best, best_avg, "memory_evidence",
                            std::to_string(tally.count) + " linked memories indicate " +
                                status_to_string(*best), at);
        out.proposal->details["signals"] = tally.signals;
        return out;
    }

    RuleOutcome rule_time(const Task& task, Timestamp at) const {
        RuleOutcome out;
        Timestamp idle = at - task.updated;
        if (task.status == Status::InProgress && idle > config_.stale_in_progress_ms) {
            out.advisory = Advisory{task.id, "stale_task",
                                    "In progress for " + std::to_string(idle / DAY_MS) +
                                        " days without an update",
                                    config_.advisory_confidence};
        } else if (task.status == Status::Todo && task.priority == Priority::Urgent &&
                   idle > config_.urgent_todo_ms) {
            out.advisory = Advisory{task.id, "urgent_task_delay",
                                    "Urgent task untouched for " + std::to_string(idle / DAY_MS) + " days",
                                    config_.urgent_delay_confidence};
        }
        return out;
    }

    RuleOutcome rule_dependency(const Task& task, Timestamp at) const {
        RuleOutcome out;
        if (task.status != Status::Blocked) return out;

        if (!task.parent_id.empty()) {
            const Task* parent = index_.find_task(task.parent_id);
            if (parent && parent->status == Status::InProgress) {
                out.proposal = make(task, Status::Todo, config_.parent_resumed_confidence, "dependency",
                                    "Parent task " + parent->id + " is in progress", at);
                out.proposal->details["parent_id"] = parent->id;
                return out;
            }
        }

        Timestamp idle = at - task.updated;
        if (idle > config_.long_blocked_ms &&
            !classifier_.has_blocking_marker(task.title + "\n" + task.description)) {
            out.advisory = Advisory{task.id, "long_blocked_task",
                                    "Blocked for " + std::to_string(idle / DAY_MS) +
                                        " days with no stated blocker",
                                    config_.advisory_confidence};
        }
        return out;
    }

    RuleOutcome rule_workflow(const Task& task, Timestamp at) const {
        RuleOutcome out;
        // The task's own text only; linked notes speak through memory_evidence
        std::string evidence = task.title + "\n" + task.description;

        auto match = classifier_.match_workflow(task, evidence);
        if (!match) return out;

        out.proposal = make(task, match->status, match->confidence, "workflow",
                            "Workflow pattern " + match->rule + " matched", at);
        out.proposal->details["pattern"] = match->rule;
        out.proposal->details["matched"] = match->matched;
        return out;
    }

private:
    struct NamedRule {
        std::string name;
        Rule fn;
    };

    static Proposal make(const Task& task, Status to, float confidence, const char* rule,
                         std::string reason, Timestamp at) {
        Proposal p;
        p.task_id = task.id;
        p.from = task.status;
        p.to = to;
        p.confidence = clamp01(confidence);
        p.rule = rule;
        p.reason = std::move(reason);
        p.created = at;
        return p;
    }

    const Index& index_;
    const Classifier& classifier_;
    AutomationConfig config_;
    bool quiet_ = false;
    std::vector<NamedRule> rules_;
    CommitFn commit_;
};

} // namespace tether
