#pragma once
// RPC Maintenance Tools: run_automation_check, evaluate_task, deduplicate

#include "../types.hpp"
#include "../../service.hpp"
#include <sstream>

namespace tether::rpc::tools::maintenance {

using json = nlohmann::json;

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "run_automation_check",
        "Evaluate every open task once and apply confident status changes.",
        {{"type", "object"}, {"properties", json::object()}, {"required", json::array()}}
    });

    tools.push_back({
        "evaluate_task",
        "Show what automation would propose for one task, without applying it.",
        {{"type", "object"}, {"properties", {{"id", {{"type", "string"}}}}}, {"required", {"id"}}}
    });

    tools.push_back({
        "deduplicate",
        "Find near-duplicate memories. dry_run=false merges them: edges move to "
        "the survivor and the duplicates are deleted.",
        {
            {"type", "object"},
            {"properties", {
                {"project", {{"type", "string"}, {"description", "Limit to one project"}}},
                {"threshold", {{"type", "number"}, {"minimum", 0}, {"maximum", 1}, {"default", 0.85}}},
                {"dry_run", {{"type", "boolean"}, {"default", true}}}
            }},
            {"required", json::array()}
        }
    });
}

inline ToolResult run_automation_check(Service* service, const json& params) {
    (void)params;
    AutomationReport r = service->run_automation_check();

    json proposals = json::array();
    json applied = json::array();
    json rejected = json::array();
    json advisories = json::array();
    for (const auto& p : r.proposals) proposals.push_back(proposal_json(p));
    for (const auto& p : r.applied) applied.push_back(proposal_json(p));
    for (const auto& [p, why] : r.rejected) {
        json j = proposal_json(p);
        j["error"] = why;
        rejected.push_back(j);
    }
    for (const auto& a : r.advisories) advisories.push_back(advisory_json(a));

    std::ostringstream ss;
    ss << "Checked " << r.evaluated << " tasks in " << r.batches << " batches: "
       << r.applied.size() << " updated, " << r.advisories.size() << " advisories\n";
    for (const auto& p : r.applied) {
        ss << "  " << p.task_id << ": " << status_to_string(p.from) << " -> "
           << status_to_string(p.to) << " (" << p.reason << ")\n";
    }
    for (const auto& a : r.advisories) {
        ss << "  ! " << a.task_id << ": " << a.message << "\n";
    }

    return ToolResult::ok(ss.str(), {
        {"evaluated", r.evaluated},
        {"batches", r.batches},
        {"proposals", proposals},
        {"applied", applied},
        {"rejected", rejected},
        {"advisories", advisories},
        {"errors", r.errors}
    });
}

inline ToolResult evaluate_task(Service* service, const json& params) {
    std::string err = validate_required(params, {"id"});
    if (!err.empty()) return ToolResult::error(err);

    Evaluation ev = service->evaluate_task(params["id"].get<std::string>());
    json advisories = json::array();
    for (const auto& a : ev.advisories) advisories.push_back(advisory_json(a));

    json result = {
        {"task_id", ev.task_id},
        {"proposal", ev.proposal ? proposal_json(*ev.proposal) : json()},
        {"advisories", advisories},
        {"errors", ev.errors}
    };
    std::string text = ev.proposal
        ? "Would move " + ev.task_id + " to " + status_to_string(ev.proposal->to) + ": " + ev.proposal->reason
        : "No change proposed for " + ev.task_id;
    return ToolResult::ok(text, result);
}

inline ToolResult deduplicate(Service* service, const json& params) {
    std::optional<float> threshold = get_optional<float>(params, "threshold");
    bool dry_run = get_param<bool>(params, "dry_run", true);

    DedupReport r = service->deduplicate(get_param<std::string>(params, "project", ""), threshold, dry_run);

    json groups = json::array();
    size_t duplicates = 0;
    std::ostringstream ss;
    for (const auto& g : r.groups) {
        json pairs = json::array();
        for (const auto& p : g.pairs) pairs.push_back({{"a", p.a}, {"b", p.b}, {"similarity", p.similarity}});
        groups.push_back({
            {"survivor", g.survivor},
            {"duplicates", g.duplicates},
            {"project", g.project},
            {"pairs", pairs}
        });
        duplicates += g.duplicates.size();
        ss << "  keep " << g.survivor << ", " << (dry_run ? "would retire " : "retired ")
           << g.duplicates.size() << "\n";
    }

    std::string head = std::to_string(r.groups.size()) + " duplicate groups among " +
                       std::to_string(r.scanned) + " memories" + (dry_run ? " (dry run)" : "") + "\n";
    return ToolResult::ok(head + ss.str(), {
        {"dry_run", r.dry_run},
        {"threshold", r.threshold},
        {"scanned", r.scanned},
        {"duplicates", duplicates},
        {"groups", groups}
    });
}

inline void register_handlers(Service* service,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["run_automation_check"] = [service](const json& p) { return run_automation_check(service, p); };
    handlers["evaluate_task"] = [service](const json& p) { return evaluate_task(service, p); };
    handlers["deduplicate"] = [service](const json& p) { return deduplicate(service, p); };
}

} // namespace tether::rpc::tools::maintenance
