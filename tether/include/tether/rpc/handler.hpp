#pragma once
// RPC Handler: tool registry and JSON-RPC dispatch over a Service
//
// Used by the CLI (one call per process) and by anything that speaks
// JSON-RPC 2.0 over a stream. Every tether::Error raised by a tool
// becomes an error ToolResult; the host process never sees it.

#include "protocol.hpp"
#include "types.hpp"
#include "tools/tasks.hpp"
#include "tools/memories.hpp"
#include "tools/links.hpp"
#include "tools/maintenance.hpp"
#include "../service.hpp"
#include "../version.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace tether::rpc {

using json = nlohmann::json;

class Handler {
public:
    explicit Handler(Service* service)
        : service_(service) {
        register_all_tools();
    }

    // One JSON-RPC request string in, one response string out
    std::string handle(const std::string& request_str) {
        json response;
        try {
            response = handle_request(json::parse(request_str));
        } catch (const json::parse_error& e) {
            response = make_error(json(), error::PARSE_ERROR, std::string("JSON parse error: ") + e.what());
        } catch (const std::exception& e) {
            response = make_error(json(), error::INTERNAL_ERROR, std::string("Internal error: ") + e.what());
        }
        return response.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    // Direct tool invocation
    ToolResult call(const std::string& name, const json& arguments) {
        auto it = handlers_.find(name);
        if (it == handlers_.end()) {
            return ToolResult::error("Unknown tool: " + name, {{"error", "unknown_tool"}});
        }

        try {
            return it->second(arguments.is_null() ? json::object() : arguments);
        } catch (const NotFoundError& e) {
            return ToolResult::error(e.what(), {
                {"error", e.kind()}, {"id", e.id()}, {"suggestions", e.suggestions()}
            });
        } catch (const ValidationError& e) {
            return ToolResult::error(e.what(), {{"error", e.kind()}, {"field", e.field()}});
        } catch (const InvalidTransitionError& e) {
            return ToolResult::error(e.what(), {
                {"error", e.kind()},
                {"from", status_to_string(e.from())},
                {"to", status_to_string(e.to())}
            });
        } catch (const Error& e) {
            return ToolResult::error(e.what(), {{"error", e.kind()}});
        } catch (const json::exception& e) {
            return ToolResult::error(std::string("Invalid parameters: ") + e.what(),
                                     {{"error", "validation"}});
        }
    }

    bool has_tool(const std::string& name) const { return handlers_.count(name) > 0; }

    const std::vector<ToolSchema>& tools() const { return tools_; }

private:
    Service* service_;
    std::vector<ToolSchema> tools_;
    std::unordered_map<std::string, ToolHandler> handlers_;

    void register_all_tools() {
        tools::tasks::register_schemas(tools_);
        tools::tasks::register_handlers(service_, handlers_);

        tools::memories::register_schemas(tools_);
        tools::memories::register_handlers(service_, handlers_);

        tools::links::register_schemas(tools_);
        tools::links::register_handlers(service_, handlers_);

        tools::maintenance::register_schemas(tools_);
        tools::maintenance::register_handlers(service_, handlers_);
    }

    // ═══════════════════════════════════════════════════════════════════
    // JSON-RPC dispatch
    // ═══════════════════════════════════════════════════════════════════

    json handle_request(const json& request) {
        std::string error_msg;
        if (!validate_request(request, error_msg)) {
            json id = request.is_object() ? request.value("id", json()) : json();
            return make_error(id, error::INVALID_REQUEST, error_msg);
        }

        auto info = parse_request(request);

        if (info.method == "initialize") {
            return make_result(info.id, {
                {"serverInfo", {{"name", "tether"}, {"version", TETHER_VERSION}}},
                {"capabilities", {{"tools", {{"listChanged", false}}}}}
            });
        } else if (info.method == "tools/list") {
            return handle_tools_list(info.id);
        } else if (info.method == "tools/call") {
            return handle_tools_call(info.params, info.id);
        }
        return make_error(info.id, error::METHOD_NOT_FOUND, "Unknown method: " + info.method);
    }

    json handle_tools_list(const json& id) {
        json tools_array = json::array();
        for (const auto& tool : tools_) {
            tools_array.push_back({
                {"name", tool.name},
                {"description", tool.description},
                {"inputSchema", tool.input_schema}
            });
        }
        return make_result(id, {{"tools", tools_array}});
    }

    json handle_tools_call(const json& params, const json& id) {
        if (!params.contains("name") || !params["name"].is_string()) {
            return make_error(id, error::INVALID_PARAMS, "Missing tool name");
        }

        std::string name = params["name"];
        if (!has_tool(name)) {
            return make_error(id, error::TOOL_NOT_FOUND, "Unknown tool: " + name);
        }

        ToolResult result = call(name, params.value("arguments", json::object()));
        return make_result(id, make_tool_response(result.content, result.is_error, result.structured));
    }
};

} // namespace tether::rpc
