// Tether CLI - memory and task operations from the shell
//
// Modes:
//   tether <tool> [positional...] [--key value...]   One tool call, then exit
//   tether watch [--interval MS]                     Automation scheduler until SIGINT/SIGTERM
//   tether serve                                     JSON-RPC 2.0, one request per stdin line
//
// Examples:
//   tether create_task "Implement JWT login" --category feature --tags auth,api
//   tether add_memory "Finished the JWT login, tests passing"
//   tether link_items mem-2026-01-05-1a2b3c4d task-2026-01-05-5e6f7a8b --type implements
//   tether task_context WEB-F0001 --deep
//   tether deduplicate --threshold 0.9 --dry_run false
//
// Options (any mode):
//   --base DIR      Storage root (default: $TETHER_BASE or config value)
//   --config FILE   JSON configuration file
//   --json          Print the structured result instead of text
//   --quiet         Suppress informational log lines

#include <tether/tether.hpp>
#include <tether/rpc/handler.hpp>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;

static std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested.store(true);
}

// Bare words fill these keys in order
static const std::map<std::string, std::vector<std::string>> POSITIONAL_KEYS = {
    {"create_task", {"title"}},
    {"update_task", {"id"}},
    {"delete_task", {"id"}},
    {"get_task", {"id"}},
    {"list_tasks", {"project"}},
    {"search_tasks", {"query"}},
    {"task_context", {"id"}},
    {"task_stats", {"project"}},
    {"add_memory", {"content"}},
    {"update_memory", {"id"}},
    {"delete_memory", {"id"}},
    {"get_memory", {"id"}},
    {"list_memories", {"project"}},
    {"link_items", {"from", "to"}},
    {"unlink_items", {"from", "to"}},
    {"get_related", {"id"}},
    {"connection_graph", {"project"}},
    {"evaluate_task", {"id"}},
    {"deduplicate", {"project"}}
};

struct GlobalOptions {
    std::string base;
    std::string config_path;
    bool json_output = false;
    bool quiet = false;
    int64_t interval_ms = 0;
    std::vector<std::string> rest;     // Everything not consumed here
};

void print_usage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " <tool> [args...] [--key value...]\n"
              << "  " << prog << " watch [--interval MS]\n"
              << "  " << prog << " serve\n"
              << "\n"
              << "Tools:\n"
              << "  create_task, update_task, delete_task, get_task, list_tasks,\n"
              << "  search_tasks, task_context, task_stats,\n"
              << "  add_memory, update_memory, delete_memory, get_memory, list_memories,\n"
              << "  link_items, unlink_items, get_related, connection_graph,\n"
              << "  run_automation_check, evaluate_task, deduplicate\n"
              << "\n"
              << "Options:\n"
              << "  --base DIR      Storage root (default: $TETHER_BASE or config)\n"
              << "  --config FILE   JSON configuration file\n"
              << "  --json          Output structured JSON instead of text\n"
              << "  --quiet         Suppress informational log lines\n"
              << "  --help          Show this help message\n";
}

// true/false, JSON object or array, number, otherwise string
json parse_value(const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;
    if (!value.empty() && (value[0] == '{' || value[0] == '[')) {
        json parsed = json::parse(value, nullptr, false);
        if (!parsed.is_discarded()) return parsed;
        return value;
    }

    bool is_numeric = !value.empty();
    bool has_dot = false;
    for (size_t j = 0; j < value.size() && is_numeric; ++j) {
        char c = value[j];
        if (c == '-' && j == 0 && value.size() > 1) continue;
        if (c == '.' && !has_dot) { has_dot = true; continue; }
        if (!std::isdigit(static_cast<unsigned char>(c))) is_numeric = false;
    }
    if (!is_numeric) return value;

    char* end = nullptr;
    if (has_dot) {
        double d = std::strtod(value.c_str(), &end);
        if (end && *end == '\0') return d;
    } else {
        long long n = std::strtoll(value.c_str(), &end, 10);
        if (end && *end == '\0') return n;
    }
    return value;
}

json build_args(const std::string& tool, const std::vector<std::string>& argv) {
    json args = json::object();
    std::vector<std::string> positional;
    auto it = POSITIONAL_KEYS.find(tool);
    if (it != POSITIONAL_KEYS.end()) positional = it->second;
    size_t next_positional = 0;

    for (size_t i = 0; i < argv.size(); ++i) {
        const std::string& arg = argv[i];
        if (arg.rfind("--", 0) == 0) {
            std::string key = arg.substr(2);
            if (i + 1 < argv.size() && argv[i + 1].rfind("--", 0) != 0) {
                args[key] = parse_value(argv[++i]);
            } else {
                args[key] = true;  // Flag without value
            }
        } else if (next_positional < positional.size()) {
            args[positional[next_positional++]] = arg;
        } else {
            std::cerr << "[tether] Ignoring extra argument: " << arg << "\n";
        }
    }
    return args;
}

tether::Config make_config(const GlobalOptions& opts) {
    tether::Config config = opts.config_path.empty() ? tether::Config{}
                                                     : tether::Config::load(opts.config_path);
    if (const char* env_base = std::getenv("TETHER_BASE")) {
        config.store.base_dir = env_base;
    }
    if (!opts.base.empty()) config.store.base_dir = opts.base;
    if (opts.quiet) config.quiet = true;
    if (opts.interval_ms > 0) config.automation.interval_ms = opts.interval_ms;
    config.validate();
    return config;
}

int run_tool(tether::Service& service, const std::string& tool,
             const std::vector<std::string>& argv, bool json_output) {
    tether::rpc::Handler handler(&service);
    if (!handler.has_tool(tool)) {
        std::cerr << "Unknown tool: " << tool << "\n";
        return 1;
    }

    tether::rpc::ToolResult result = handler.call(tool, build_args(tool, argv));

    if (json_output) {
        json out = result.structured.is_null() ? json::object() : result.structured;
        if (result.is_error) out["message"] = result.content;
        std::cout << out.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    } else if (result.is_error) {
        std::cerr << "Error: " << result.content << "\n";
    } else {
        std::cout << result.content << "\n";
    }
    return result.is_error ? 1 : 0;
}

int run_watch(tether::Service& service) {
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);

    tether::AutomationScheduler scheduler(
        [&service]() { return service.run_automation_check(); },
        service.config().automation.interval_ms,
        service.config().quiet);
    scheduler.start();

    while (!g_shutdown_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    scheduler.stop();
    auto stats = scheduler.stats();
    std::cerr << "[tether] " << stats.ticks << " checks, " << stats.applied << " updates applied, "
              << stats.failures << " failed\n";
    return 0;
}

int run_serve(tether::Service& service) {
    tether::rpc::Handler handler(&service);
    std::cerr << "[tether] Listening on stdin...\n";

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        std::cout << handler.handle(line) << "\n";
        std::cout.flush();
    }

    std::cerr << "[tether] Shutdown complete\n";
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    GlobalOptions opts;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--base") == 0 && i + 1 < argc) {
            opts.base = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--interval") == 0 && i + 1 < argc) {
            opts.interval_ms = std::atoll(argv[++i]);
        } else if (std::strcmp(argv[i], "--json") == 0) {
            opts.json_output = true;
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            opts.quiet = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            opts.rest.push_back(argv[i]);
        }
    }
    if (opts.rest.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::string mode = opts.rest.front();
    std::vector<std::string> tool_args(opts.rest.begin() + 1, opts.rest.end());

    try {
        tether::Service service(make_config(opts));
        service.open();

        if (mode == "watch") return run_watch(service);
        if (mode == "serve") return run_serve(service);
        return run_tool(service, mode, tool_args, opts.json_output);
    } catch (const tether::Error& e) {
        std::cerr << "[tether] " << e.what() << "\n";
        return 2;
    }
}
