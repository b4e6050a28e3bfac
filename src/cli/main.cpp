#include "agent.hpp"
#include "config.hpp"
#include "log.hpp"
#include "platform/process_control.hpp"
#include "storage/history_db.hpp"
#include "supervisor.hpp"
#include "task_registry.hpp"
#include "wait_mode.hpp"

#include <chrono>
#include <cstdlib>
#include <format>
#include <memory>
#include <print>
#include <string>
#include <vector>

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] <command> [args]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  run <claude|codex|gemini> [--cwd DIR] [--tail] [--raw] [--] ARGS...");
    std::println(stderr, "                        Run an agent under supervision");
    std::println(stderr, "  list                  Show tasks in this session's registry");
    std::println(stderr, "  sweep                 Clean up dead, orphaned and overage tasks");
    std::println(stderr, "  wait                  Wait for all tasks to finish and report");
    std::println(stderr, "  history [--limit N]   Show archived tasks");
    std::println(stderr, "Options:");
    std::println(stderr, "  -v, --verbose         Enable debug logging");
    std::println(stderr, "  -c, --config PATH     Config file path");
    std::println(stderr, "  -h, --help            Show this help");
}

static std::unique_ptr<TaskRegistry> connect_registry(const Config& config) {
    auto registry = TaskRegistry::connect(config.registry.shared_memory_bytes);
    if (!registry) {
        std::println(stderr, "Error: {}", to_string(registry.error()));
        return nullptr;
    }
    return std::move(*registry);
}

static std::string format_age(TimePoint since) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - since).count();
    if (secs < 60) return std::format("{}s", secs);
    if (secs < 3600) return std::format("{}m{}s", secs / 60, secs % 60);
    return std::format("{}h{}m", secs / 3600, (secs % 3600) / 60);
}

static int cmd_run(const Config& config, const std::vector<std::string>& args, const char* prog) {
    if (args.empty()) {
        usage(prog);
        return 1;
    }

    auto agent = parse_agent(args[0]);
    if (!agent) {
        std::println(stderr, "Unknown agent: {} (expected claude, codex or gemini)", args[0]);
        return 1;
    }

    SupervisorRequest request;
    request.agent = *agent;
    request.mode = default_output_mode();
    bool raw = false;
    std::vector<std::string> passthrough;

    for (size_t i = 1; i < args.size(); i++) {
        const auto& arg = args[i];
        if (arg == "--") {
            passthrough.insert(passthrough.end(), args.begin() + i + 1, args.end());
            break;
        } else if (arg == "--cwd" && i + 1 < args.size()) {
            request.cwd = args[++i];
        } else if (arg == "--tail") {
            request.mode = OutputMode::TailOnly;
        } else if (arg == "--raw") {
            raw = true;
        } else {
            passthrough.push_back(arg);
        }
    }

    request.args = raw ? passthrough : full_access_args(*agent, passthrough);

    auto registry = connect_registry(config);
    if (!registry) return 1;

    Supervisor supervisor(*registry, config);
    auto outcome = supervisor.run(request);
    if (!outcome) {
        std::println(stderr, "Error: {}", to_string(outcome.error()));
        return 1;
    }
    return outcome->exit_code;
}

static int cmd_list(const Config& config) {
    auto registry = connect_registry(config);
    if (!registry) return 1;

    auto entries = registry->entries();
    if (!entries) {
        std::println(stderr, "Error: {}", to_string(entries.error()));
        return 1;
    }
    if (entries->empty()) {
        std::println("No tasks in {}", registry->namespace_name());
        return 0;
    }

    for (const auto& e : *entries) {
        const auto& r = e.record;
        std::println("{:>8}  {:<20}  {:>8}  {}", e.pid, to_string(r.status),
                     format_age(r.started_at), r.log_path);
        if (r.result) std::println("          result: {}", *r.result);
        if (r.task_id) std::println("          task: {}", *r.task_id);
    }
    return 0;
}

static int cmd_sweep(const Config& config) {
    auto registry = connect_registry(config);
    if (!registry) return 1;

    auto events = registry->sweep_stale_entries(std::chrono::system_clock::now(),
                                                platform::process_alive,
                                                platform::terminate_process,
                                                config.registry.max_record_age());
    if (!events) {
        std::println(stderr, "Error: {}", to_string(events.error()));
        return 1;
    }

    for (const auto& ev : *events) {
        std::println("PID {} removed ({})  Log: {}", ev.pid, to_string(ev.reason),
                     ev.record.log_path);
    }
    std::println("{} entries cleaned up", events->size());
    return 0;
}

static int cmd_wait(const Config& config) {
    auto registry = connect_registry(config);
    if (!registry) return 1;

    HistoryDb history;
    WaitMode wait(*registry, WaitMode::Options::from_config(config));
    if (config.history.enabled) {
        auto path = HistoryDb::default_path();
        if (!path.empty() && history.open(path)) {
            wait.set_history(&history);
        }
    }

    auto report = wait.run();
    if (!report) {
        std::println(stderr, "Error: {}", to_string(report.error()));
        return 1;
    }
    report->print(stdout);

    for (const auto& c : report->completed) {
        if (!c.succeeded()) return 1;
    }
    return report->timed_out ? 1 : 0;
}

static int cmd_history(const std::vector<std::string>& args) {
    int limit = 10;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--limit" && i + 1 < args.size()) {
            limit = std::atoi(args[++i].c_str());
        }
    }

    auto path = HistoryDb::default_path();
    HistoryDb db;
    if (path.empty() || !db.open(path)) {
        std::println(stderr, "Error: cannot open task history");
        return 1;
    }

    for (const auto& e : db.recent(limit)) {
        std::println("[{}] PID {} {}{}", e.started_at, e.pid,
                     e.result.empty() ? e.status : e.result,
                     e.cleanup_reason.empty() ? "" : " (" + e.cleanup_reason + ")");
        std::println("  Log: {}", e.log_path);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (!command.empty()) {
            args.push_back(arg);
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            command = arg;
        }
    }

    if (command.empty()) {
        usage(argv[0]);
        return 1;
    }

    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }
    config.apply_env();
    logging::set_debug(verbose || config.debug);

    if (command == "run") return cmd_run(config, args, argv[0]);
    if (command == "list") return cmd_list(config);
    if (command == "sweep") return cmd_sweep(config);
    if (command == "wait") return cmd_wait(config);
    if (command == "history") return cmd_history(args);

    std::println(stderr, "Unknown command: {}", command);
    usage(argv[0]);
    return 1;
}
