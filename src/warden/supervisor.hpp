#pragma once

#include "agent.hpp"
#include "errors.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct Config;
class TaskRegistry;

enum class OutputMode {
    Mirror,    // tee live output to the console
    TailOnly,  // log everything, print the last lines at the end
};

// Mirror on a terminal, TailOnly otherwise.
OutputMode default_output_mode();

struct SupervisorRequest {
    AgentKind agent = AgentKind::Claude;
    std::vector<std::string> args;
    // Injected by provider resolution; opaque here.
    std::vector<std::pair<std::string, std::string>> env;
    std::optional<std::string> cwd;
    OutputMode mode = OutputMode::Mirror;
};

struct SupervisorOutcome {
    int pid = 0;
    int exit_code = 1;
    std::string result;
    std::string log_path;
};

// Runs one agent invocation with registry bookkeeping: sweep, spawn,
// tee output to a log, register, wait, mark completed.
class Supervisor {
public:
    Supervisor(TaskRegistry& registry, const Config& config);

    std::expected<SupervisorOutcome, SupervisorError> run(const SupervisorRequest& request);

    // Defaults to platform::log_dir().
    void set_log_dir(std::string dir) { log_dir_ = std::move(dir); }

private:
    std::expected<void, SupervisorError> validate_cwd(const std::optional<std::string>& cwd) const;

    TaskRegistry& registry_;
    const Config& config_;
    std::string log_dir_;
};

// "success", "failed_with_exit_code_<n>" or "failed_without_exit_code".
std::string classify_result(bool success, std::optional<int> exit_code);
