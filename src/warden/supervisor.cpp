#include "supervisor.hpp"

#include "config.hpp"
#include "log.hpp"
#include "platform/child_process.hpp"
#include "platform/platform_paths.hpp"
#include "platform/process_control.hpp"
#include "platform/process_inspector.hpp"
#include "process_tree.hpp"
#include "signal_forwarder.hpp"
#include "tail_buffer.hpp"
#include "task_log.hpp"
#include "task_record.hpp"
#include "task_registry.hpp"

#include <array>
#include <chrono>
#include <filesystem>
#include <format>
#include <print>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr size_t kChunkSize = 8192;

// Markers that make a nested agent CLI believe it runs inside another session.
const std::vector<std::string> kNestingMarkers = {"CLAUDECODE", "CLAUDE_CODE_ENTRYPOINT"};

struct CopyTarget {
    int console_fd;  // -1 when output is not mirrored
};

std::expected<void, SupervisorError>
copy_stream(UniqueFd pipe, TaskLog& log, CopyTarget target, TailBuffer& tail) {
    std::array<char, kChunkSize> buf;
    while (true) {
        auto n = platform::read_some(pipe.get(), buf.data(), buf.size());
        if (!n) return std::unexpected(n.error());
        if (*n == 0) return {};

        std::string_view chunk(buf.data(), *n);
        if (auto w = log.write(chunk); !w) return w;

        tail.write(chunk);
        if (target.console_fd >= 0) {
            // The console going away must not stop the log.
            if (auto c = platform::write_all(target.console_fd, chunk.data(), chunk.size()); !c) {
                logging::debug(to_string(c.error()));
                target.console_fd = -1;
            }
        }
    }
}

void abort_child(int pid) {
    platform::terminate_process(pid);
    if (auto st = platform::wait_child(pid); !st) {
        logging::warn(std::format("supervisor: {}", to_string(st.error())));
    }
}

} // namespace

OutputMode default_output_mode() {
    return platform::is_terminal(STDOUT_FILENO) ? OutputMode::Mirror : OutputMode::TailOnly;
}

std::string classify_result(bool success, std::optional<int> exit_code) {
    if (success) return "success";
    if (exit_code) return std::format("failed_with_exit_code_{}", *exit_code);
    return "failed_without_exit_code";
}

Supervisor::Supervisor(TaskRegistry& registry, const Config& config)
    : registry_(registry), config_(config), log_dir_(platform::log_dir()) {}

std::expected<void, SupervisorError>
Supervisor::validate_cwd(const std::optional<std::string>& cwd) const {
    if (!cwd) return {};

    std::error_code ec;
    if (!fs::exists(*cwd, ec)) {
        return std::unexpected(SupervisorError{SupervisorError::Kind::Other,
            std::format("Working directory does not exist: {}", *cwd)});
    }
    if (!fs::is_directory(*cwd, ec)) {
        return std::unexpected(SupervisorError{SupervisorError::Kind::Other,
            std::format("Working directory is not a directory: {}", *cwd)});
    }
    return {};
}

std::expected<SupervisorOutcome, SupervisorError> Supervisor::run(const SupervisorRequest& request) {
    if (auto ok = validate_cwd(request.cwd); !ok) return std::unexpected(ok.error());

    // Reclaim dead entries first so a reused pid can register.
    auto swept = registry_.sweep_stale_entries(
        std::chrono::system_clock::now(), platform::process_alive, platform::terminate_process,
        config_.registry.max_record_age());
    if (!swept) return std::unexpected(SupervisorError(swept.error()));
    for (const auto& ev : *swept) {
        logging::debug(std::format("supervisor: swept pid {} ({})", ev.pid, to_string(ev.reason)));
    }

    auto executable = resolve_agent_executable(request.agent, config_);
    if (!executable) return std::unexpected(executable.error());

    SpawnSpec spec;
    spec.executable = *executable;
    spec.args = request.args;
    spec.set_env = request.env;
    spec.unset_env = kNestingMarkers;
    spec.cwd = request.cwd;

    auto child = platform::spawn_child(spec);
    if (!child) return std::unexpected(child.error());
    const int pid = child->pid;

    auto log_path = generate_log_path(pid, log_dir_);
    if (!log_path) {
        abort_child(pid);
        return std::unexpected(log_path.error());
    }
    auto log = TaskLog::create(*log_path);
    if (!log) {
        abort_child(pid);
        return std::unexpected(log.error());
    }

    logging::debug(std::format("supervisor: started {} pid={} log={}",
                               display_name(request.agent), pid, *log_path));

    std::optional<SignalGuard> signal_guard;
    signal_guard.emplace(pid);

    const bool mirror = request.mode == OutputMode::Mirror;
    TailBuffer tail(config_.output.tail_lines);
    std::expected<void, SupervisorError> out_result, err_result;
    std::jthread out_reader([&, p = std::move(child->stdout_pipe)]() mutable {
        out_result = copy_stream(std::move(p), **log, {mirror ? STDOUT_FILENO : -1}, tail);
    });
    std::jthread err_reader([&, p = std::move(child->stderr_pipe)]() mutable {
        err_result = copy_stream(std::move(p), **log, {mirror ? STDERR_FILENO : -1}, tail);
    });

    TaskRecord record(std::chrono::system_clock::now(), std::to_string(pid), *log_path,
                      platform::current_pid());
    if (auto tree = ProcessTreeInfo::current()) {
        record.with_process_tree(*tree);
    } else {
        logging::warn(std::format("supervisor: no process tree info: {}",
                                  to_string(tree.error())));
    }

    if (auto reg = registry_.register_task(pid, record); !reg) {
        abort_child(pid);
        return std::unexpected(SupervisorError(reg.error()));
    }
    RegistrationGuard registration(registry_, pid);

    auto status = platform::wait_child(pid);
    signal_guard.reset();
    if (!status) {
        platform::terminate_process(pid);
        return std::unexpected(status.error());
    }

    out_reader.join();
    err_reader.join();
    if (!out_result) return std::unexpected(out_result.error());
    if (!err_result) return std::unexpected(err_result.error());
    if (auto synced = (*log)->sync(); !synced) return std::unexpected(synced.error());

    if (!mirror) {
        for (const auto& line : tail.lines()) {
            std::println("{}", line);
        }
    }

    SupervisorOutcome outcome;
    outcome.pid = pid;
    outcome.exit_code = status->code.value_or(1);
    outcome.result = classify_result(status->success, status->code);
    outcome.log_path = *log_path;

    auto marked = registration.mark_completed(outcome.result, status->code,
                                              std::chrono::system_clock::now());
    if (!marked) {
        logging::warn(std::format("supervisor: cannot mark pid {} completed: {}",
                                  pid, to_string(marked.error())));
    }

    std::println(stderr, "Log: {}", outcome.log_path);
    return outcome;
}
