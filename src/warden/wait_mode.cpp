#include "wait_mode.hpp"

#include "config.hpp"
#include "log.hpp"
#include "platform/process_control.hpp"
#include "storage/history_db.hpp"

#include <format>
#include <print>
#include <thread>

namespace {

WaitError registry_failure(const RegistryError& e) {
    return WaitError{WaitError::Kind::Registry, to_string(e)};
}

} // namespace

std::string to_string(const WaitError& e) {
    switch (e.kind) {
        case WaitError::Kind::NoTasks: return "no tasks to wait for";
        case WaitError::Kind::Registry: return e.message;
    }
    return e.message;
}

void WaitReport::print(FILE* out) const {
    std::println(out, "\n=== Task Wait Report ===");
    std::println(out, "Total tasks tracked: {}", total_tasks);
    std::println(out, "Completed tasks: {}", completed.size());
    std::println(out, "Duration: {:.1f}s", duration.count() / 1000.0);

    if (timed_out) {
        std::println(out, "Wait timed out");
    }

    if (!completed.empty()) {
        std::println(out, "\n--- Completed Tasks ---");
        for (const auto& c : completed) {
            std::string took = "unknown";
            if (c.completed_at) {
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    *c.completed_at - c.started_at);
                took = std::format("{:.1f}s", ms.count() / 1000.0);
            }
            std::string result = c.result.value_or(c.cleanup_reason.value_or("unknown"));
            std::println(out, "{} PID {} - {} ({})", c.succeeded() ? "✓" : "✗", c.pid, result, took);
            std::println(out, "  Log: {}", c.log_path);
        }
    }

    std::println(out, "\n=== End of Report ===\n");
}

WaitMode::Options WaitMode::Options::from_config(const Config& config) {
    Options o;
    o.interval = std::chrono::seconds(config.wait.interval_seconds);
    o.max_wait = std::chrono::hours(config.wait.max_hours);
    o.max_record_age = config.registry.max_record_age();
    return o;
}

WaitMode::WaitMode(TaskRegistry& registry, Options options)
    : registry_(registry), options_(options),
      alive_(platform::process_alive), terminate_(platform::terminate_process) {}

void WaitMode::set_process_control(TaskRegistry::AliveFn alive,
                                   TaskRegistry::TerminateFn terminate) {
    alive_ = std::move(alive);
    terminate_ = std::move(terminate);
}

void WaitMode::consume(int pid, const TaskRecord& record, WaitReport& report) {
    TaskCompletion c;
    c.pid = pid;
    c.result = record.result;
    c.exit_code = record.exit_code;
    c.started_at = record.started_at;
    c.completed_at = record.completed_at;
    c.log_path = record.log_path;
    c.cleanup_reason = record.cleanup_reason;

    std::println("Task PID {} completed: {}", pid,
                 c.result.value_or(c.cleanup_reason.value_or("unknown")));

    if (history_ && !history_->insert(pid, record)) {
        logging::warn(std::format("history: could not archive pid {}", pid));
    }
    report.completed.push_back(std::move(c));
}

std::expected<WaitReport, WaitError> WaitMode::run() {
    auto start = std::chrono::steady_clock::now();
    WaitReport report;

    auto initial = registry_.entries();
    if (!initial) return std::unexpected(registry_failure(initial.error()));
    if (initial->empty()) return std::unexpected(WaitError{WaitError::Kind::NoTasks, {}});

    report.total_tasks = initial->size();
    std::println("Waiting for {} tasks to complete...", report.total_tasks);

    while (true) {
        // Completed entries go first: the sweep would otherwise reap them
        // once their process is gone.
        auto completed = registry_.get_completed_unread_tasks();
        if (!completed) return std::unexpected(registry_failure(completed.error()));
        for (const auto& e : *completed) {
            auto removed = registry_.remove(e.pid);
            if (!removed) return std::unexpected(registry_failure(removed.error()));
            // Another reader got to it first.
            if (!*removed) continue;
            consume(e.pid, e.record, report);
        }

        auto swept = registry_.sweep_stale_entries(std::chrono::system_clock::now(), alive_,
                                                   terminate_, options_.max_record_age);
        if (!swept) return std::unexpected(registry_failure(swept.error()));
        for (const auto& ev : *swept) {
            logging::debug(std::format("wait: pid {} cleaned up ({})", ev.pid, to_string(ev.reason)));
            consume(ev.pid, ev.record, report);
        }

        auto running = registry_.has_running_tasks();
        if (!running) return std::unexpected(registry_failure(running.error()));

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        if (!*running) {
            std::println("All tasks completed!");
            report.duration = elapsed;
            return report;
        }
        if (elapsed >= options_.max_wait) {
            std::println("Wait timed out after {}s", elapsed.count() / 1000);
            report.timed_out = true;
            report.duration = elapsed;
            return report;
        }

        std::this_thread::sleep_for(options_.interval);
    }
}
