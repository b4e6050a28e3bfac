#pragma once

#include "errors.hpp"
#include "task_record.hpp"
#include "task_registry.hpp"

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <expected>
#include <optional>
#include <string>
#include <vector>

class HistoryDb;
struct Config;

struct TaskCompletion {
    int pid = 0;
    std::optional<std::string> result;
    std::optional<int> exit_code;
    TimePoint started_at;
    std::optional<TimePoint> completed_at;
    std::string log_path;
    std::optional<std::string> cleanup_reason;

    bool succeeded() const { return exit_code == 0; }
};

struct WaitReport {
    size_t total_tasks = 0;
    std::vector<TaskCompletion> completed;
    bool timed_out = false;
    std::chrono::milliseconds duration{0};

    void print(FILE* out) const;
};

struct WaitError {
    enum class Kind { Registry, NoTasks };

    Kind kind;
    std::string message;
};

std::string to_string(const WaitError& e);

// Blocks until every task in the registry has finished, consuming the
// completed entries (removed from the registry, archived if a history
// database is attached).
class WaitMode {
public:
    struct Options {
        std::chrono::milliseconds interval{std::chrono::seconds(30)};
        std::chrono::milliseconds max_wait{std::chrono::hours(24)};
        std::chrono::hours max_record_age = kMaxRecordAge;

        static Options from_config(const Config& config);
    };

    WaitMode(TaskRegistry& registry, Options options);

    void set_history(HistoryDb* history) { history_ = history; }

    // Liveness and termination used by the per-round sweep.
    void set_process_control(TaskRegistry::AliveFn alive, TaskRegistry::TerminateFn terminate);

    std::expected<WaitReport, WaitError> run();

private:
    void consume(int pid, const TaskRecord& record, WaitReport& report);

    TaskRegistry& registry_;
    Options options_;
    HistoryDb* history_ = nullptr;
    TaskRegistry::AliveFn alive_;
    TaskRegistry::TerminateFn terminate_;
};
