#pragma once

#include "errors.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <vector>

using TimePoint = std::chrono::system_clock::time_point;

enum class TaskStatus { Running, CompletedButUnread };

struct WorktreeInfo {
    std::string path;
    std::string branch;
    std::string commit;

    bool operator==(const WorktreeInfo&) const = default;
};

struct ProcessTreeInfo;

// Persisted state of one supervised child. Status only ever moves
// Running -> CompletedButUnread.
struct TaskRecord {
    TimePoint started_at;
    std::string log_id;
    std::string log_path;
    std::optional<int> manager_pid;
    std::optional<std::string> cleanup_reason;
    TaskStatus status = TaskStatus::Running;
    std::optional<std::string> result;
    std::optional<TimePoint> completed_at;
    std::optional<int> exit_code;

    // Ancestry snapshot taken at registration; never re-verified.
    std::vector<int> process_chain;
    std::optional<int> root_parent_pid;
    size_t process_tree_depth = 0;

    std::optional<std::string> task_id;
    std::optional<WorktreeInfo> worktree;

    TaskRecord() = default;
    TaskRecord(TimePoint started_at, std::string log_id, std::string log_path,
               std::optional<int> manager_pid);

    TaskRecord& with_process_tree(std::vector<int> chain, std::optional<int> root, size_t depth);
    TaskRecord& with_process_tree(const ProcessTreeInfo& info);

    void mark_completed(std::optional<std::string> result, std::optional<int> exit_code,
                        TimePoint completed_at);

    // Completes the record as mark_completed does, keeping any result and
    // exit code already present, and stamps the reason.
    void with_cleanup_reason(const std::string& reason, TimePoint now);

    bool is_running() const { return status == TaskStatus::Running; }

    std::string to_json() const;
    static std::expected<TaskRecord, RegistryError> from_json(const std::string& text);
};

const char* to_string(TaskStatus status);

std::string format_timestamp(TimePoint tp);
std::optional<TimePoint> parse_timestamp(const std::string& text);
