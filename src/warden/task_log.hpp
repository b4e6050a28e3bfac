#pragma once

#include "errors.hpp"

#include <cstddef>
#include <cstdio>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

// Log file shared by the stdout and stderr readers of one child.
// Each write is flushed so the file can be tailed while the task runs.
class TaskLog {
public:
    static std::expected<std::unique_ptr<TaskLog>, SupervisorError> create(const std::string& path);

    ~TaskLog();

    TaskLog(const TaskLog&) = delete;
    TaskLog& operator=(const TaskLog&) = delete;

    std::expected<void, SupervisorError> write(std::string_view chunk);

    // Flush and fsync.
    std::expected<void, SupervisorError> sync();

    const std::string& path() const { return path_; }

private:
    TaskLog(std::string path, FILE* file);

    std::mutex mutex_;
    std::string path_;
    FILE* file_ = nullptr;
};

// <log_dir>/<pid>-<unix_millis>-<random>.log; creates log_dir (0700).
std::expected<std::string, SupervisorError> generate_log_path(int pid);
std::expected<std::string, SupervisorError> generate_log_path(int pid, const std::string& log_dir);
