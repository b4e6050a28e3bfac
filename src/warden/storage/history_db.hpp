#pragma once

#include <cstdint>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct TaskRecord;

// One archived task. Timestamps are stored as RFC 3339 text.
struct HistoryEntry {
    int64_t id;
    int pid;
    std::string log_id;
    std::string log_path;
    std::string started_at;
    std::string completed_at;
    std::string status;
    std::string result;
    std::optional<int> exit_code;
    std::string cleanup_reason;
    std::optional<int> root_parent_pid;
    std::string task_id;
};

class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert(int pid, const TaskRecord& record);

    // Newest first.
    std::vector<HistoryEntry> recent(int limit = 10);

    // <data_dir>/history.db
    static std::string default_path();

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
