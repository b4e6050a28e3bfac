#include "history_db.hpp"

#include "platform/platform_paths.hpp"
#include "task_record.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "history: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // Several supervisors may archive into the same file.
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 2000);

    if (!create_tables()) return false;

    const char* insert_sql =
        "INSERT INTO tasks (pid, log_id, log_path, started_at, completed_at, status, "
        "result, exit_code, cleanup_reason, root_parent_pid, task_id) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, pid, log_id, log_path, started_at, completed_at, status, "
        "result, exit_code, cleanup_reason, root_parent_pid, task_id "
        "FROM tasks ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "history: prepare insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "history: prepare recent failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    return true;
}

void HistoryDb::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool HistoryDb::insert(int pid, const TaskRecord& record) {
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);

    auto bind_text = [this](int idx, const std::optional<std::string>& val) {
        if (!val || val->empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val->c_str(), -1, SQLITE_TRANSIENT);
    };
    auto bind_int = [this](int idx, const std::optional<int>& val) {
        if (!val) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_int(insert_stmt_, idx, *val);
    };

    sqlite3_bind_int(insert_stmt_, 1, pid);
    bind_text(2, record.log_id);
    bind_text(3, record.log_path);
    bind_text(4, format_timestamp(record.started_at));
    bind_text(5, record.completed_at ? std::optional(format_timestamp(*record.completed_at))
                                     : std::nullopt);
    bind_text(6, std::string(to_string(record.status)));
    bind_text(7, record.result);
    bind_int(8, record.exit_code);
    bind_text(9, record.cleanup_reason);
    bind_int(10, record.root_parent_pid);
    bind_text(11, record.task_id);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "history: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<HistoryEntry> HistoryDb::recent(int limit) {
    std::vector<HistoryEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };
    auto get_int = [](sqlite3_stmt* stmt, int col) -> std::optional<int> {
        if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
        return sqlite3_column_int(stmt, col);
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        HistoryEntry e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.pid = sqlite3_column_int(recent_stmt_, 1);
        e.log_id = get_text(recent_stmt_, 2);
        e.log_path = get_text(recent_stmt_, 3);
        e.started_at = get_text(recent_stmt_, 4);
        e.completed_at = get_text(recent_stmt_, 5);
        e.status = get_text(recent_stmt_, 6);
        e.result = get_text(recent_stmt_, 7);
        e.exit_code = get_int(recent_stmt_, 8);
        e.cleanup_reason = get_text(recent_stmt_, 9);
        e.root_parent_pid = get_int(recent_stmt_, 10);
        e.task_id = get_text(recent_stmt_, 11);
        entries.push_back(std::move(e));
    }

    return entries;
}

std::string HistoryDb::default_path() {
    auto dir = platform::data_dir();
    if (dir.empty()) return {};
    return (fs::path(dir) / "history.db").string();
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS tasks (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            pid INTEGER NOT NULL,
            log_id TEXT,
            log_path TEXT,
            started_at TEXT NOT NULL,
            completed_at TEXT,
            status TEXT NOT NULL,
            result TEXT,
            exit_code INTEGER,
            cleanup_reason TEXT,
            root_parent_pid INTEGER,
            task_id TEXT
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "history: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
