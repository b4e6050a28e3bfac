#include "task_record.hpp"

#include "process_tree.hpp"

#include <cstdint>
#include <cstdio>
#include <format>
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace {

template <typename T>
void put_optional(json& j, const char* key, const std::optional<T>& v) {
    if (v) j[key] = *v;
    else j[key] = nullptr;
}

template <typename T>
std::optional<T> get_optional(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<T>();
}

std::optional<TimePoint> get_timestamp(const json& j, const char* key) {
    auto text = get_optional<std::string>(j, key);
    if (!text) return std::nullopt;
    auto tp = parse_timestamp(*text);
    if (!tp) throw std::invalid_argument(std::format("invalid timestamp in '{}': {}", key, *text));
    return tp;
}

} // namespace

TaskRecord::TaskRecord(TimePoint started_at, std::string log_id, std::string log_path,
                       std::optional<int> manager_pid)
    : started_at(started_at), log_id(std::move(log_id)), log_path(std::move(log_path)),
      manager_pid(manager_pid) {}

TaskRecord& TaskRecord::with_process_tree(std::vector<int> chain, std::optional<int> root,
                                          size_t depth) {
    process_chain = std::move(chain);
    root_parent_pid = root;
    process_tree_depth = depth;
    return *this;
}

TaskRecord& TaskRecord::with_process_tree(const ProcessTreeInfo& info) {
    return with_process_tree(info.process_chain, info.root_parent_pid, info.depth);
}

void TaskRecord::mark_completed(std::optional<std::string> res, std::optional<int> code,
                                TimePoint at) {
    status = TaskStatus::CompletedButUnread;
    result = std::move(res);
    exit_code = code;
    completed_at = at;
}

void TaskRecord::with_cleanup_reason(const std::string& reason, TimePoint now) {
    mark_completed(result, exit_code, completed_at.value_or(now));
    cleanup_reason = reason;
}

std::string TaskRecord::to_json() const {
    json j;
    j["started_at"] = format_timestamp(started_at);
    j["log_id"] = log_id;
    j["log_path"] = log_path;
    put_optional(j, "manager_pid", manager_pid);
    put_optional(j, "cleanup_reason", cleanup_reason);
    j["status"] = to_string(status);
    put_optional(j, "result", result);
    if (completed_at) j["completed_at"] = format_timestamp(*completed_at);
    else j["completed_at"] = nullptr;
    put_optional(j, "exit_code", exit_code);
    j["process_chain"] = process_chain;
    put_optional(j, "root_parent_pid", root_parent_pid);
    j["process_tree_depth"] = process_tree_depth;
    put_optional(j, "task_id", task_id);
    if (worktree) {
        j["worktree_info"] = {
            {"path", worktree->path},
            {"branch", worktree->branch},
            {"commit", worktree->commit},
        };
    } else {
        j["worktree_info"] = nullptr;
    }
    return j.dump();
}

std::expected<TaskRecord, RegistryError> TaskRecord::from_json(const std::string& text) {
    try {
        auto j = json::parse(text);
        if (!j.is_object()) {
            return std::unexpected(RegistryError{RegistryError::Kind::Serialization,
                                                 "task record is not a JSON object"});
        }

        TaskRecord r;
        auto started = parse_timestamp(j.at("started_at").get<std::string>());
        if (!started) {
            return std::unexpected(RegistryError{RegistryError::Kind::Serialization,
                                                 "invalid started_at timestamp"});
        }
        r.started_at = *started;
        r.log_id = j.at("log_id").get<std::string>();
        r.log_path = j.at("log_path").get<std::string>();
        r.manager_pid = get_optional<int>(j, "manager_pid");
        r.cleanup_reason = get_optional<std::string>(j, "cleanup_reason");

        // Older records predate these fields.
        auto status = j.value("status", std::string("running"));
        if (status == "running") {
            r.status = TaskStatus::Running;
        } else if (status == "completed_but_unread") {
            r.status = TaskStatus::CompletedButUnread;
        } else {
            return std::unexpected(RegistryError{RegistryError::Kind::Serialization,
                                                 "unknown task status: " + status});
        }

        r.result = get_optional<std::string>(j, "result");
        r.completed_at = get_timestamp(j, "completed_at");
        r.exit_code = get_optional<int>(j, "exit_code");
        r.process_chain = j.value("process_chain", std::vector<int>{});
        r.root_parent_pid = get_optional<int>(j, "root_parent_pid");
        r.process_tree_depth = j.value("process_tree_depth", size_t{0});
        r.task_id = get_optional<std::string>(j, "task_id");

        if (j.contains("worktree_info") && j["worktree_info"].is_object()) {
            auto& w = j["worktree_info"];
            r.worktree = WorktreeInfo{
                .path = w.value("path", ""),
                .branch = w.value("branch", ""),
                .commit = w.value("commit", ""),
            };
        }
        return r;
    } catch (const json::exception& e) {
        return std::unexpected(RegistryError{RegistryError::Kind::Serialization, e.what()});
    } catch (const std::invalid_argument& e) {
        return std::unexpected(RegistryError{RegistryError::Kind::Serialization, e.what()});
    }
}

const char* to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Running: return "running";
        case TaskStatus::CompletedButUnread: return "completed_but_unread";
    }
    return "running";
}

std::string format_timestamp(TimePoint tp) {
    auto ms = std::chrono::floor<std::chrono::milliseconds>(tp);
    return std::format("{:%FT%T}Z", ms);
}

// Accepts "YYYY-MM-DDTHH:MM:SS[.fraction]Z".
std::optional<TimePoint> parse_timestamp(const std::string& text) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0, consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &y, &mo, &d, &h, &mi, &s, &consumed) != 6) {
        return std::nullopt;
    }

    std::chrono::year_month_day ymd{std::chrono::year(y), std::chrono::month(mo),
                                    std::chrono::day(d)};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 60) return std::nullopt;

    std::chrono::nanoseconds frac{0};
    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int64_t scale = 100'000'000;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            frac += std::chrono::nanoseconds((text[pos] - '0') * scale);
            scale /= 10;
            ++pos;
        }
    }
    if (pos >= text.size() || (text[pos] != 'Z' && text[pos] != 'z') || pos + 1 != text.size()) {
        return std::nullopt;
    }

    auto tp = std::chrono::sys_days(ymd) + std::chrono::hours(h) + std::chrono::minutes(mi) +
              std::chrono::seconds(s) + frac;
    return std::chrono::time_point_cast<TimePoint::duration>(tp);
}
