#include "task_registry.hpp"

#include "log.hpp"
#include "process_tree.hpp"

#include <charconv>
#include <format>

namespace {

std::optional<int> parse_pid(const std::string& key) {
    int pid = 0;
    auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), pid);
    if (ec != std::errc{} || ptr != key.data() + key.size() || pid <= 0) return std::nullopt;
    return pid;
}

} // namespace

const char* to_string(CleanupReason reason) {
    switch (reason) {
        case CleanupReason::ProcessExited: return "process_exited";
        case CleanupReason::ManagerMissing: return "manager_missing";
        case CleanupReason::Timeout: return "timeout";
    }
    return "process_exited";
}

TaskRegistry::TaskRegistry(std::unique_ptr<SharedMap> map, std::string ns)
    : map_(std::move(map)), namespace_(std::move(ns)) {}

std::string TaskRegistry::namespace_for(int root_pid) {
    return std::format("agent_warden_{}_task", root_pid);
}

std::expected<std::unique_ptr<TaskRegistry>, SupervisorError>
TaskRegistry::connect(size_t region_bytes) {
    return connect_to_root(get_root_parent_pid_cached(), region_bytes);
}

std::expected<std::unique_ptr<TaskRegistry>, SupervisorError>
TaskRegistry::connect_to_root(const std::expected<int, ProcessTreeError>& root,
                              size_t region_bytes) {
    if (!root) return std::unexpected(SupervisorError(root.error()));

    auto registry = connect_for_pid(*root, region_bytes);
    if (!registry) return std::unexpected(SupervisorError(registry.error()));
    return std::move(*registry);
}

std::expected<std::unique_ptr<TaskRegistry>, RegistryError>
TaskRegistry::connect_for_pid(int root_pid, size_t region_bytes) {
    return connect_with_namespace(namespace_for(root_pid), region_bytes);
}

std::expected<std::unique_ptr<TaskRegistry>, RegistryError>
TaskRegistry::connect_with_namespace(const std::string& ns, size_t region_bytes) {
    auto map = platform::open_or_create(ns, region_bytes);
    if (!map) return std::unexpected(map.error());
    logging::debug(std::format("registry: connected to {}", ns));
    return std::make_unique<TaskRegistry>(std::move(*map), ns);
}

std::expected<void, RegistryError> TaskRegistry::register_task(int pid, const TaskRecord& record) {
    std::lock_guard lock(mutex_);
    auto inserted = map_->try_insert(std::to_string(pid), record.to_json());
    if (!inserted) return std::unexpected(inserted.error());
    if (!*inserted) {
        return std::unexpected(RegistryError{RegistryError::Kind::DuplicatePid,
                                             std::format("pid {} already has an entry", pid)});
    }
    return {};
}

template <typename Fn>
std::expected<void, RegistryError> TaskRegistry::update(int pid, Fn&& fn) {
    std::lock_guard lock(mutex_);
    auto key = std::to_string(pid);

    auto existing = map_->get(key);
    if (!existing) return std::unexpected(existing.error());
    if (!*existing) {
        return std::unexpected(RegistryError{RegistryError::Kind::TaskNotFound,
                                             std::format("no task found for pid {}", pid)});
    }

    auto record = TaskRecord::from_json(**existing);
    if (!record) return std::unexpected(record.error());

    fn(*record);
    return map_->insert(key, record->to_json());
}

std::expected<void, RegistryError>
TaskRegistry::mark_completed(int pid, std::optional<std::string> result,
                             std::optional<int> exit_code, TimePoint completed_at) {
    return update(pid, [&](TaskRecord& r) {
        r.mark_completed(std::move(result), exit_code, completed_at);
    });
}

std::expected<void, RegistryError> TaskRegistry::bind_task_id(int pid, const std::string& task_id) {
    return update(pid, [&](TaskRecord& r) { r.task_id = task_id; });
}

std::expected<void, RegistryError>
TaskRegistry::bind_worktree(int pid, const WorktreeInfo& worktree) {
    return update(pid, [&](TaskRecord& r) { r.worktree = worktree; });
}

std::expected<std::optional<TaskRecord>, RegistryError> TaskRegistry::remove(int pid) {
    std::optional<std::string> removed;
    {
        std::lock_guard lock(mutex_);
        auto result = map_->remove(std::to_string(pid));
        if (!result) return std::unexpected(result.error());
        removed = std::move(*result);
    }
    if (!removed) return std::optional<TaskRecord>{};

    auto record = TaskRecord::from_json(*removed);
    if (!record) {
        // The entry is gone either way.
        logging::warn(std::format("registry: removed unreadable record for pid {}: {}",
                                  pid, to_string(record.error())));
        return std::optional<TaskRecord>{};
    }
    return std::optional<TaskRecord>{std::move(*record)};
}

std::expected<std::vector<RegistryEntry>, RegistryError> TaskRegistry::entries() {
    std::lock_guard lock(mutex_);
    auto snapshot = map_->snapshot();
    if (!snapshot) return std::unexpected(snapshot.error());

    std::vector<RegistryEntry> result;
    std::vector<std::string> invalid;

    for (auto& [key, value] : *snapshot) {
        auto pid = parse_pid(key);
        if (!pid) {
            logging::warn(std::format("registry: dropping invalid pid key '{}'", key));
            invalid.push_back(key);
            continue;
        }
        auto record = TaskRecord::from_json(value);
        if (!record) {
            logging::warn(std::format("registry: dropping unreadable record for pid {}: {}",
                                      key, to_string(record.error())));
            invalid.push_back(key);
            continue;
        }
        result.push_back(RegistryEntry{*pid, key, std::move(*record)});
    }

    if (!invalid.empty()) {
        auto removed = map_->remove_many(invalid);
        if (!removed) return std::unexpected(removed.error());
    }
    return result;
}

std::expected<std::vector<RegistryEntry>, RegistryError>
TaskRegistry::get_completed_unread_tasks() {
    auto all = entries();
    if (!all) return std::unexpected(all.error());

    std::vector<RegistryEntry> completed;
    for (auto& e : *all) {
        if (e.record.status == TaskStatus::CompletedButUnread) {
            completed.push_back(std::move(e));
        }
    }
    return completed;
}

std::expected<bool, RegistryError> TaskRegistry::has_running_tasks(std::optional<int> root_filter) {
    auto all = entries();
    if (!all) return std::unexpected(all.error());

    for (const auto& e : *all) {
        if (!e.record.is_running()) continue;
        if (!root_filter || e.record.root_parent_pid == root_filter) return true;
    }
    return false;
}

std::expected<std::vector<CleanupEvent>, RegistryError>
TaskRegistry::sweep_stale_entries(TimePoint now, const AliveFn& is_alive,
                                  const TerminateFn& terminate, std::chrono::hours max_age) {
    auto all = entries();
    if (!all) return std::unexpected(all.error());

    std::vector<CleanupEvent> events;
    std::vector<std::string> removals;

    for (auto& e : *all) {
        std::optional<CleanupReason> reason;

        if (!is_alive(e.pid)) {
            reason = CleanupReason::ProcessExited;
        } else if (e.record.manager_pid && *e.record.manager_pid != e.pid &&
                   !is_alive(*e.record.manager_pid)) {
            terminate(e.pid);
            reason = CleanupReason::ManagerMissing;
        } else if (now - e.record.started_at > max_age) {
            terminate(e.pid);
            reason = CleanupReason::Timeout;
        }

        if (!reason) continue;

        logging::debug(std::format("registry: sweeping pid {} ({})", e.pid, to_string(*reason)));
        removals.push_back(e.key);
        e.record.with_cleanup_reason(to_string(*reason), now);
        events.push_back(CleanupEvent{e.pid, std::move(e.record), *reason});
    }

    if (!removals.empty()) {
        std::lock_guard lock(mutex_);
        auto removed = map_->remove_many(removals);
        if (!removed) return std::unexpected(removed.error());
    }
    return events;
}

std::expected<void, RegistryError> TaskRegistry::cleanup() {
    if (namespace_.empty()) return {};
    return platform::unlink_shared_map(namespace_);
}

RegistrationGuard::RegistrationGuard(TaskRegistry& registry, int pid)
    : registry_(registry), pid_(pid) {}

RegistrationGuard::~RegistrationGuard() {
    if (completed_) return;

    auto removed = registry_.remove(pid_);
    if (!removed) {
        logging::warn(std::format("registry: failed to roll back entry for pid {}: {}",
                                  pid_, to_string(removed.error())));
    }
}

std::expected<void, RegistryError>
RegistrationGuard::mark_completed(std::optional<std::string> result, std::optional<int> exit_code,
                                  TimePoint completed_at) {
    auto marked = registry_.mark_completed(pid_, std::move(result), exit_code, completed_at);
    if (marked) completed_ = true;
    return marked;
}
