#pragma once

#include "errors.hpp"
#include "platform/shared_map.hpp"
#include "task_record.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

inline constexpr size_t kDefaultRegionBytes = 16 * 1024 * 1024;
inline constexpr std::chrono::hours kMaxRecordAge{12};

struct RegistryEntry {
    int pid = 0;
    std::string key;
    TaskRecord record;
};

enum class CleanupReason { ProcessExited, ManagerMissing, Timeout };

const char* to_string(CleanupReason reason);

struct CleanupEvent {
    int pid = 0;
    TaskRecord record;
    CleanupReason reason;
};

// pid -> TaskRecord map shared by every process in one namespace.
// All calls on one handle are serialized; the backing map serializes
// across processes.
class TaskRegistry {
public:
    using AliveFn = std::function<bool(int)>;
    using TerminateFn = std::function<void(int)>;

    // Registry over an arbitrary map. An empty namespace means cleanup()
    // has nothing to unlink.
    explicit TaskRegistry(std::unique_ptr<SharedMap> map, std::string ns = {});

    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    // Namespace of this process's cached root ancestor. Failing to resolve
    // the ancestor is a ProcessTree error, failing to map a Registry one.
    static std::expected<std::unique_ptr<TaskRegistry>, SupervisorError>
        connect(size_t region_bytes = kDefaultRegionBytes);
    static std::expected<std::unique_ptr<TaskRegistry>, SupervisorError>
        connect_to_root(const std::expected<int, ProcessTreeError>& root,
                        size_t region_bytes = kDefaultRegionBytes);
    static std::expected<std::unique_ptr<TaskRegistry>, RegistryError>
        connect_for_pid(int root_pid, size_t region_bytes = kDefaultRegionBytes);
    static std::expected<std::unique_ptr<TaskRegistry>, RegistryError>
        connect_with_namespace(const std::string& ns, size_t region_bytes = kDefaultRegionBytes);

    static std::string namespace_for(int root_pid);

    const std::string& namespace_name() const { return namespace_; }

    // Fails with DuplicatePid if pid already has an entry.
    std::expected<void, RegistryError> register_task(int pid, const TaskRecord& record);

    std::expected<void, RegistryError>
        mark_completed(int pid, std::optional<std::string> result, std::optional<int> exit_code,
                       TimePoint completed_at);

    std::expected<void, RegistryError> bind_task_id(int pid, const std::string& task_id);
    std::expected<void, RegistryError> bind_worktree(int pid, const WorktreeInfo& worktree);

    // The removed record, or nullopt if pid had no entry.
    std::expected<std::optional<TaskRecord>, RegistryError> remove(int pid);

    // Unparseable keys and records are logged and purged.
    std::expected<std::vector<RegistryEntry>, RegistryError> entries();

    std::expected<std::vector<RegistryEntry>, RegistryError> get_completed_unread_tasks();

    // Any Running entry; with a filter, only entries whose root_parent_pid
    // matches it.
    std::expected<bool, RegistryError> has_running_tasks(std::optional<int> root_filter = {});

    // Removes dead, orphaned and overage entries, terminating live ones.
    // Reasons are checked in order ProcessExited, ManagerMissing, Timeout.
    std::expected<std::vector<CleanupEvent>, RegistryError>
        sweep_stale_entries(TimePoint now, const AliveFn& is_alive, const TerminateFn& terminate,
                            std::chrono::hours max_age = kMaxRecordAge);

    // Unlinks the shared region name. Mapped handles stay valid.
    std::expected<void, RegistryError> cleanup();

private:
    template <typename Fn>
    std::expected<void, RegistryError> update(int pid, Fn&& fn);

    std::mutex mutex_;
    std::unique_ptr<SharedMap> map_;
    std::string namespace_;
};

// Removes the registered entry on destruction unless mark_completed
// succeeded, so a supervisor that unwinds early leaves nothing behind.
class RegistrationGuard {
public:
    RegistrationGuard(TaskRegistry& registry, int pid);
    ~RegistrationGuard();

    RegistrationGuard(const RegistrationGuard&) = delete;
    RegistrationGuard& operator=(const RegistrationGuard&) = delete;

    std::expected<void, RegistryError>
        mark_completed(std::optional<std::string> result, std::optional<int> exit_code,
                       TimePoint completed_at);

    int pid() const { return pid_; }

private:
    TaskRegistry& registry_;
    int pid_;
    bool completed_ = false;
};
