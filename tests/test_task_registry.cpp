#include <catch2/catch.hpp>

#include "memory_shared_map.hpp"
#include "task_registry.hpp"

#include <chrono>
#include <memory>
#include <set>
#include <stdexcept>
#include <vector>

using namespace std::chrono_literals;

namespace {

TaskRecord make_record(int pid, std::optional<int> manager = std::nullopt,
                       TimePoint started = std::chrono::system_clock::now()) {
    return TaskRecord(started, std::to_string(pid), "/tmp/" + std::to_string(pid) + ".log",
                      manager);
}

// Registry over an in-process map, with direct access to the raw map.
struct Fixture {
    MemorySharedMap* raw;
    TaskRegistry registry;

    Fixture() : Fixture(std::make_unique<MemorySharedMap>()) {}

private:
    explicit Fixture(std::unique_ptr<MemorySharedMap> map)
        : raw(map.get()), registry(std::move(map)) {}
};

} // namespace

TEST_CASE("TaskRegistry basic operations", "[registry]") {
    Fixture fx;
    auto& registry = fx.registry;

    SECTION("RegisterThenEntries") {
        auto record = make_record(321, 1321);
        REQUIRE(registry.register_task(321, record));

        auto entries = registry.entries();
        REQUIRE(entries);
        REQUIRE(entries->size() == 1);
        REQUIRE((*entries)[0].pid == 321);
        REQUIRE((*entries)[0].key == "321");
        REQUIRE((*entries)[0].record.to_json() == record.to_json());
    }

    SECTION("RemoveReturnsRecord") {
        auto record = make_record(321, 1321);
        REQUIRE(registry.register_task(321, record));

        auto removed = registry.remove(321);
        REQUIRE(removed);
        REQUIRE(removed->has_value());
        REQUIRE((*removed)->to_json() == record.to_json());

        auto entries = registry.entries();
        REQUIRE(entries);
        REQUIRE(entries->empty());
    }

    SECTION("RemoveUnknownPidIsNotAnError") {
        auto removed = registry.remove(55555);
        REQUIRE(removed);
        REQUIRE_FALSE(removed->has_value());
    }

    SECTION("DuplicateRegistrationRejected") {
        REQUIRE(registry.register_task(500, make_record(500, 1)));

        auto second = make_record(500, 2);
        auto result = registry.register_task(500, second);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().kind == RegistryError::Kind::DuplicatePid);

        // The first entry is untouched.
        auto entries = registry.entries();
        REQUIRE(entries->size() == 1);
        REQUIRE((*entries)[0].record.manager_pid == 1);
    }

    SECTION("MarkCompleted") {
        REQUIRE(registry.register_task(10, make_record(10)));
        REQUIRE(registry.register_task(11, make_record(11)));

        auto t = std::chrono::system_clock::now();
        REQUIRE(registry.mark_completed(10, "ok", 0, t));

        auto completed = registry.get_completed_unread_tasks();
        REQUIRE(completed);
        REQUIRE(completed->size() == 1);
        REQUIRE((*completed)[0].pid == 10);
        REQUIRE((*completed)[0].record.status == TaskStatus::CompletedButUnread);
        REQUIRE((*completed)[0].record.result == "ok");
        REQUIRE((*completed)[0].record.exit_code == 0);

        // Pure filter: the entries stay.
        REQUIRE(registry.entries()->size() == 2);
    }

    SECTION("MarkCompletedUnknownPid") {
        auto result = registry.mark_completed(404, "ok", 0, std::chrono::system_clock::now());
        REQUIRE_FALSE(result);
        REQUIRE(result.error().kind == RegistryError::Kind::TaskNotFound);
    }

    SECTION("BindTaskIdAndWorktree") {
        REQUIRE(registry.register_task(20, make_record(20)));
        REQUIRE(registry.bind_task_id(20, "job-1"));
        REQUIRE(registry.bind_worktree(20, WorktreeInfo{"/wt", "main", "deadbeef"}));

        auto entries = registry.entries();
        REQUIRE(entries->size() == 1);
        REQUIRE((*entries)[0].record.task_id == "job-1");
        REQUIRE((*entries)[0].record.worktree == WorktreeInfo{"/wt", "main", "deadbeef"});
        REQUIRE((*entries)[0].record.is_running());

        REQUIRE(registry.bind_task_id(21, "x").error().kind == RegistryError::Kind::TaskNotFound);
    }

    SECTION("HasRunningTasks") {
        REQUIRE_FALSE(*registry.has_running_tasks());

        auto a = make_record(30);
        a.with_process_tree({30, 7}, 7, 2);
        REQUIRE(registry.register_task(30, a));

        REQUIRE(*registry.has_running_tasks());
        REQUIRE(*registry.has_running_tasks(7));
        REQUIRE_FALSE(*registry.has_running_tasks(8));

        REQUIRE(registry.mark_completed(30, "success", 0, std::chrono::system_clock::now()));
        REQUIRE_FALSE(*registry.has_running_tasks());
    }

    SECTION("EntriesPurgesInvalidKeysAndRecords") {
        REQUIRE(registry.register_task(40, make_record(40)));
        REQUIRE(fx.raw->insert("not-a-pid", make_record(1).to_json()));
        REQUIRE(fx.raw->insert("41", "{garbage"));
        REQUIRE(fx.raw->insert("-3", make_record(3).to_json()));

        auto entries = registry.entries();
        REQUIRE(entries);
        REQUIRE(entries->size() == 1);
        REQUIRE((*entries)[0].pid == 40);

        auto remaining = fx.raw->snapshot();
        REQUIRE(remaining->size() == 1);
        REQUIRE((*remaining)[0].first == "40");
    }

    SECTION("CleanupOfInProcessRegistryIsNoop") {
        REQUIRE(registry.cleanup());
    }
}

TEST_CASE("TaskRegistry sweep", "[registry][sweep]") {
    Fixture fx;
    auto& registry = fx.registry;
    auto now = std::chrono::system_clock::now();
    std::vector<int> terminated;
    auto terminate = [&terminated](int pid) { terminated.push_back(pid); };

    SECTION("ProcessExited") {
        REQUIRE(registry.register_task(123, make_record(123, 1123, now)));

        auto events = registry.sweep_stale_entries(now, [](int p) { return p != 123; }, terminate);
        REQUIRE(events);
        REQUIRE(events->size() == 1);
        REQUIRE((*events)[0].pid == 123);
        REQUIRE((*events)[0].reason == CleanupReason::ProcessExited);
        REQUIRE((*events)[0].record.cleanup_reason == "process_exited");
        REQUIRE(terminated.empty());
        REQUIRE(registry.entries()->empty());
    }

    SECTION("ManagerMissing") {
        REQUIRE(registry.register_task(200, make_record(200, 2000, now)));

        auto events = registry.sweep_stale_entries(now, [](int p) { return p != 2000; }, terminate);
        REQUIRE(events->size() == 1);
        REQUIRE((*events)[0].reason == CleanupReason::ManagerMissing);
        REQUIRE((*events)[0].record.cleanup_reason == "manager_missing");
        REQUIRE(terminated == std::vector<int>{200});
        REQUIRE(registry.entries()->empty());
    }

    SECTION("ManagerEqualToOwnPidIsIgnored") {
        REQUIRE(registry.register_task(210, make_record(210, 210, now)));

        auto events = registry.sweep_stale_entries(now, [](int) { return true; }, terminate);
        REQUIRE(events->empty());
        REQUIRE(registry.entries()->size() == 1);
    }

    SECTION("Timeout") {
        REQUIRE(registry.register_task(456, make_record(456, 4560, now - 13h)));

        auto events = registry.sweep_stale_entries(now, [](int) { return true; }, terminate);
        REQUIRE(events->size() == 1);
        REQUIRE((*events)[0].reason == CleanupReason::Timeout);
        REQUIRE((*events)[0].record.cleanup_reason == "timeout");
        REQUIRE(terminated == std::vector<int>{456});
        REQUIRE(registry.entries()->empty());
    }

    SECTION("ExitedBeatsTimeout") {
        REQUIRE(registry.register_task(457, make_record(457, 4570, now - 20h)));

        auto events = registry.sweep_stale_entries(now, [](int p) { return p != 457; }, terminate);
        REQUIRE(events->size() == 1);
        REQUIRE((*events)[0].reason == CleanupReason::ProcessExited);
        REQUIRE(terminated.empty());
    }

    SECTION("CustomMaxAge") {
        REQUIRE(registry.register_task(458, make_record(458, std::nullopt, now - 2h)));

        auto events = registry.sweep_stale_entries(now, [](int) { return true; }, terminate, 1h);
        REQUIRE(events->size() == 1);
        REQUIRE((*events)[0].reason == CleanupReason::Timeout);
    }

    SECTION("HealthyEntriesUntouched") {
        REQUIRE(registry.register_task(300, make_record(300, 3000, now - 1h)));
        REQUIRE(registry.register_task(301, make_record(301, std::nullopt, now)));

        auto events = registry.sweep_stale_entries(now, [](int) { return true; }, terminate);
        REQUIRE(events->empty());
        REQUIRE(terminated.empty());
        REQUIRE(registry.entries()->size() == 2);
    }

    SECTION("MixedBatch") {
        REQUIRE(registry.register_task(1, make_record(1, 100, now)));       // exited
        REQUIRE(registry.register_task(2, make_record(2, 200, now)));       // manager gone
        REQUIRE(registry.register_task(3, make_record(3, 300, now - 13h))); // timeout
        REQUIRE(registry.register_task(4, make_record(4, 400, now)));       // healthy

        std::set<int> dead = {1, 200};
        auto events = registry.sweep_stale_entries(
            now, [&dead](int p) { return !dead.contains(p); }, terminate);
        REQUIRE(events->size() == 3);

        auto entries = registry.entries();
        REQUIRE(entries->size() == 1);
        REQUIRE((*entries)[0].pid == 4);
        REQUIRE(terminated.size() == 2);
    }
}

TEST_CASE("RegistrationGuard", "[registry][guard]") {
    Fixture fx;
    auto& registry = fx.registry;

    SECTION("DropWithoutCompletionRemovesEntry") {
        REQUIRE(registry.register_task(77777, make_record(77777)));
        {
            RegistrationGuard guard(registry, 77777);
        }
        REQUIRE(registry.entries()->empty());
    }

    SECTION("UnwindingRemovesEntry") {
        REQUIRE(registry.register_task(77777, make_record(77777)));
        try {
            RegistrationGuard guard(registry, 77777);
            throw std::runtime_error("supervision failed");
        } catch (const std::runtime_error&) {
        }
        REQUIRE(registry.entries()->empty());
    }

    SECTION("MarkCompletedKeepsEntry") {
        REQUIRE(registry.register_task(88888, make_record(88888)));
        {
            RegistrationGuard guard(registry, 88888);
            REQUIRE(guard.mark_completed("failed_with_exit_code_3", 3,
                                         std::chrono::system_clock::now()));
        }

        auto entries = registry.entries();
        REQUIRE(entries->size() == 1);
        REQUIRE((*entries)[0].record.status == TaskStatus::CompletedButUnread);
        REQUIRE((*entries)[0].record.result == "failed_with_exit_code_3");
        REQUIRE((*entries)[0].record.exit_code == 3);
    }

    SECTION("FailedMarkStillRollsBack") {
        {
            // Nothing registered, so mark_completed fails.
            RegistrationGuard guard(registry, 99999);
            REQUIRE_FALSE(guard.mark_completed("success", 0, std::chrono::system_clock::now()));
        }
        REQUIRE(registry.entries()->empty());
    }
}

TEST_CASE("TaskRegistry namespaces", "[registry]") {
    REQUIRE(TaskRegistry::namespace_for(4242) == "agent_warden_4242_task");
}
