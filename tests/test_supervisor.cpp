#include <catch2/catch.hpp>

#include "config.hpp"
#include "memory_shared_map.hpp"
#include "scoped_env.hpp"
#include "supervisor.hpp"
#include "task_registry.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct TmpDir {
    fs::path path;

    TmpDir() {
        path = fs::temp_directory_path() / ("aw_test_sup_" + std::to_string(getpid()));
        fs::create_directories(path);
    }

    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Refuses every registration and remembers which pids tried.
class RejectingMap : public MemorySharedMap {
public:
    std::vector<std::string> attempted;

    std::expected<bool, RegistryError>
    try_insert(const std::string& key, const std::string&) override {
        attempted.push_back(key);
        return false;
    }
};

// True once pid has been reaped (or never existed).
bool process_gone(int pid) {
    return ::kill(pid, 0) == -1 && errno == ESRCH;
}

SupervisorRequest shell_request(const std::string& script) {
    SupervisorRequest req;
    req.agent = AgentKind::Claude;
    req.args = {"-c", script};
    req.mode = OutputMode::TailOnly;
    return req;
}

} // namespace

TEST_CASE("classify_result", "[supervisor]") {
    REQUIRE(classify_result(true, 0) == "success");
    REQUIRE(classify_result(false, 3) == "failed_with_exit_code_3");
    REQUIRE(classify_result(false, std::nullopt) == "failed_without_exit_code");
}

TEST_CASE("Supervisor", "[supervisor]") {
    ScopedEnv bin("CLAUDE_BIN", "/bin/sh");
    TmpDir logs;
    Config config;
    TaskRegistry registry(std::make_unique<MemorySharedMap>());
    Supervisor supervisor(registry, config);
    supervisor.set_log_dir(logs.path.string());

    SECTION("SuccessfulRun") {
        auto outcome = supervisor.run(shell_request("echo hello from agent"));
        REQUIRE(outcome);
        REQUIRE(outcome->exit_code == 0);
        REQUIRE(outcome->result == "success");
        REQUIRE(outcome->pid > 0);

        REQUIRE(fs::path(outcome->log_path).parent_path() == logs.path);
        REQUIRE(read_file(outcome->log_path).find("hello from agent") != std::string::npos);

        auto entries = registry.entries();
        REQUIRE(entries);
        REQUIRE(entries->size() == 1);
        const auto& record = (*entries)[0].record;
        REQUIRE((*entries)[0].pid == outcome->pid);
        REQUIRE(record.status == TaskStatus::CompletedButUnread);
        REQUIRE(record.result == "success");
        REQUIRE(record.exit_code == 0);
        REQUIRE(record.completed_at.has_value());
        REQUIRE(record.log_path == outcome->log_path);
        REQUIRE(record.log_id == std::to_string(outcome->pid));
        REQUIRE(record.manager_pid == getpid());
    }

    SECTION("FailedRunKeepsExitCode") {
        auto outcome = supervisor.run(shell_request("echo partial; exit 3"));
        REQUIRE(outcome);
        REQUIRE(outcome->exit_code == 3);
        REQUIRE(outcome->result == "failed_with_exit_code_3");
        REQUIRE(read_file(outcome->log_path).find("partial") != std::string::npos);

        auto completed = registry.get_completed_unread_tasks();
        REQUIRE(completed);
        REQUIRE(completed->size() == 1);
        REQUIRE((*completed)[0].record.exit_code == 3);
    }

    SECTION("StderrIsLogged") {
        auto outcome = supervisor.run(shell_request("echo oops >&2"));
        REQUIRE(outcome);
        REQUIRE(read_file(outcome->log_path).find("oops") != std::string::npos);
    }

    SECTION("KilledChildHasNoExitCode") {
        auto outcome = supervisor.run(shell_request("kill -9 $$"));
        REQUIRE(outcome);
        REQUIRE(outcome->exit_code == 1);
        REQUIRE(outcome->result == "failed_without_exit_code");
    }

    SECTION("WorkingDirectoryIsApplied") {
        auto req = shell_request("pwd");
        req.cwd = logs.path.string();
        auto outcome = supervisor.run(req);
        REQUIRE(outcome);
        auto canonical = fs::canonical(logs.path).string();
        REQUIRE(read_file(outcome->log_path).find(canonical) != std::string::npos);
    }

    SECTION("EnvironmentIsInjectedAndMarkersRemoved") {
        ScopedEnv marker("CLAUDECODE", "1");
        auto req = shell_request("echo \"key=$AW_TEST_KEY nested=${CLAUDECODE:-none}\"");
        req.env = {{"AW_TEST_KEY", "secret"}};
        auto outcome = supervisor.run(req);
        REQUIRE(outcome);
        auto log = read_file(outcome->log_path);
        REQUIRE(log.find("key=secret") != std::string::npos);
        REQUIRE(log.find("nested=none") != std::string::npos);
    }

    SECTION("MissingWorkingDirectory") {
        auto req = shell_request("true");
        req.cwd = (logs.path / "does-not-exist").string();
        auto outcome = supervisor.run(req);
        REQUIRE_FALSE(outcome);
        REQUIRE(outcome.error().kind == SupervisorError::Kind::Other);

        auto entries = registry.entries();
        REQUIRE(entries);
        REQUIRE(entries->empty());
    }

    SECTION("WorkingDirectoryIsAFile") {
        auto file = logs.path / "plain.txt";
        std::ofstream(file) << "x";
        auto req = shell_request("true");
        req.cwd = file.string();
        auto outcome = supervisor.run(req);
        REQUIRE_FALSE(outcome);
        REQUIRE(outcome.error().kind == SupervisorError::Kind::Other);
    }

    SECTION("MissingBinary") {
        ScopedEnv missing("CLAUDE_BIN", "/nonexistent/claude");
        auto outcome = supervisor.run(shell_request("true"));
        REQUIRE_FALSE(outcome);
        REQUIRE(outcome.error().kind == SupervisorError::Kind::CliNotFound);
    }

    SECTION("StaleEntriesAreSweptFirst") {
        // A pid that cannot be alive.
        TaskRecord stale(std::chrono::system_clock::now(), "stale", "/tmp/stale.log", getpid());
        REQUIRE(registry.register_task(999999999, stale));

        auto outcome = supervisor.run(shell_request("true"));
        REQUIRE(outcome);

        auto entries = registry.entries();
        REQUIRE(entries);
        REQUIRE(entries->size() == 1);
        REQUIRE((*entries)[0].pid == outcome->pid);
    }
}

TEST_CASE("Supervisor failures after spawn", "[supervisor]") {
    ScopedEnv bin("CLAUDE_BIN", "/bin/sh");
    TmpDir dir;
    Config config;
    auto pid_file = dir.path / "child.pid";
    // Long enough that returning early proves the child was stopped.
    auto request = shell_request("echo $$ > " + pid_file.string() + "; exec sleep 30");

    SECTION("LogDirectoryUnavailable") {
        TaskRegistry registry(std::make_unique<MemorySharedMap>());
        Supervisor supervisor(registry, config);
        auto blocker = dir.path / "not-a-dir";
        std::ofstream(blocker) << "x";
        supervisor.set_log_dir((blocker / "logs").string());

        auto start = std::chrono::steady_clock::now();
        auto outcome = supervisor.run(request);
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE_FALSE(outcome);
        REQUIRE(outcome.error().kind == SupervisorError::Kind::Io);
        REQUIRE(elapsed < std::chrono::seconds(10));

        auto entries = registry.entries();
        REQUIRE(entries);
        REQUIRE(entries->empty());

        // The child may have been stopped before it wrote its pid.
        auto written = read_file(pid_file.string());
        if (!written.empty()) {
            REQUIRE(process_gone(std::stoi(written)));
        }
    }

    SECTION("RegistrationRejected") {
        auto map = std::make_unique<RejectingMap>();
        auto* raw = map.get();
        TaskRegistry registry(std::move(map));
        Supervisor supervisor(registry, config);
        supervisor.set_log_dir(dir.path.string());

        auto start = std::chrono::steady_clock::now();
        auto outcome = supervisor.run(request);
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE_FALSE(outcome);
        REQUIRE(outcome.error().kind == SupervisorError::Kind::Registry);
        REQUIRE(elapsed < std::chrono::seconds(10));

        REQUIRE(raw->attempted.size() == 1);
        REQUIRE(process_gone(std::stoi(raw->attempted[0])));

        auto entries = registry.entries();
        REQUIRE(entries);
        REQUIRE(entries->empty());
    }
}
