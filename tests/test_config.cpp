#include <catch2/catch.hpp>

#include "config.hpp"
#include "scoped_env.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "aw_test_config_XXXXXX";
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        [[maybe_unused]] auto n = ::write(fd, content.data(), content.size());
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.agents.claude == "claude");
        REQUIRE(cfg.agents.codex == "codex");
        REQUIRE(cfg.agents.gemini == "gemini");
        REQUIRE(cfg.registry.shared_memory_bytes == 16 * 1024 * 1024);
        REQUIRE(cfg.registry.max_record_age() == std::chrono::hours(12));
        REQUIRE(cfg.wait.interval_seconds == 30);
        REQUIRE(cfg.wait.max_hours == 24);
        REQUIRE(cfg.output.tail_lines == 50);
        REQUIRE(cfg.history.enabled);
        REQUIRE_FALSE(cfg.debug);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "agents": { "claude": "claude-nightly", "codex": "/opt/codex", "gemini": "gem" },
            "registry": { "shared_memory_bytes": 1048576, "max_record_age_hours": 6 },
            "wait": { "interval_seconds": 5, "max_hours": 2 },
            "output": { "tail_lines": 20 },
            "history": { "enabled": false },
            "debug": true
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.agents.claude == "claude-nightly");
        REQUIRE(cfg.agents.codex == "/opt/codex");
        REQUIRE(cfg.agents.gemini == "gem");
        REQUIRE(cfg.registry.shared_memory_bytes == 1048576);
        REQUIRE(cfg.registry.max_record_age() == std::chrono::hours(6));
        REQUIRE(cfg.wait.interval_seconds == 5);
        REQUIRE(cfg.wait.max_hours == 2);
        REQUIRE(cfg.output.tail_lines == 20);
        REQUIRE_FALSE(cfg.history.enabled);
        REQUIRE(cfg.debug);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "wait": { "interval_seconds": 1 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.wait.interval_seconds == 1);
        // Other fields retain defaults
        REQUIRE(cfg.wait.max_hours == 24);
        REQUIRE(cfg.agents.claude == "claude");
        REQUIRE(cfg.registry.max_record_age_hours == 12);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.wait.interval_seconds == 30);
        REQUIRE(cfg.output.tail_lines == 50);
    }

    SECTION("LoadWrongType") {
        TmpFile f(R"({ "wait": { "interval_seconds": "soon" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.wait.interval_seconds == 30);
    }

    SECTION("LoadZeroIntervalKeepsDefault") {
        TmpFile f(R"({ "wait": { "interval_seconds": 0, "max_hours": 3 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.wait.interval_seconds == 30);
        REQUIRE(cfg.wait.max_hours == 3);
    }

    SECTION("EnvIgnoresZeroInterval") {
        ScopedEnv env(kWaitIntervalEnv, "0");
        Config cfg;
        cfg.apply_env();
        REQUIRE(cfg.wait.interval_seconds == 30);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/aw_test_nonexistent_config_file.json");
        REQUIRE(cfg.agents.claude == "claude");
        REQUIRE(cfg.wait.interval_seconds == 30);
    }

    SECTION("EnvOverridesInterval") {
        ScopedEnv env(kWaitIntervalEnv, "7");
        Config cfg;
        cfg.apply_env();
        REQUIRE(cfg.wait.interval_seconds == 7);
    }

    SECTION("EnvIgnoresInvalidInterval") {
        ScopedEnv env(kWaitIntervalEnv, "often");
        Config cfg;
        cfg.apply_env();
        REQUIRE(cfg.wait.interval_seconds == 30);
    }

    SECTION("EnvEnablesDebug") {
        ScopedEnv env(kDebugEnv, "1");
        Config cfg;
        cfg.apply_env();
        REQUIRE(cfg.debug);
    }
}
