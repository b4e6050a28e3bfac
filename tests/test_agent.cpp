#include <catch2/catch.hpp>

#include "agent.hpp"
#include "config.hpp"
#include "scoped_env.hpp"

#include <string>
#include <vector>

TEST_CASE("Agent selection", "[agent]") {

    SECTION("ParseKnownAgents") {
        REQUIRE(parse_agent("claude") == AgentKind::Claude);
        REQUIRE(parse_agent("codex") == AgentKind::Codex);
        REQUIRE(parse_agent("gemini") == AgentKind::Gemini);
        REQUIRE_FALSE(parse_agent("gpt").has_value());
        REQUIRE_FALSE(parse_agent("").has_value());
    }

    SECTION("Names") {
        REQUIRE(std::string(to_string(AgentKind::Codex)) == "codex");
        REQUIRE(std::string(display_name(AgentKind::Gemini)) == "Gemini");
        REQUIRE(std::string(override_env_var(AgentKind::Claude)) == "CLAUDE_BIN");
        REQUIRE(std::string(override_env_var(AgentKind::Codex)) == "CODEX_BIN");
        REQUIRE(std::string(override_env_var(AgentKind::Gemini)) == "GEMINI_BIN");
    }

    SECTION("BinaryNameFromConfig") {
        Config cfg;
        cfg.agents.gemini = "gemini-beta";
        REQUIRE(binary_name(AgentKind::Gemini, cfg) == "gemini-beta");
        REQUIRE(binary_name(AgentKind::Claude, cfg) == "claude");
    }

    SECTION("FullAccessArgs") {
        std::vector<std::string> prompt = {"fix the tests"};
        REQUIRE(full_access_args(AgentKind::Claude, prompt) ==
                std::vector<std::string>{"-p", "--dangerously-skip-permissions", "fix the tests"});
        REQUIRE(full_access_args(AgentKind::Codex, prompt) ==
                std::vector<std::string>{"exec", "--dangerously-bypass-approvals-and-sandbox",
                                         "fix the tests"});
        REQUIRE(full_access_args(AgentKind::Gemini, prompt) ==
                std::vector<std::string>{"-p", "--approval-mode", "yolo", "fix the tests"});
    }
}

TEST_CASE("Executable resolution", "[agent]") {
    Config cfg;

    SECTION("FindInPath") {
        ScopedEnv path("PATH", "/nonexistent:/bin:/usr/bin");
        auto sh = find_in_path("sh");
        REQUIRE(sh.has_value());
        REQUIRE(sh->ends_with("/sh"));
    }

    SECTION("AbsolutePathCheckedAsGiven") {
        REQUIRE(find_in_path("/bin/sh") == "/bin/sh");
        REQUIRE_FALSE(find_in_path("/nonexistent/agent").has_value());
        // Directories are not executables.
        REQUIRE_FALSE(find_in_path("/bin").has_value());
    }

    SECTION("EnvOverrideWins") {
        ScopedEnv bin("CLAUDE_BIN", "/bin/sh");
        auto exe = resolve_agent_executable(AgentKind::Claude, cfg);
        REQUIRE(exe);
        REQUIRE(*exe == "/bin/sh");
    }

    SECTION("BadOverrideIsAnError") {
        ScopedEnv bin("CODEX_BIN", "/nonexistent/codex");
        auto exe = resolve_agent_executable(AgentKind::Codex, cfg);
        REQUIRE_FALSE(exe);
        REQUIRE(exe.error().kind == SupervisorError::Kind::CliNotFound);
        REQUIRE(exe.error().message.find("CODEX_BIN") != std::string::npos);
    }

    SECTION("NotFoundNamesRemedy") {
        ScopedEnv bin("GEMINI_BIN", nullptr);
        ScopedEnv path("PATH", "/nonexistent");
        auto exe = resolve_agent_executable(AgentKind::Gemini, cfg);
        REQUIRE_FALSE(exe);
        REQUIRE(exe.error().kind == SupervisorError::Kind::CliNotFound);
        REQUIRE(exe.error().message.find("GEMINI_BIN") != std::string::npos);
        REQUIRE(exe.error().message.find("PATH") != std::string::npos);
    }

    SECTION("ConfiguredBinaryName") {
        ScopedEnv bin("CLAUDE_BIN", nullptr);
        ScopedEnv path("PATH", "/bin:/usr/bin");
        cfg.agents.claude = "sh";
        auto exe = resolve_agent_executable(AgentKind::Claude, cfg);
        REQUIRE(exe);
        REQUIRE(exe->ends_with("/sh"));
    }
}
