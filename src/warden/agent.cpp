#include "agent.hpp"

#include "config.hpp"

#include <cstdlib>
#include <format>
#include <sys/stat.h>

namespace {

bool is_executable(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return (st.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) != 0;
}

} // namespace

std::optional<AgentKind> parse_agent(std::string_view name) {
    if (name == "claude") return AgentKind::Claude;
    if (name == "codex") return AgentKind::Codex;
    if (name == "gemini") return AgentKind::Gemini;
    return std::nullopt;
}

const char* to_string(AgentKind agent) {
    switch (agent) {
        case AgentKind::Claude: return "claude";
        case AgentKind::Codex: return "codex";
        case AgentKind::Gemini: return "gemini";
    }
    return "claude";
}

const char* display_name(AgentKind agent) {
    switch (agent) {
        case AgentKind::Claude: return "Claude";
        case AgentKind::Codex: return "Codex";
        case AgentKind::Gemini: return "Gemini";
    }
    return "Claude";
}

const char* override_env_var(AgentKind agent) {
    switch (agent) {
        case AgentKind::Claude: return "CLAUDE_BIN";
        case AgentKind::Codex: return "CODEX_BIN";
        case AgentKind::Gemini: return "GEMINI_BIN";
    }
    return "CLAUDE_BIN";
}

std::string binary_name(AgentKind agent, const Config& config) {
    switch (agent) {
        case AgentKind::Claude: return config.agents.claude;
        case AgentKind::Codex: return config.agents.codex;
        case AgentKind::Gemini: return config.agents.gemini;
    }
    return config.agents.claude;
}

std::vector<std::string> full_access_args(AgentKind agent,
                                          const std::vector<std::string>& passthrough) {
    std::vector<std::string> args;
    switch (agent) {
        case AgentKind::Claude:
            args = {"-p", "--dangerously-skip-permissions"};
            break;
        case AgentKind::Codex:
            args = {"exec", "--dangerously-bypass-approvals-and-sandbox"};
            break;
        case AgentKind::Gemini:
            args = {"-p", "--approval-mode", "yolo"};
            break;
    }
    args.insert(args.end(), passthrough.begin(), passthrough.end());
    return args;
}

std::optional<std::string> find_in_path(const std::string& name) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        if (is_executable(name)) return name;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return std::nullopt;

    std::string_view paths = path_env;
    size_t start = 0;
    while (start <= paths.size()) {
        size_t colon = paths.find(':', start);
        auto dir = paths.substr(start, colon == std::string_view::npos ? std::string_view::npos
                                                                       : colon - start);
        if (!dir.empty()) {
            std::string full = std::format("{}/{}", dir, name);
            if (is_executable(full)) return full;
        }
        if (colon == std::string_view::npos) break;
        start = colon + 1;
    }
    return std::nullopt;
}

std::expected<std::string, SupervisorError>
resolve_agent_executable(AgentKind agent, const Config& config) {
    const char* env_var = override_env_var(agent);
    if (const char* override_path = std::getenv(env_var); override_path && *override_path) {
        if (auto found = find_in_path(override_path)) return *found;
        return std::unexpected(SupervisorError{
            SupervisorError::Kind::CliNotFound,
            std::format("{}={} is not an executable file", env_var, override_path)});
    }

    auto name = binary_name(agent, config);
    if (auto found = find_in_path(name)) return *found;

    return std::unexpected(SupervisorError{
        SupervisorError::Kind::CliNotFound,
        std::format("'{}' not found in PATH. Install the {} CLI, or set {} to its full path",
                    name, display_name(agent), env_var)});
}
