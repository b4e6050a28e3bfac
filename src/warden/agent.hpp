#pragma once

#include "errors.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct Config;

enum class AgentKind { Claude, Codex, Gemini };

std::optional<AgentKind> parse_agent(std::string_view name);

const char* to_string(AgentKind agent);      // "claude"
const char* display_name(AgentKind agent);   // "Claude"
const char* override_env_var(AgentKind agent); // "CLAUDE_BIN"

// Configured binary name, "claude" unless the config says otherwise.
std::string binary_name(AgentKind agent, const Config& config);

// Arguments that run the agent non-interactively with full tool access,
// followed by passthrough.
std::vector<std::string> full_access_args(AgentKind agent,
                                          const std::vector<std::string>& passthrough);

// <AGENT>_BIN if set, else a PATH lookup of the configured binary name.
std::expected<std::string, SupervisorError>
    resolve_agent_executable(AgentKind agent, const Config& config);

// PATH lookup. Names containing '/' are checked as given.
std::optional<std::string> find_in_path(const std::string& name);
