#pragma once

#include "errors.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <vector>

class ProcessInspector;

struct ProcessTreeInfo {
    // The queried pid first, then its ancestors up to the stopping point.
    std::vector<int> process_chain;
    std::optional<int> root_parent_pid;
    size_t depth = 0;

    static std::expected<ProcessTreeInfo, ProcessTreeError> current();
};

inline constexpr size_t kMaxAncestryHops = 50;

// Walks parent links from pid. Stops at a self-loop, at parent 0, at a root
// pid (which is kept in the chain) or after kMaxAncestryHops. A parent that
// cannot be read ends the chain where it is.
std::expected<ProcessTreeInfo, ProcessTreeError>
    get_process_tree(int pid, const ProcessInspector& inspector);

std::expected<ProcessTreeInfo, ProcessTreeError> get_process_tree(int pid);

// True for process names of the supported agent CLIs.
bool is_agent_process_name(const std::string& name);

// Agent behind a node command line ("claude", "codex" or "gemini"),
// else "node".
std::string classify_node_command_line(const std::string& cmdline);

// "claude", "codex" or "gemini" for an agent CLI process, "node" for any
// other Node.js process (npm-installed agents run as node), nullopt for
// everything else. cmdline is only consulted for node.
std::optional<std::string> agent_cli_type(const std::string& name,
                                          const std::optional<std::string>& cmdline);

// Nearest ancestor of pid (excluding pid itself) for which agent_cli_type
// is set, falling back to the chain's root.
std::expected<int, ProcessTreeError>
    find_agent_root_parent(int pid, const ProcessInspector& inspector);

// find_agent_root_parent for this process, computed once per process.
std::expected<int, ProcessTreeError> get_root_parent_pid_cached();
