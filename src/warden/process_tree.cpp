#include "process_tree.hpp"

#include "log.hpp"
#include "platform/process_inspector.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <mutex>

std::expected<ProcessTreeInfo, ProcessTreeError> ProcessTreeInfo::current() {
    return get_process_tree(platform::current_pid());
}

std::expected<ProcessTreeInfo, ProcessTreeError>
get_process_tree(int pid, const ProcessInspector& inspector) {
    if (pid <= 0) {
        return std::unexpected(ProcessTreeError{ProcessTreeError::Kind::ProcessNotFound,
                                                std::format("invalid pid {}", pid)});
    }

    ProcessTreeInfo info;
    info.process_chain.push_back(pid);

    int current = pid;
    for (size_t hop = 0; hop < kMaxAncestryHops; ++hop) {
        auto parent = inspector.parent_pid(current);
        if (!parent) break;
        if (*parent == current || *parent == 0) break;

        info.process_chain.push_back(*parent);
        if (inspector.is_root_pid(*parent)) break;
        current = *parent;
    }

    info.depth = info.process_chain.size();
    info.root_parent_pid = info.process_chain.size() > 1 ? info.process_chain.back() : pid;
    return info;
}

std::expected<ProcessTreeInfo, ProcessTreeError> get_process_tree(int pid) {
    auto inspector = platform::make_process_inspector();
    return get_process_tree(pid, *inspector);
}

namespace {

std::string to_lower(std::string s) {
    std::ranges::transform(s, s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<std::string> agent_from_name(const std::string& lower) {
    if (lower.contains("claude") && !lower.contains("claude-desktop")) return "claude";
    if (lower.contains("codex")) return "codex";
    if (lower.contains("gemini")) return "gemini";
    return std::nullopt;
}

} // namespace

bool is_agent_process_name(const std::string& name) {
    return agent_from_name(to_lower(name)).has_value();
}

std::string classify_node_command_line(const std::string& cmdline) {
    auto lower = to_lower(cmdline);

    // Package names first, then launcher forms that only name the agent.
    if (lower.contains("claude-cli") || lower.contains("claude-code")) return "claude";
    if (lower.contains("codex-cli")) return "codex";
    if (lower.contains("gemini-cli") || lower.contains("@google/generative-ai-cli")) return "gemini";

    if (lower.contains("npm exec") || lower.contains("npx")) {
        if (lower.contains("@anthropic-ai/claude")) return "claude";
        if (lower.contains("codex")) return "codex";
        if (lower.contains("gemini")) return "gemini";
    }
    return "node";
}

std::optional<std::string> agent_cli_type(const std::string& name,
                                          const std::optional<std::string>& cmdline) {
    auto lower = to_lower(name);
    if (auto agent = agent_from_name(lower)) return agent;
    if (lower == "node") return classify_node_command_line(cmdline.value_or(""));
    return std::nullopt;
}

std::expected<int, ProcessTreeError>
find_agent_root_parent(int pid, const ProcessInspector& inspector) {
    auto tree = get_process_tree(pid, inspector);
    if (!tree) return std::unexpected(tree.error());

    const auto& chain = tree->process_chain;
    for (size_t i = 1; i < chain.size(); ++i) {
        auto name = inspector.process_name(chain[i]);
        if (!name) continue;
        if (auto type = agent_cli_type(*name, inspector.command_line(chain[i]))) {
            logging::debug(std::format("process tree: anchoring on {} (pid {}, {})",
                                       *name, chain[i], *type));
            return chain[i];
        }
    }

    return tree->root_parent_pid.value_or(pid);
}

std::expected<int, ProcessTreeError> get_root_parent_pid_cached() {
    static std::once_flag once;
    static std::expected<int, ProcessTreeError> cached = 0;

    std::call_once(once, [] {
        auto inspector = platform::make_process_inspector();
        cached = find_agent_root_parent(platform::current_pid(), *inspector);
    });
    return cached;
}
