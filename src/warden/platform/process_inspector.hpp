#pragma once

#include <memory>
#include <optional>
#include <string>

// Per-OS view of the process table used for ancestry walks.
class ProcessInspector {
public:
    virtual ~ProcessInspector() = default;

    virtual std::optional<int> parent_pid(int pid) const = 0;
    virtual std::optional<std::string> process_name(int pid) const = 0;

    // Arguments joined by single spaces.
    virtual std::optional<std::string> command_line(int pid) const = 0;

    // Pids at which an ancestry walk stops (init/launchd, kernel threads).
    virtual bool is_root_pid(int pid) const = 0;
};

namespace platform {

// The backend compiled for this OS.
std::unique_ptr<ProcessInspector> make_process_inspector();

int current_pid();

} // namespace platform
