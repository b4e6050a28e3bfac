#pragma once

#include "platform/process_inspector.hpp"

#include <optional>
#include <string>

class ProcfsInspector : public ProcessInspector {
public:
    ProcfsInspector() = default;
    // Alternate procfs mount, used by tests.
    explicit ProcfsInspector(std::string proc_root);

    std::optional<int> parent_pid(int pid) const override;
    std::optional<std::string> process_name(int pid) const override;
    std::optional<std::string> command_line(int pid) const override;
    bool is_root_pid(int pid) const override;

private:
    std::string proc_root_ = "/proc";
};
