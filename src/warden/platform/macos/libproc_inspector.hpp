#pragma once

#include "platform/process_inspector.hpp"

class LibprocInspector : public ProcessInspector {
public:
    std::optional<int> parent_pid(int pid) const override;
    std::optional<std::string> process_name(int pid) const override;
    std::optional<std::string> command_line(int pid) const override;
    bool is_root_pid(int pid) const override;
};
