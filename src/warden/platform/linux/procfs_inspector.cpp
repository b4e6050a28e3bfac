#include "platform/linux/procfs_inspector.hpp"

#include <format>
#include <fstream>
#include <sstream>
#include <unistd.h>

ProcfsInspector::ProcfsInspector(std::string proc_root)
    : proc_root_(std::move(proc_root)) {}

std::optional<int> ProcfsInspector::parent_pid(int pid) const {
    if (pid <= 0) return std::nullopt;

    std::ifstream f(std::format("{}/{}/stat", proc_root_, pid));
    if (!f.is_open()) return std::nullopt;

    std::string stat;
    std::getline(f, stat);

    // comm is parenthesised and may itself contain spaces or ')'.
    auto close = stat.rfind(')');
    if (close == std::string::npos) return std::nullopt;

    std::istringstream rest(stat.substr(close + 1));
    char state = 0;
    int ppid = -1;
    if (!(rest >> state >> ppid)) return std::nullopt;
    if (ppid < 0) return std::nullopt;
    return ppid;
}

std::optional<std::string> ProcfsInspector::process_name(int pid) const {
    if (pid <= 0) return std::nullopt;

    std::ifstream f(std::format("{}/{}/comm", proc_root_, pid));
    if (!f.is_open()) return std::nullopt;
    std::string comm;
    std::getline(f, comm);
    if (comm.empty()) return std::nullopt;
    return comm;
}

std::optional<std::string> ProcfsInspector::command_line(int pid) const {
    if (pid <= 0) return std::nullopt;

    std::ifstream f(std::format("{}/{}/cmdline", proc_root_, pid), std::ios::binary);
    if (!f.is_open()) return std::nullopt;

    // NUL-separated, usually with a trailing NUL.
    std::string cmdline, arg;
    while (std::getline(f, arg, '\0')) {
        if (!cmdline.empty()) cmdline += ' ';
        cmdline += arg;
    }
    if (cmdline.empty()) return std::nullopt;
    return cmdline;
}

bool ProcfsInspector::is_root_pid(int pid) const {
    return pid == 0 || pid == 1;
}

namespace platform {

std::unique_ptr<ProcessInspector> make_process_inspector() {
    return std::make_unique<ProcfsInspector>();
}

int current_pid() {
    return static_cast<int>(::getpid());
}

} // namespace platform
