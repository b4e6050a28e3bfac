#include "platform/macos/libproc_inspector.hpp"

#include <cstring>
#include <libproc.h>
#include <string>
#include <sys/proc_info.h>
#include <sys/sysctl.h>
#include <unistd.h>
#include <vector>

std::optional<int> LibprocInspector::parent_pid(int pid) const {
    if (pid <= 0) return std::nullopt;

    proc_bsdinfo info{};
    int n = proc_pidinfo(pid, PROC_PIDTBSDINFO, 0, &info, PROC_PIDTBSDINFO_SIZE);
    if (n != PROC_PIDTBSDINFO_SIZE) return std::nullopt;
    return static_cast<int>(info.pbi_ppid);
}

std::optional<std::string> LibprocInspector::process_name(int pid) const {
    if (pid <= 0) return std::nullopt;

    char name[2 * MAXCOMLEN + 1] = {};
    if (proc_name(pid, name, sizeof(name)) <= 0) return std::nullopt;
    return std::string(name);
}

// KERN_PROCARGS2 layout: int argc, exec path, NUL padding, then argc
// NUL-terminated arguments followed by the environment.
std::optional<std::string> LibprocInspector::command_line(int pid) const {
    if (pid <= 0) return std::nullopt;

    int argmax = 0;
    size_t size = sizeof(argmax);
    int mib_argmax[] = {CTL_KERN, KERN_ARGMAX};
    if (sysctl(mib_argmax, 2, &argmax, &size, nullptr, 0) != 0 || argmax <= 0) {
        return std::nullopt;
    }

    std::vector<char> buf(static_cast<size_t>(argmax));
    size = buf.size();
    int mib[] = {CTL_KERN, KERN_PROCARGS2, pid};
    if (sysctl(mib, 3, buf.data(), &size, nullptr, 0) != 0) return std::nullopt;
    if (size < sizeof(int)) return std::nullopt;

    int argc = 0;
    std::memcpy(&argc, buf.data(), sizeof(argc));

    size_t pos = sizeof(argc);
    while (pos < size && buf[pos] != '\0') ++pos;   // exec path
    while (pos < size && buf[pos] == '\0') ++pos;   // padding

    std::string cmdline;
    for (int i = 0; i < argc && pos < size; ++i) {
        std::string arg(buf.data() + pos);
        pos += arg.size() + 1;
        if (!cmdline.empty()) cmdline += ' ';
        cmdline += arg;
    }
    if (cmdline.empty()) return std::nullopt;
    return cmdline;
}

bool LibprocInspector::is_root_pid(int pid) const {
    // launchd
    return pid == 0 || pid == 1;
}

namespace platform {

std::unique_ptr<ProcessInspector> make_process_inspector() {
    return std::make_unique<LibprocInspector>();
}

int current_pid() {
    return static_cast<int>(::getpid());
}

} // namespace platform
