#include "platform/process_control.hpp"

#include "log.hpp"

#include <cerrno>
#include <chrono>
#include <format>
#include <signal.h>
#include <thread>
#include <unistd.h>

#if defined(__linux__)
#include <sys/prctl.h>
#endif

namespace platform {

bool process_alive(int pid) {
    if (pid <= 0) return false;
    if (::kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

void terminate_process(int pid) {
    if (!process_alive(pid)) return;

    if (::kill(pid, SIGTERM) == 0) {
        // Poll rather than sleep the whole grace period.
        for (int i = 0; i < 10; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            if (!process_alive(pid)) return;
        }
    }

    if (::kill(pid, SIGKILL) == 0) {
        logging::debug(std::format("pid={} sent SIGKILL", pid));
    }
}

bool prepare_child_process() {
    if (::setpgid(0, 0) != 0) return false;
#if defined(__linux__)
    if (::prctl(PR_SET_PDEATHSIG, SIGTERM) != 0) return false;
#endif
    return true;
}

} // namespace platform
