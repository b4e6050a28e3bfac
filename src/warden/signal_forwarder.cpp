#include "signal_forwarder.hpp"

#include "log.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <mutex>
#include <signal.h>

namespace {

std::atomic<int> g_target{0};

void forward_signal(int) {
    int saved_errno = errno;
    int pid = g_target.load();
    if (pid > 0) {
        ::kill(pid, SIGTERM);
    }
    errno = saved_errno;
}

} // namespace

namespace signal_forwarder {

void install() {
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction sa{};
        sa.sa_handler = forward_signal;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = SA_RESTART;

        for (int sig : {SIGINT, SIGTERM}) {
            if (::sigaction(sig, &sa, nullptr) != 0) {
                logging::warn(std::format("signal: cannot install handler for {}: {}",
                                          sig, std::strerror(errno)));
            }
        }
    });
}

int target() {
    return g_target.load();
}

} // namespace signal_forwarder

SignalGuard::SignalGuard(int pid) {
    signal_forwarder::install();
    g_target.store(pid);
}

SignalGuard::~SignalGuard() {
    g_target.store(0);
}
