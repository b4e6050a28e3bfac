#pragma once

// Process-wide forwarding of SIGINT/SIGTERM to the supervised child.
// Only one target is tracked; supervision within a process is sequential.
namespace signal_forwarder {

// Installs the handlers once per process.
void install();

// Pid the handlers forward to, or 0 for none.
int target();

} // namespace signal_forwarder

// Points the forwarder at pid for its lifetime, then clears it.
class SignalGuard {
public:
    explicit SignalGuard(int pid);
    ~SignalGuard();

    SignalGuard(const SignalGuard&) = delete;
    SignalGuard& operator=(const SignalGuard&) = delete;
};
