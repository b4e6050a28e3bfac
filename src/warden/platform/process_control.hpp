#pragma once

namespace platform {

// kill(pid, 0); a process we may not signal still counts as alive.
bool process_alive(int pid);

// SIGTERM, then SIGKILL if the process is still around after 500ms.
void terminate_process(int pid);

// Called in the forked child before exec: own process group, and on Linux
// die with the supervisor. Async-signal-safe; returns false on failure.
bool prepare_child_process();

} // namespace platform
