#include "platform/child_process.hpp"

#include "platform/process_control.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <string_view>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

SupervisorError io_error(const std::string& what, int err) {
    return SupervisorError{SupervisorError::Kind::Io,
                           std::format("{}: {}", what, std::strerror(err))};
}

bool make_pipe(int fds[2]) {
#if defined(__linux__)
    return ::pipe2(fds, O_CLOEXEC) == 0;
#else
    if (::pipe(fds) != 0) return false;
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

std::vector<std::string> build_environment(const SpawnSpec& spec) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry = *e;
        auto name = entry.substr(0, entry.find('='));

        bool drop = std::ranges::any_of(spec.unset_env, [&](const auto& n) { return n == name; }) ||
                    std::ranges::any_of(spec.set_env, [&](const auto& kv) { return kv.first == name; });
        if (!drop) env.emplace_back(entry);
    }
    for (const auto& [k, v] : spec.set_env) {
        env.push_back(k + "=" + v);
    }
    return env;
}

// Child side after fork: only async-signal-safe calls.
[[noreturn]] void exec_child(const SpawnSpec& spec, char* const argv[], char* const envp[],
                             int out_fd, int err_fd, int status_fd) {
    auto fail = [status_fd]() {
        int err = errno;
        [[maybe_unused]] auto n = ::write(status_fd, &err, sizeof(err));
        ::_exit(127);
    };

    if (!platform::prepare_child_process()) fail();
    if (::dup2(out_fd, STDOUT_FILENO) < 0) fail();
    if (::dup2(err_fd, STDERR_FILENO) < 0) fail();
    if (spec.cwd && ::chdir(spec.cwd->c_str()) != 0) fail();

    ::execve(spec.executable.c_str(), argv, envp);
    fail();
    ::_exit(127);
}

} // namespace

void UniqueFd::reset() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

namespace platform {

std::expected<ChildProcess, SupervisorError> spawn_child(const SpawnSpec& spec) {
    // Everything the child needs is built before fork.
    std::vector<std::string> args;
    args.push_back(spec.executable);
    args.insert(args.end(), spec.args.begin(), spec.args.end());
    auto env = build_environment(spec);

    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (auto& e : env) envp.push_back(e.data());
    envp.push_back(nullptr);

    int out[2], err[2], status[2];
    if (!make_pipe(out)) return std::unexpected(io_error("pipe() failed", errno));
    UniqueFd out_r(out[0]), out_w(out[1]);
    if (!make_pipe(err)) return std::unexpected(io_error("pipe() failed", errno));
    UniqueFd err_r(err[0]), err_w(err[1]);
    if (!make_pipe(status)) return std::unexpected(io_error("pipe() failed", errno));
    UniqueFd status_r(status[0]), status_w(status[1]);

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(io_error("fork() failed", errno));
    }

    if (pid == 0) {
        exec_child(spec, argv.data(), envp.data(), out_w.get(), err_w.get(), status_w.get());
    }

    out_w.reset();
    err_w.reset();
    status_w.reset();

    // EOF on the status pipe means exec succeeded (it is close-on-exec).
    int child_errno = 0;
    ssize_t n;
    while ((n = ::read(status_r.get(), &child_errno, sizeof(child_errno))) < 0 && errno == EINTR) {}
    if (n > 0) {
        int wstatus;
        while (::waitpid(pid, &wstatus, 0) < 0 && errno == EINTR) {}
        return std::unexpected(io_error(std::format("failed to start {}", spec.executable),
                                        child_errno));
    }

    return ChildProcess{pid, std::move(out_r), std::move(err_r)};
}

std::expected<ExitStatus, SupervisorError> wait_child(int pid) {
    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(io_error("waitpid() failed", errno));
    }

    ExitStatus result;
    if (WIFEXITED(status)) {
        result.code = WEXITSTATUS(status);
        result.success = *result.code == 0;
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }
    return result;
}

std::expected<size_t, SupervisorError> read_some(int fd, char* buf, size_t len) {
    while (true) {
        ssize_t n = ::read(fd, buf, len);
        if (n >= 0) return static_cast<size_t>(n);
        if (errno == EINTR) continue;
        return std::unexpected(io_error("read from child pipe failed", errno));
    }
}

std::expected<void, SupervisorError> write_all(int fd, const char* data, size_t len) {
    size_t total = 0;
    while (total < len) {
        ssize_t n = ::write(fd, data + total, len - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(io_error("console write failed", errno));
        }
        total += static_cast<size_t>(n);
    }
    return {};
}

bool is_terminal(int fd) {
    return ::isatty(fd) == 1;
}

} // namespace platform
