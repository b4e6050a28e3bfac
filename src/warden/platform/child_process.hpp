#pragma once

#include "errors.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Owned file descriptor, closed on destruction.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }
    void reset();

private:
    int fd_ = -1;
};

struct SpawnSpec {
    std::string executable;               // absolute path
    std::vector<std::string> args;        // without argv[0]
    std::vector<std::pair<std::string, std::string>> set_env;
    std::vector<std::string> unset_env;
    std::optional<std::string> cwd;
};

// Child with stdin inherited and stdout/stderr piped back.
struct ChildProcess {
    int pid = -1;
    UniqueFd stdout_pipe;
    UniqueFd stderr_pipe;
};

struct ExitStatus {
    bool success = false;
    std::optional<int> code;    // nullopt when killed by a signal
    std::optional<int> signal;
};

namespace platform {

// The child gets its own process group and dies with us on Linux.
// Exec failures are reported here rather than as a child exit code.
std::expected<ChildProcess, SupervisorError> spawn_child(const SpawnSpec& spec);

std::expected<ExitStatus, SupervisorError> wait_child(int pid);

// Bytes read into buf, 0 at end of stream.
std::expected<size_t, SupervisorError> read_some(int fd, char* buf, size_t len);

// Writes all of data to fd (1 or 2 for the console).
std::expected<void, SupervisorError> write_all(int fd, const char* data, size_t len);

bool is_terminal(int fd);

} // namespace platform
