#include "task_log.hpp"

#include "log.hpp"
#include "platform/platform_paths.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <random>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

SupervisorError io_error(const std::string& what) {
    return SupervisorError{SupervisorError::Kind::Io,
                           std::format("{}: {}", what, std::strerror(errno))};
}

} // namespace

TaskLog::TaskLog(std::string path, FILE* file) : path_(std::move(path)), file_(file) {}

TaskLog::~TaskLog() {
    if (file_) std::fclose(file_);
}

std::expected<std::unique_ptr<TaskLog>, SupervisorError> TaskLog::create(const std::string& path) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) return std::unexpected(io_error("cannot create log file " + path));

    FILE* f = ::fdopen(fd, "w");
    if (!f) {
        auto err = io_error("cannot open log file " + path);
        ::close(fd);
        return std::unexpected(err);
    }
    return std::unique_ptr<TaskLog>(new TaskLog(path, f));
}

std::expected<void, SupervisorError> TaskLog::write(std::string_view chunk) {
    std::lock_guard lock(mutex_);
    if (std::fwrite(chunk.data(), 1, chunk.size(), file_) != chunk.size() ||
        std::fflush(file_) != 0) {
        return std::unexpected(io_error("write to " + path_ + " failed"));
    }
    return {};
}

std::expected<void, SupervisorError> TaskLog::sync() {
    std::lock_guard lock(mutex_);
    if (std::fflush(file_) != 0) {
        return std::unexpected(io_error("flush of " + path_ + " failed"));
    }
    if (::fsync(::fileno(file_)) != 0) {
        return std::unexpected(io_error("fsync of " + path_ + " failed"));
    }
    return {};
}

std::expected<std::string, SupervisorError> generate_log_path(int pid) {
    return generate_log_path(pid, platform::log_dir());
}

std::expected<std::string, SupervisorError>
generate_log_path(int pid, const std::string& log_dir) {
    std::error_code ec;
    fs::create_directories(log_dir, ec);
    if (ec) {
        return std::unexpected(SupervisorError{
            SupervisorError::Kind::Io,
            std::format("cannot create log directory {}: {}", log_dir, ec.message())});
    }
    fs::permissions(log_dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        logging::warn(std::format("supervisor: cannot restrict {}: {}", log_dir, ec.message()));
    }

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    static thread_local std::mt19937 rng{std::random_device{}()};
    uint32_t suffix = rng();

    return (fs::path(log_dir) / std::format("{}-{}-{:08x}.log", pid, millis, suffix)).string();
}
