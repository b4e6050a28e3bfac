#include "log.hpp"

#include <atomic>
#include <print>

namespace logging {

namespace {
std::atomic<bool> g_debug{false};
}

void set_debug(bool enabled) {
    g_debug.store(enabled, std::memory_order_relaxed);
}

bool debug_enabled() {
    return g_debug.load(std::memory_order_relaxed);
}

void debug(const std::string& msg) {
    if (debug_enabled()) {
        std::println(stderr, "[agent-warden] {}", msg);
    }
}

void warn(const std::string& msg) {
    std::println(stderr, "[agent-warden] warning: {}", msg);
}

void error(const std::string& msg) {
    std::println(stderr, "[agent-warden] error: {}", msg);
}

} // namespace logging
