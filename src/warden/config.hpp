#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

struct Config {
    struct Agents {
        std::string claude = "claude";
        std::string codex = "codex";
        std::string gemini = "gemini";
    } agents;

    struct Registry {
        size_t shared_memory_bytes = 16 * 1024 * 1024;
        uint32_t max_record_age_hours = 12;

        std::chrono::hours max_record_age() const {
            return std::chrono::hours(max_record_age_hours);
        }
    } registry;

    struct Wait {
        uint32_t interval_seconds = 30;
        uint32_t max_hours = 24;
    } wait;

    struct Output {
        size_t tail_lines = 50;
    } output;

    struct History {
        bool enabled = true;
    } history;

    bool debug = false;

    static Config load(const std::string& path);
    static Config load_default();

    // AGENT_WARDEN_WAIT_INTERVAL_SEC, AGENT_WARDEN_DEBUG
    void apply_env();
};

inline constexpr const char* kWaitIntervalEnv = "AGENT_WARDEN_WAIT_INTERVAL_SEC";
inline constexpr const char* kDebugEnv = "AGENT_WARDEN_DEBUG";
