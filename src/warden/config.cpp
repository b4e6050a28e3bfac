#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>
#include <string_view>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("agents")) {
            auto& a = j["agents"];
            if (a.contains("claude")) cfg.agents.claude = a["claude"].get<std::string>();
            if (a.contains("codex")) cfg.agents.codex = a["codex"].get<std::string>();
            if (a.contains("gemini")) cfg.agents.gemini = a["gemini"].get<std::string>();
        }

        if (j.contains("registry")) {
            auto& r = j["registry"];
            if (r.contains("shared_memory_bytes"))
                cfg.registry.shared_memory_bytes = r["shared_memory_bytes"].get<size_t>();
            if (r.contains("max_record_age_hours"))
                cfg.registry.max_record_age_hours = r["max_record_age_hours"].get<uint32_t>();
        }

        if (j.contains("wait")) {
            auto& w = j["wait"];
            if (w.contains("interval_seconds")) {
                auto secs = w["interval_seconds"].get<uint32_t>();
                // Zero would make wait mode spin.
                if (secs > 0) cfg.wait.interval_seconds = secs;
                else std::println(stderr, "config: ignoring wait.interval_seconds = 0");
            }
            if (w.contains("max_hours")) cfg.wait.max_hours = w["max_hours"].get<uint32_t>();
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            if (o.contains("tail_lines")) cfg.output.tail_lines = o["tail_lines"].get<size_t>();
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("enabled")) cfg.history.enabled = h["enabled"].get<bool>();
        }

        if (j.contains("debug")) {
            cfg.debug = j["debug"].get<bool>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

void Config::apply_env() {
    if (const char* interval = std::getenv(kWaitIntervalEnv)) {
        char* end = nullptr;
        unsigned long secs = std::strtoul(interval, &end, 10);
        if (end != interval && *end == '\0' && secs > 0) {
            wait.interval_seconds = static_cast<uint32_t>(secs);
        } else {
            std::println(stderr, "config: ignoring invalid {}={}", kWaitIntervalEnv, interval);
        }
    }

    if (const char* dbg = std::getenv(kDebugEnv)) {
        std::string_view v = dbg;
        debug = (v == "1" || v == "true" || v == "TRUE" || v == "yes");
    }
}
