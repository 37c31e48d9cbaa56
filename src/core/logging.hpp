#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>

// ---------------------------------------------------------------------------
// analysis_log — shared "analysis" logger for library diagnostics.
// Writes to stderr so tool progress output on stdout stays clean.
// ---------------------------------------------------------------------------
namespace analysis_log {

inline std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] {
        instance = spdlog::get("analysis");
        if (!instance) {
            instance = spdlog::stderr_color_mt("analysis");
            instance->set_pattern("[%Y-%m-%dT%H:%M:%S.%e] [%^%l%$] [%t] %v");
            instance->set_level(spdlog::level::info);
        }
    });
    return instance;
}

inline void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

// Accepts trace, debug, info, warn, error, critical, off.
inline void set_level(const std::string& name) {
    set_level(spdlog::level::from_str(name));
}

}  // namespace analysis_log
