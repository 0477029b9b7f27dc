#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace lore {
namespace log {

inline constexpr const char* kLoggerName = "lore";

/**
 * @brief Shared library logger
 *
 * Reuses a logger named "lore" if the host application registered one,
 * otherwise creates a colored stderr logger on first use.
 */
inline std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
        auto created = std::make_shared<spdlog::logger>(
            kLoggerName, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        spdlog::register_logger(created);
        return created;
    }();
    return instance;
}

inline void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

/// Accepts spdlog level names ("trace", "debug", "info", "warn", "error", "off").
inline void set_level(const std::string& name) {
    logger()->set_level(spdlog::level::from_str(name));
}

} // namespace log
} // namespace lore
