#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"

namespace sd {

inline spdlog::level::level_enum parse_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

inline void init_logger(const LoggingConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink (always)
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    sinks.push_back(console_sink);

    // File sink (optional)
    if (!cfg.file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            cfg.file,
            static_cast<size_t>(cfg.max_file_size_mb) * 1024 * 1024,
            static_cast<size_t>(cfg.max_files)
        );
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("serve-dir", sinks.begin(), sinks.end());
    logger->set_level(parse_level(cfg.level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

// Access log: one line per request, message text only. Not registered globally;
// the caller owns it and hands it to the dispatcher.
inline std::shared_ptr<spdlog::logger> make_access_logger(const AccessLogConfig& cfg) {
    spdlog::sink_ptr sink;
    if (!cfg.file.empty()) {
        sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            cfg.file,
            static_cast<size_t>(cfg.max_file_size_mb) * 1024 * 1024,
            static_cast<size_t>(cfg.max_files)
        );
    } else {
        sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    }
    sink->set_pattern("%v");

    auto logger = std::make_shared<spdlog::logger>("access", sink);
    logger->set_level(cfg.enabled ? spdlog::level::info : spdlog::level::off);
    logger->flush_on(spdlog::level::info);
    return logger;
}

} // namespace sd
