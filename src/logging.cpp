// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

#include "config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace sportslog {

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") {
        return spdlog::level::trace;
    }
    if (lower == "debug") {
        return spdlog::level::debug;
    }
    if (lower == "info") {
        return spdlog::level::info;
    }
    if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    if (lower == "error") {
        return spdlog::level::err;
    }
    if (lower == "critical") {
        return spdlog::level::critical;
    }
    if (lower == "off") {
        return spdlog::level::off;
    }
    return std::nullopt;
}

spdlog::level::level_enum get_log_level() {
    // Priority 1: Environment variable (highest)
    const char* env = std::getenv("SPORTSLOG_LOG_LEVEL");
    if (env != nullptr) {
        if (auto level = parse_log_level(env)) {
            return *level;
        }
        spdlog::warn("[Logging] Unknown SPORTSLOG_LOG_LEVEL value '{}', ignoring", env);
    }

    // Priority 2: Config file
    std::string configured = Config::get_instance()->get<std::string>("/log_level", "info");
    if (auto level = parse_log_level(configured)) {
        return *level;
    }
    spdlog::warn("[Logging] Unknown log_level '{}' in config, using info", configured);

    return spdlog::level::info;
}

void init_logging() {
    spdlog::level::level_enum level = get_log_level();
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(level);
    spdlog::debug("[Logging] Log level: {}", spdlog::level::to_string_view(level));
}

} // namespace sportslog
