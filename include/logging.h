// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <optional>
#include <string_view>

namespace sportslog {

/**
 * @brief Parse a log level name ("trace", "debug", "info", "warn", "error",
 *        "critical", "off"; "warning" is accepted too)
 */
std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

/**
 * @brief Determine the configured log level
 *
 * Checks in order:
 * 1. SPORTSLOG_LOG_LEVEL env var
 * 2. Config file log_level
 * 3. Returns info as default
 */
spdlog::level::level_enum get_log_level();

/**
 * @brief Configure spdlog's default logger from get_log_level()
 *
 * Call after Config::init().
 */
void init_logging();

} // namespace sportslog
