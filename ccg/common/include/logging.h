/*
 * File:        logging.h
 * Module:      ccg-common
 * Purpose:     Shared application logging header
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace ccg {

/// Default pattern used by every sink
inline constexpr const char* kDefaultLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

/// Get the application logger (created on first use)
std::shared_ptr<spdlog::logger> get_app_logger();

/// Reset the application logger (it will be recreated on next use)
void reset_logging();

/// Initialize application logging
/// @param level Log level (trace, debug, info, warn, error, critical, off)
/// @param pattern spdlog pattern string
/// @param log_file Optional file path to write logs to (in addition to console)
/// @param logger_name Name shown in the [%n] field
void init_app_logging(const std::string& level = "info",
                      const std::string& pattern = kDefaultLogPattern,
                      const std::string& log_file = "",
                      const std::string& logger_name = "ccg");

/// Parse a textual level, falling back to info for unknown names
spdlog::level::level_enum parse_log_level(const std::string& level);

} // namespace ccg

// Application-wide logging macros that use the app logger
#define CCG_LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(ccg::get_app_logger(), __VA_ARGS__)
#define CCG_LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(ccg::get_app_logger(), __VA_ARGS__)
#define CCG_LOG_INFO(...)     SPDLOG_LOGGER_INFO(ccg::get_app_logger(), __VA_ARGS__)
#define CCG_LOG_WARN(...)     SPDLOG_LOGGER_WARN(ccg::get_app_logger(), __VA_ARGS__)
#define CCG_LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(ccg::get_app_logger(), __VA_ARGS__)
#define CCG_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(ccg::get_app_logger(), __VA_ARGS__)
