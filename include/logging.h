/*
 * File:        logging.h
 * Module:      odins-eye
 * Purpose:     Logging system interface
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

namespace odins_eye {

/// Initialize the logging system
/// Should be called once at application startup; calling it again replaces the sinks
/// @param level Log level (trace, debug, info, warn, error, critical, off)
/// @param pattern Optional custom pattern (default: "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v")
/// @param log_file Optional file path to write logs to (in addition to console)
void init_logging(const std::string& level = "info",
                  const std::string& pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v",
                  const std::string& log_file = "");

/// Get the default logger
std::shared_ptr<spdlog::logger> get_logger();

/// Set log level at runtime
void set_log_level(const std::string& level);

/// Translate a level name; returns false for an unknown name
bool parse_log_level(const std::string& name, spdlog::level::level_enum& level);

} // namespace odins_eye

// Convenient logging macros
#define ODINS_EYE_LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(odins_eye::get_logger(), __VA_ARGS__)
#define ODINS_EYE_LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(odins_eye::get_logger(), __VA_ARGS__)
#define ODINS_EYE_LOG_INFO(...)     SPDLOG_LOGGER_INFO(odins_eye::get_logger(), __VA_ARGS__)
#define ODINS_EYE_LOG_WARN(...)     SPDLOG_LOGGER_WARN(odins_eye::get_logger(), __VA_ARGS__)
#define ODINS_EYE_LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(odins_eye::get_logger(), __VA_ARGS__)
#define ODINS_EYE_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(odins_eye::get_logger(), __VA_ARGS__)
