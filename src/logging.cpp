/*
 * File:        logging.cpp
 * Module:      odins-eye
 * Purpose:     Logging system implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "logging.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <vector>

namespace odins_eye {

static const char* LOGGER_NAME = "odins-eye";

static std::shared_ptr<spdlog::logger> g_logger;

bool parse_log_level(const std::string& name, spdlog::level::level_enum& level) {
    if (name == "trace") {
        level = spdlog::level::trace;
    } else if (name == "debug") {
        level = spdlog::level::debug;
    } else if (name == "info") {
        level = spdlog::level::info;
    } else if (name == "warn" || name == "warning") {
        level = spdlog::level::warn;
    } else if (name == "error") {
        level = spdlog::level::err;
    } else if (name == "critical") {
        level = spdlog::level::critical;
    } else if (name == "off") {
        level = spdlog::level::off;
    } else {
        return false;
    }
    return true;
}

void init_logging(const std::string& level, const std::string& pattern, const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;

    // Console output goes to stderr so stdout stays clean for coordinates
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);
    sinks.push_back(console_sink);

    if (!log_file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    }

    // Re-initialisation replaces the registered logger
    if (g_logger) {
        spdlog::drop(LOGGER_NAME);
    }

    g_logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    g_logger->set_pattern(pattern);
    g_logger->set_level(spdlog::level::trace);
    g_logger->flush_on(spdlog::level::trace);
    spdlog::register_logger(g_logger);

    set_log_level(level);
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (!g_logger) {
        // Auto-initialize if not done yet
        init_logging();
    }
    return g_logger;
}

void set_log_level(const std::string& level) {
    auto logger = get_logger();

    spdlog::level::level_enum parsed = spdlog::level::info;
    if (!parse_log_level(level, parsed)) {
        logger->warn("Unknown log level '{}', using 'info'", level);
    }
    logger->set_level(parsed);
}

} // namespace odins_eye
