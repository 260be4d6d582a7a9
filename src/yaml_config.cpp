/*
 * File:        yaml_config.cpp
 * Module:      odins-eye
 * Purpose:     YAML settings file parser implementation using yaml-cpp
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "yaml_config.h"
#include "logging.h"
#include <yaml-cpp/yaml.h>

namespace odins_eye {

static void apply_yaml_node(const YAML::Node& root, OdinsEyeConfig& config) {
    if (root["logging"]) {
        YAML::Node logging = root["logging"];
        if (logging["level"]) {
            config.logging.level = logging["level"].as<std::string>();
        }
        if (logging["file"]) {
            config.logging.file = logging["file"].as<std::string>();
        }
    }

    if (root["codec"]) {
        YAML::Node codec = root["codec"];
        if (codec["start_mask"]) {
            config.codec.start_mask = codec["start_mask"].as<int32_t>();
        }
    }
}

bool parse_yaml_config(const std::string& filename, OdinsEyeConfig& config,
                       std::string& error_message) {
    try {
        YAML::Node root = YAML::LoadFile(filename);
        apply_yaml_node(root, config);
        return true;

    } catch (const YAML::Exception& e) {
        error_message = std::string("YAML parsing error: ") + e.what();
        return false;
    } catch (const std::exception& e) {
        error_message = std::string("Error: ") + e.what();
        return false;
    }
}

bool parse_yaml_config_text(const std::string& text, OdinsEyeConfig& config,
                            std::string& error_message) {
    try {
        YAML::Node root = YAML::Load(text);
        apply_yaml_node(root, config);
        return true;

    } catch (const YAML::Exception& e) {
        error_message = std::string("YAML parsing error: ") + e.what();
        return false;
    } catch (const std::exception& e) {
        error_message = std::string("Error: ") + e.what();
        return false;
    }
}

bool validate_yaml_config(const OdinsEyeConfig& config, std::string& error_message) {
    spdlog::level::level_enum level;
    if (!parse_log_level(config.logging.level, level)) {
        error_message = "Invalid log level: " + config.logging.level;
        return false;
    }

    if (!is_position_in_range(config.codec.start_mask)) {
        error_message = "Start mask " + std::to_string(config.codec.start_mask) +
                        " must be between " + std::to_string(POSITION_LOW) +
                        " and " + std::to_string(POSITION_HIGH);
        return false;
    }

    return true;
}

} // namespace odins_eye
