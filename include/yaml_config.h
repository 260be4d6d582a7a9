/*
 * File:        yaml_config.h
 * Module:      odins-eye
 * Purpose:     YAML settings file parser interface
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#ifndef ODINS_EYE_YAML_CONFIG_H
#define ODINS_EYE_YAML_CONFIG_H

#include "coordinate.h"
#include <string>
#include <cstdint>

namespace odins_eye {

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";  // trace, debug, info, warn, error, critical, off
    std::string file;            // Optional log file (empty = console only)
};

/**
 * @brief Codec configuration
 */
struct CodecConfig {
    int32_t start_mask = DEFAULT_START_MASK;  // Start position for encode
};

/**
 * @brief Complete settings file
 */
struct OdinsEyeConfig {
    LoggingConfig logging;
    CodecConfig codec;
};

/**
 * @brief Parse YAML settings from file
 *
 * Missing sections and keys keep their defaults.
 *
 * @param filename Path to YAML file
 * @param config Output configuration object
 * @param error_message Error description on failure
 * @return true on success, false on error
 */
bool parse_yaml_config(const std::string& filename, OdinsEyeConfig& config,
                       std::string& error_message);

/**
 * @brief Parse YAML settings from a string
 */
bool parse_yaml_config_text(const std::string& text, OdinsEyeConfig& config,
                            std::string& error_message);

/**
 * @brief Validate settings
 *
 * @param config Configuration to validate
 * @return true if valid, false otherwise
 */
bool validate_yaml_config(const OdinsEyeConfig& config, std::string& error_message);

} // namespace odins_eye

#endif // ODINS_EYE_YAML_CONFIG_H
