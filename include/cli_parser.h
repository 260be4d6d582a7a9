/*
 * File:        cli_parser.h
 * Module:      odins-eye
 * Purpose:     Command-line argument parser interface
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#ifndef ODINS_EYE_CLI_PARSER_H
#define ODINS_EYE_CLI_PARSER_H

#include <string>
#include <optional>
#include <cstdint>

namespace odins_eye {

/**
 * @brief Command-line options for odins-eye
 */
struct CLIOptions {
    std::string command;  // "encode" or "decode"
    std::optional<std::string> input_filename;
    std::optional<std::string> output_filename;
    std::optional<std::string> coordinate;  // Coordinate file path or inline JSON
    std::optional<std::string> config_filename;
    std::optional<std::string> log_file;
    std::optional<int32_t> start_mask;
    std::optional<int64_t> length_bytes;

    // Explicit coordinate fields (decode)
    std::optional<int32_t> end_mask;
    std::optional<int32_t> prev_mask;
    std::optional<int32_t> end_d;

    bool verbose = false;
    bool show_help = false;
    bool show_version = false;
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument vector
 * @return Parsed options (show_help is set on any error)
 */
CLIOptions parse_arguments(int argc, char* argv[]);

/**
 * @brief Print usage information
 */
void print_usage(const char* program_name);

/**
 * @brief Print version information
 */
void print_version();

} // namespace odins_eye

#endif // ODINS_EYE_CLI_PARSER_H
