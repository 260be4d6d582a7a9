/*
 * File:        cli_parser.cpp
 * Module:      odins-eye
 * Purpose:     Command-line argument parser implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "cli_parser.h"
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

namespace odins_eye {

void print_version() {
    std::cout << "odins-eye version 0.1.0\n";
    std::cout << "Base-64 oscillator coordinate codec\n";
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " COMMAND [OPTIONS]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  encode                  Encode a file to a coordinate\n";
    std::cout << "  decode                  Recover a file from a coordinate\n";
    std::cout << "\n";
    std::cout << "Encode options:\n";
    std::cout << "  -i, --input FILE        Input file (required)\n";
    std::cout << "  -s, --start N           Start mask, 10000-99999 (default: 50000)\n";
    std::cout << "  -o, --output FILE       Write the coordinate to FILE\n";
    std::cout << "\n";
    std::cout << "Decode options:\n";
    std::cout << "  -c, --coord COORD       Coordinate file or inline JSON\n";
    std::cout << "  --start N --end N --prev N --d N --len N\n";
    std::cout << "                          Explicit coordinate fields (not with --coord)\n";
    std::cout << "  -l, --len N             Expected length in bytes (default: from coordinate)\n";
    std::cout << "  -o, --output FILE       Output filename (required)\n";
    std::cout << "\n";
    std::cout << "Common options:\n";
    std::cout << "  --config FILE           YAML settings file\n";
    std::cout << "  --log-file FILE         Also write log messages to FILE\n";
    std::cout << "  -v, --verbose           Enable verbose output\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  --version               Show version information\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " encode -i notes.txt -o notes.coord.json\n";
    std::cout << "  " << program_name << " decode -c notes.coord.json -o recovered.txt\n";
    std::cout << "  " << program_name << " decode --start 50000 --end 50010 --prev 50010 --d 0 --len 1 -o out.bin\n";
}

// Fetch the value following an option, flagging an error if it is missing
static bool take_value(int argc, char* argv[], int& i, const std::string& arg, std::string& value,
                       CLIOptions& options) {
    if (i + 1 < argc) {
        value = argv[++i];
        return true;
    }
    std::cerr << "Error: " << arg << " requires an argument\n";
    options.show_help = true;
    return false;
}

static bool take_integer(int argc, char* argv[], int& i, const std::string& arg, int64_t& value,
                         CLIOptions& options) {
    std::string text;
    if (!take_value(argc, argv, i, arg, text, options)) return false;

    try {
        size_t consumed = 0;
        value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: invalid number '" << text << "' for " << arg << "\n";
        options.show_help = true;
        return false;
    }
}

static bool take_int32(int argc, char* argv[], int& i, const std::string& arg, std::optional<int32_t>& value,
                       CLIOptions& options) {
    int64_t wide = 0;
    if (!take_integer(argc, argv, i, arg, wide, options)) return false;

    if (wide < INT32_MIN || wide > INT32_MAX) {
        std::cerr << "Error: value " << wide << " for " << arg << " is out of range\n";
        options.show_help = true;
        return false;
    }
    value = static_cast<int32_t>(wide);
    return true;
}

CLIOptions parse_arguments(int argc, char* argv[]) {
    CLIOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;

        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (arg == "--version") {
            options.show_version = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "encode" || arg == "decode" || arg == "recover") {
            if (!options.command.empty()) {
                std::cerr << "Error: only one command may be given\n";
                options.show_help = true;
            }
            options.command = (arg == "recover") ? "decode" : arg;
        } else if (arg == "-i" || arg == "--input") {
            if (take_value(argc, argv, i, arg, value, options)) options.input_filename = value;
        } else if (arg == "-o" || arg == "--output") {
            if (take_value(argc, argv, i, arg, value, options)) options.output_filename = value;
        } else if (arg == "-c" || arg == "--coord") {
            if (take_value(argc, argv, i, arg, value, options)) options.coordinate = value;
        } else if (arg == "--config") {
            if (take_value(argc, argv, i, arg, value, options)) options.config_filename = value;
        } else if (arg == "--log-file") {
            if (take_value(argc, argv, i, arg, value, options)) options.log_file = value;
        } else if (arg == "-s" || arg == "--start") {
            take_int32(argc, argv, i, arg, options.start_mask, options);
        } else if (arg == "--end") {
            take_int32(argc, argv, i, arg, options.end_mask, options);
        } else if (arg == "--prev") {
            take_int32(argc, argv, i, arg, options.prev_mask, options);
        } else if (arg == "--d") {
            take_int32(argc, argv, i, arg, options.end_d, options);
        } else if (arg == "-l" || arg == "--len") {
            int64_t length = 0;
            if (take_integer(argc, argv, i, arg, length, options)) {
                if (length < 0) {
                    std::cerr << "Error: length must not be negative\n";
                    options.show_help = true;
                } else {
                    options.length_bytes = length;
                }
            }
        } else {
            std::cerr << "Error: unknown option '" << arg << "'\n";
            options.show_help = true;
        }
    }

    if (!options.show_help && !options.show_version) {
        if (options.command.empty()) {
            std::cerr << "Error: a command (encode or decode) is required\n";
            options.show_help = true;
        } else if (options.command == "encode" && !options.input_filename) {
            std::cerr << "Error: encode requires --input\n";
            options.show_help = true;
        } else if (options.command == "decode") {
            bool explicit_fields = options.start_mask || options.end_mask || options.prev_mask || options.end_d;
            if (!options.output_filename) {
                std::cerr << "Error: decode requires --output\n";
                options.show_help = true;
            } else if (options.coordinate && explicit_fields) {
                std::cerr << "Error: use either --coord or explicit coordinate fields, not both\n";
                options.show_help = true;
            } else if (!options.coordinate &&
                       !(options.start_mask && options.end_mask && options.prev_mask &&
                         options.end_d && options.length_bytes)) {
                std::cerr << "Error: decode requires --coord or all of --start, --end, --prev, --d, --len\n";
                options.show_help = true;
            }
        }
    }

    return options;
}

} // namespace odins_eye
