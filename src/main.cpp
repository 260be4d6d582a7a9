/*
 * File:        main.cpp
 * Module:      odins-eye
 * Purpose:     Main application entry point
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "cli_parser.h"
#include "coordinate_io.h"
#include "logging.h"
#include "odins_eye_codec.h"
#include "yaml_config.h"
#include <iostream>
#include <fstream>
#include <vector>

using namespace odins_eye;

static int run_encode(const CLIOptions& options, const OdinsEyeConfig& config) {
    int32_t start_mask = options.start_mask ? options.start_mask.value() : config.codec.start_mask;
    const std::string& input_filename = options.input_filename.value();

    std::ifstream input(input_filename, std::ios::binary);
    if (!input) {
        std::cerr << "Error: Could not open input file: " << input_filename << "\n";
        return 1;
    }

    ODINS_EYE_LOG_INFO("Encoding {} from start mask {}", input_filename, start_mask);

    OdinsEyeCodec codec(start_mask);
    Coordinate coordinate;
    if (!codec.encode_stream(input, coordinate)) {
        std::cerr << "Error: " << codec.get_error() << "\n";
        return 1;
    }

    std::cout << format_coordinate(coordinate) << "\n";

    if (options.verbose) {
        const EncodeStats& stats = codec.last_encode_stats();
        std::cerr << "Steps: " << stats.steps
                  << ", bounces off high: " << stats.bounces_high
                  << ", bounces off low: " << stats.bounces_low << "\n";
    }

    if (options.output_filename) {
        std::string error_msg;
        if (!write_coordinate_file(options.output_filename.value(), coordinate, error_msg)) {
            std::cerr << "Error: " << error_msg << "\n";
            return 1;
        }
        ODINS_EYE_LOG_INFO("Coordinate written to {}", options.output_filename.value());
    }

    return 0;
}

static int run_decode(const CLIOptions& options) {
    Coordinate coordinate;

    if (options.coordinate) {
        std::string error_msg;
        if (!load_coordinate(options.coordinate.value(), coordinate, error_msg)) {
            std::cerr << "Error: " << error_msg << "\n";
            return 1;
        }
    } else {
        coordinate.start_mask = options.start_mask.value();
        coordinate.end_mask = options.end_mask.value();
        coordinate.prev_mask = options.prev_mask.value();
        coordinate.end_d = options.end_d.value();
        coordinate.length_bytes = options.length_bytes.value();
    }

    int64_t length_bytes = options.length_bytes ? options.length_bytes.value() : coordinate.length_bytes;

    ODINS_EYE_LOG_INFO("Recovering {} bytes from coordinate {}", length_bytes, format_coordinate(coordinate));

    OdinsEyeCodec codec(coordinate.start_mask);
    std::vector<uint8_t> recovered;
    if (!codec.decode(coordinate, length_bytes, recovered)) {
        std::cerr << "Error: " << codec_error_name(codec.get_error_kind()) << ": " << codec.get_error() << "\n";
        return 1;
    }

    const std::string& output_filename = options.output_filename.value();
    std::ofstream output(output_filename, std::ios::binary);
    if (!output) {
        std::cerr << "Error: Could not open output file: " << output_filename << "\n";
        return 1;
    }

    output.write(reinterpret_cast<const char*>(recovered.data()), static_cast<std::streamsize>(recovered.size()));
    output.close();
    if (!output) {
        std::cerr << "Error: Failed to write output file: " << output_filename << "\n";
        return 1;
    }

    std::cout << "Recovered " << recovered.size() << " bytes to " << output_filename << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    CLIOptions options = parse_arguments(argc, argv);

    if (options.show_version) {
        print_version();
        return 0;
    }

    if (options.show_help) {
        print_usage(argv[0]);
        return argc > 1 ? 1 : 0;
    }

    OdinsEyeConfig config;
    std::string error_msg;

    if (options.config_filename) {
        if (!parse_yaml_config(options.config_filename.value(), config, error_msg)) {
            std::cerr << "Error parsing YAML config: " << error_msg << "\n";
            return 1;
        }
    }

    // Command line overrides the settings file
    if (options.verbose) {
        config.logging.level = "debug";
    }
    if (options.log_file) {
        config.logging.file = options.log_file.value();
    }
    if (options.start_mask) {
        config.codec.start_mask = options.start_mask.value();
    }

    if (!validate_yaml_config(config, error_msg)) {
        std::cerr << "Error validating config: " << error_msg << "\n";
        return 1;
    }

    try {
        init_logging(config.logging.level, "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v", config.logging.file);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Error: Could not initialise logging: " << e.what() << "\n";
        return 1;
    }

    if (options.command == "encode") {
        return run_encode(options, config);
    }
    return run_decode(options);
}
