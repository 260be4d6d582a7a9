/*
 * File:        coordinate_io.cpp
 * Module:      odins-eye
 * Purpose:     Coordinate file reader/writer implementation using yaml-cpp
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "coordinate_io.h"
#include "logging.h"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <limits>

namespace odins_eye {

static bool read_field(const YAML::Node& root, const char* key, int64_t& value, std::string& error_message) {
    YAML::Node node = root[key];
    if (!node) {
        error_message = std::string("Coordinate is missing field '") + key + "'";
        return false;
    }
    if (!node.IsScalar()) {
        error_message = std::string("Coordinate field '") + key + "' must be an integer";
        return false;
    }
    value = node.as<int64_t>();
    return true;
}

static bool read_int32_field(const YAML::Node& root, const char* key, int32_t& value, std::string& error_message) {
    int64_t wide = 0;
    if (!read_field(root, key, wide, error_message)) return false;

    if (wide < std::numeric_limits<int32_t>::min() || wide > std::numeric_limits<int32_t>::max()) {
        error_message = std::string("Coordinate field '") + key + "' is out of range: " + std::to_string(wide);
        return false;
    }
    value = static_cast<int32_t>(wide);
    return true;
}

static bool coordinate_from_node(const YAML::Node& root, Coordinate& coordinate, std::string& error_message) {
    if (!root.IsMap()) {
        error_message = "Coordinate must be a mapping of five integer fields";
        return false;
    }

    Coordinate result;
    if (!read_int32_field(root, "start_mask", result.start_mask, error_message)) return false;
    if (!read_int32_field(root, "end_mask", result.end_mask, error_message)) return false;
    if (!read_int32_field(root, "prev_mask", result.prev_mask, error_message)) return false;
    if (!read_int32_field(root, "end_d", result.end_d, error_message)) return false;
    if (!read_field(root, "length_bytes", result.length_bytes, error_message)) return false;

    coordinate = result;
    return true;
}

std::string format_coordinate(const Coordinate& coordinate) {
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);

    out << YAML::BeginMap;
    out << YAML::Key << YAML::DoubleQuoted << "start_mask" << YAML::Value << coordinate.start_mask;
    out << YAML::Key << YAML::DoubleQuoted << "end_mask" << YAML::Value << coordinate.end_mask;
    out << YAML::Key << YAML::DoubleQuoted << "prev_mask" << YAML::Value << coordinate.prev_mask;
    out << YAML::Key << YAML::DoubleQuoted << "end_d" << YAML::Value << coordinate.end_d;
    out << YAML::Key << YAML::DoubleQuoted << "length_bytes" << YAML::Value << coordinate.length_bytes;
    out << YAML::EndMap;

    return out.c_str();
}

bool parse_coordinate(const std::string& text, Coordinate& coordinate, std::string& error_message) {
    try {
        YAML::Node root = YAML::Load(text);
        return coordinate_from_node(root, coordinate, error_message);
    } catch (const YAML::Exception& e) {
        error_message = std::string("Coordinate parsing error: ") + e.what();
        return false;
    }
}

bool read_coordinate_file(const std::string& filename, Coordinate& coordinate, std::string& error_message) {
    try {
        YAML::Node root = YAML::LoadFile(filename);
        if (!coordinate_from_node(root, coordinate, error_message)) {
            error_message = filename + ": " + error_message;
            return false;
        }
        ODINS_EYE_LOG_DEBUG("Read coordinate from {}", filename);
        return true;
    } catch (const YAML::BadFile&) {
        error_message = "Could not open coordinate file: " + filename;
        return false;
    } catch (const YAML::Exception& e) {
        error_message = filename + ": coordinate parsing error: " + e.what();
        return false;
    }
}

bool write_coordinate_file(const std::string& filename, const Coordinate& coordinate,
                           std::string& error_message) {
    std::ofstream file(filename);
    if (!file) {
        error_message = "Could not open coordinate file for writing: " + filename;
        return false;
    }

    file << format_coordinate(coordinate) << "\n";
    file.close();

    if (!file) {
        error_message = "Failed to write coordinate file: " + filename;
        return false;
    }

    ODINS_EYE_LOG_DEBUG("Wrote coordinate to {}", filename);
    return true;
}

bool load_coordinate(const std::string& path_or_text, Coordinate& coordinate, std::string& error_message) {
    size_t first = path_or_text.find_first_not_of(" \t\r\n");
    if (first != std::string::npos && path_or_text[first] == '{') {
        return parse_coordinate(path_or_text, coordinate, error_message);
    }
    return read_coordinate_file(path_or_text, coordinate, error_message);
}

} // namespace odins_eye
