/*
 * File:        coordinate_io.h
 * Module:      odins-eye
 * Purpose:     Coordinate file reader/writer (JSON-compatible YAML)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#ifndef ODINS_EYE_COORDINATE_IO_H
#define ODINS_EYE_COORDINATE_IO_H

#include "coordinate.h"
#include <string>

namespace odins_eye {

/**
 * @brief Format a coordinate as a single-line flow mapping
 *
 * Keys are double-quoted so the text is valid JSON as well as YAML, e.g.
 * {"start_mask": 50000, "end_mask": 50010, "prev_mask": 50010, "end_d": 0, "length_bytes": 1}
 */
std::string format_coordinate(const Coordinate& coordinate);

/**
 * @brief Parse a coordinate from JSON or YAML text
 *
 * @param text Document holding a mapping with the five coordinate fields
 * @param coordinate Output coordinate
 * @param error_message Error description on failure
 * @return true on success, false on error
 */
bool parse_coordinate(const std::string& text, Coordinate& coordinate, std::string& error_message);

/**
 * @brief Read a coordinate file
 */
bool read_coordinate_file(const std::string& filename, Coordinate& coordinate, std::string& error_message);

/**
 * @brief Write a coordinate file
 */
bool write_coordinate_file(const std::string& filename, const Coordinate& coordinate,
                           std::string& error_message);

/**
 * @brief Load a coordinate from a file path or from inline text
 *
 * Arguments starting with '{' are parsed as inline JSON/YAML, anything else
 * is treated as a path.
 */
bool load_coordinate(const std::string& path_or_text, Coordinate& coordinate, std::string& error_message);

} // namespace odins_eye

#endif // ODINS_EYE_COORDINATE_IO_H
