/*
 * File:        coordinate.h
 * Module:      odins-eye
 * Purpose:     Coordinate record, position range and codec error kinds
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#ifndef ODINS_EYE_COORDINATE_H
#define ODINS_EYE_COORDINATE_H

#include <cstdint>

namespace odins_eye {

// Oscillator position range (inclusive, always five decimal digits)
constexpr int32_t POSITION_LOW = 10000;
constexpr int32_t POSITION_HIGH = 99999;
constexpr int32_t POSITION_SPAN = POSITION_HIGH - POSITION_LOW;

// Per-step choice range
constexpr int32_t CHOICE_MIN = 0;
constexpr int32_t CHOICE_MAX = 63;
constexpr int32_t CHOICE_BITS = 6;

constexpr int32_t DEFAULT_START_MASK = 50000;

// end_d value of a zero-length coordinate
constexpr int32_t NO_CHOICE = -1;

/**
 * @brief Result of one encode pass
 *
 * start_mask, end_mask and prev_mask are positions in [POSITION_LOW, POSITION_HIGH].
 * (prev_mask, end_d) is the anchor of the final step: the position before
 * the last step and the choice applied on it.
 */
struct Coordinate {
    int32_t start_mask = DEFAULT_START_MASK;
    int32_t end_mask = DEFAULT_START_MASK;
    int32_t prev_mask = DEFAULT_START_MASK;
    int32_t end_d = NO_CHOICE;
    int64_t length_bytes = 0;

    bool operator==(const Coordinate& other) const {
        return start_mask == other.start_mask &&
               end_mask == other.end_mask &&
               prev_mask == other.prev_mask &&
               end_d == other.end_d &&
               length_bytes == other.length_bytes;
    }

    bool operator!=(const Coordinate& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Failure kinds reported by the codec
 */
enum class CodecError {
    None,
    OutOfRangeStartPosition,    ///< start_mask outside the position range
    InvalidChoice,              ///< choice outside [0, 63]
    AmbiguousReconstruction,    ///< zero or several consistent backward walks
    LengthMismatch              ///< negative or inconsistent length
};

/**
 * @brief Get a printable name for an error kind
 */
const char* codec_error_name(CodecError error);

inline bool is_position_in_range(int64_t position) {
    return position >= POSITION_LOW && position <= POSITION_HIGH;
}

inline bool is_choice_in_range(int64_t choice) {
    return choice >= CHOICE_MIN && choice <= CHOICE_MAX;
}

} // namespace odins_eye

#endif // ODINS_EYE_COORDINATE_H
