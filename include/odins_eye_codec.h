/*
 * File:        odins_eye_codec.h
 * Module:      odins-eye
 * Purpose:     Coordinate codec: forward oscillator walk and exact backward walk
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#ifndef ODINS_EYE_CODEC_H
#define ODINS_EYE_CODEC_H

#include "coordinate.h"
#include "oscillator.h"
#include <cstdint>
#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace odins_eye {

/**
 * @brief Counters collected during the last encode
 */
struct EncodeStats {
    uint64_t steps = 0;
    uint64_t bounces_high = 0;
    uint64_t bounces_low = 0;
};

/**
 * @brief Odin's Eye coordinate codec
 *
 * Encoding drives the oscillator forward from the start mask, one step per
 * sextet of input, keeping only the current state and the anchor of the
 * last step. Decoding walks the oscillator backward from the anchor and
 * accepts the result only when exactly one walk of the right length leads
 * back to (start_mask, +1); any other outcome is reported as an error and
 * nothing is guessed.
 *
 * Instances hold only the start mask and the last error; independent
 * instances can be used from different threads.
 */
class OdinsEyeCodec {
public:
    /**
     * @brief Construct a codec
     * @param start_mask Start position for encode (checked when encoding)
     */
    explicit OdinsEyeCodec(int32_t start_mask = DEFAULT_START_MASK);

    int32_t start_mask() const { return start_mask_; }

    /**
     * @brief Encode a byte buffer
     * @param data Input bytes (may be empty)
     * @param coordinate Output coordinate
     * @return true on success, false on error
     */
    bool encode(const std::vector<uint8_t>& data, Coordinate& coordinate);

    /**
     * @brief Encode a raw byte range
     */
    bool encode(const uint8_t* data, size_t size, Coordinate& coordinate);

    /**
     * @brief Encode everything readable from a stream
     *
     * The stream is consumed in fixed-size blocks; memory use does not grow
     * with the input size.
     */
    bool encode_stream(std::istream& input, Coordinate& coordinate);

    /**
     * @brief Reconstruct the bytes located by a coordinate
     *
     * @param coordinate Coordinate produced by encode
     * @param length_bytes Expected byte count (must match the coordinate)
     * @param output Recovered bytes; left empty on failure
     * @return true on success, false on error (see get_error_kind())
     */
    bool decode(const Coordinate& coordinate, int64_t length_bytes, std::vector<uint8_t>& output);

    /**
     * @brief Decode using the coordinate's own length
     */
    bool decode(const Coordinate& coordinate, std::vector<uint8_t>& output);

    const EncodeStats& last_encode_stats() const { return stats_; }

    /**
     * @brief Get error kind from last operation
     */
    CodecError get_error_kind() const { return error_kind_; }

    /**
     * @brief Get error message from last operation
     */
    const std::string& get_error() const { return error_message_; }

private:
    class ForwardWalk;

    bool begin_encode();
    bool finish_encode(ForwardWalk& walk, Coordinate& coordinate);
    bool fail(CodecError kind, const std::string& message);
    void clear_error();

    /**
     * @brief Walk backward from the anchor state to the start state
     *
     * Each backward step must have exactly one (choice, hypothesis) pair whose
     * predecessor can still be reached from the start in the steps left.
     *
     * @param start_mask Start position of the walk
     * @param anchor State before the last step
     * @param steps Number of steps to undo
     * @param choices Output: recovered choices, last step first
     * @return false (with the error set) if the walk is not uniquely determined
     */
    bool walk_backward(int32_t start_mask,
                       const OscillatorState& anchor,
                       uint64_t steps,
                       std::vector<int32_t>& choices);

    int32_t start_mask_;
    EncodeStats stats_;
    CodecError error_kind_ = CodecError::None;
    std::string error_message_;
};

} // namespace odins_eye

#endif // ODINS_EYE_CODEC_H
